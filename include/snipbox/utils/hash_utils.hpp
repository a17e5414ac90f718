/**
 * @file hash_utils.hpp
 * @brief Content fingerprints for log correlation
 *
 * Snippets are never written to the log verbatim; the supervisor logs a
 * SHA-256 fingerprint instead so that repeated submissions of the same code
 * can be correlated without leaking the code itself.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace snipbox {
namespace utils {

/**
 * @class HashUtils
 * @brief SHA-256 helpers backed by OpenSSL
 *
 * **Usage**:
 * @code
 * spdlog::info("Snippet {} accepted", HashUtils::Fingerprint(request.code));
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a byte string
     * @param data Input bytes
     * @return Lowercase hexadecimal digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Short fingerprint suitable for log lines
     * @param data Input bytes
     * @param length Number of hex characters to keep (default: 12)
     * @return Prefix of the SHA-256 hex digest
     */
    static std::string Fingerprint(const std::string& data, std::size_t length = 12);

private:
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace snipbox
