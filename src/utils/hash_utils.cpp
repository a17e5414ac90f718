/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 fingerprints
 *
 * **Error Handling**:
 * - OpenSSL failure: Throws std::runtime_error
 *
 * @date 2025
 */

#include "snipbox/utils/hash_utils.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace snipbox {
namespace utils {

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash) == nullptr) {
        throw std::runtime_error("SHA256 computation failed");
    }
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::Fingerprint(const std::string& data, std::size_t length) {
    return ComputeSHA256(data).substr(0, length);
}

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace snipbox
