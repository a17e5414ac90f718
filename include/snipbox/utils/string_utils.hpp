/**
 * @file string_utils.hpp
 * @brief String helpers shared by the supervisor, the worker and the CLI
 *
 * Snippet output crosses the worker boundary as UTF-8 and is bounded in
 * characters (code points), not bytes, so the helpers here count and cut
 * on code point boundaries.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace snipbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::string captured = ...;
 * if (StringUtils::Utf8Length(captured) > 10000) {
 *     captured = StringUtils::Utf8Truncate(captured, 10000);
 * }
 *
 * // "timeout after 1.5s"
 * std::string msg = "timeout after " +
 *     StringUtils::FormatSeconds(std::chrono::milliseconds(1500));
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Check whether a string starts with a prefix
     */
    static bool StartsWith(std::string_view str, std::string_view prefix);

    /**
     * @brief Truncate a string to a byte length, appending a suffix
     *
     * Used for log lines only; snippet output goes through Utf8Truncate.
     *
     * @param str Input string
     * @param max_length Maximum length of the returned string
     * @param suffix Marker appended when the string was cut (default: "...")
     * @return Possibly truncated string
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /***************************************************************************
     * UTF-8
     ***************************************************************************/

    /**
     * @brief Count code points in a UTF-8 string
     *
     * Continuation bytes (10xxxxxx) are not counted, so malformed input
     * still yields a bounded, monotonic count.
     *
     * @param str UTF-8 encoded text
     * @return Number of code points
     */
    static std::size_t Utf8Length(std::string_view str);

    /**
     * @brief Byte offset just past the first @p max_chars code points
     * @param str UTF-8 encoded text
     * @param max_chars Code point budget
     * @return Offset in bytes (str.size() when the text fits)
     */
    static std::size_t Utf8Offset(std::string_view str, std::size_t max_chars);

    /**
     * @brief Keep at most @p max_chars code points of a UTF-8 string
     *
     * Never splits a multi-byte sequence.
     *
     * @param str UTF-8 encoded text
     * @param max_chars Code point budget
     * @return Prefix of @p str
     */
    static std::string Utf8Truncate(std::string_view str, std::size_t max_chars);

    /***************************************************************************
     * Formatting
     ***************************************************************************/

    /**
     * @brief Format a duration as seconds with a trailing "s"
     *
     * Whole seconds print without a fractional part ("1s", "8s"), other
     * values print their shortest form ("0.5s", "1.25s").
     *
     * @param duration Duration to format
     * @return Formatted string
     */
    static std::string FormatSeconds(std::chrono::milliseconds duration);
};

} // namespace utils
} // namespace snipbox
