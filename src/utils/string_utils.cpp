/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * **UTF-8 Handling**:
 * - Lead bytes (0xxxxxxx, 11xxxxxx) start a code point
 * - Continuation bytes (10xxxxxx) never do
 * - Truncation always cuts before a lead byte
 *
 * @date 2025
 */

#include "snipbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace snipbox {
namespace utils {

namespace {

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool StringUtils::StartsWith(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// Truncate string
std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return suffix.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

// ============================================================================
// UTF-8
// ============================================================================

std::size_t StringUtils::Utf8Length(std::string_view str) {
    return static_cast<std::size_t>(
        std::count_if(str.begin(), str.end(), [](char c) { return !IsContinuationByte(c); }));
}

std::size_t StringUtils::Utf8Offset(std::string_view str, std::size_t max_chars) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (IsContinuationByte(str[i])) {
            continue;
        }
        if (seen == max_chars) {
            return i;
        }
        ++seen;
    }
    return str.size();
}

std::string StringUtils::Utf8Truncate(std::string_view str, std::size_t max_chars) {
    return std::string(str.substr(0, Utf8Offset(str, max_chars)));
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string StringUtils::FormatSeconds(std::chrono::milliseconds duration) {
    const long long total_ms = duration.count();
    const long long whole = total_ms / 1000;
    long long fraction = total_ms % 1000;

    std::ostringstream oss;
    if (total_ms < 0 && whole == 0) {
        oss << '-';
    }
    oss << whole;
    if (fraction != 0) {
        fraction = fraction < 0 ? -fraction : fraction;
        std::string digits = std::to_string(1000 + fraction).substr(1);
        digits.erase(digits.find_last_not_of('0') + 1);
        oss << '.' << digits;
    }
    oss << 's';
    return oss.str();
}

} // namespace utils
} // namespace snipbox
