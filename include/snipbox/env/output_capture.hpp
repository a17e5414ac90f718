/**
 * @file output_capture.hpp
 * @brief Bounded buffer behind the snippet's print()
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace snipbox {
namespace env {

/**
 * @class OutputCapture
 * @brief Accumulates printed text up to a code point budget
 *
 * Once the budget is reached further writes are dropped, so the buffer
 * never holds more than @p max_chars code points regardless of how much
 * the snippet prints.
 */
class OutputCapture {
public:
    explicit OutputCapture(std::size_t max_chars);

    /**
     * @brief Append UTF-8 text, keeping only what fits
     */
    void Write(std::string_view text);

    const std::string& GetText() const { return text_; }
    std::size_t GetCharCount() const { return char_count_; }
    bool IsTruncated() const { return truncated_; }

private:
    std::size_t max_chars_;
    std::size_t char_count_{0};
    bool truncated_{false};
    std::string text_;
};

} // namespace env
} // namespace snipbox
