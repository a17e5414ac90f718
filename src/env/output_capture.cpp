/**
 * @file output_capture.cpp
 * @brief Implementation of the bounded print buffer
 *
 * @date 2025
 */

#include "snipbox/env/output_capture.hpp"
#include "snipbox/utils/string_utils.hpp"

namespace snipbox {
namespace env {

using utils::StringUtils;

OutputCapture::OutputCapture(std::size_t max_chars)
    : max_chars_(max_chars) {
}

void OutputCapture::Write(std::string_view text) {
    if (text.empty() || truncated_) {
        return;
    }

    const std::size_t remaining = max_chars_ - char_count_;
    const std::size_t offset = StringUtils::Utf8Offset(text, remaining);

    text_.append(text.data(), offset);
    char_count_ += StringUtils::Utf8Length(text.substr(0, offset));

    if (offset < text.size()) {
        truncated_ = true;
    }
}

} // namespace env
} // namespace snipbox
