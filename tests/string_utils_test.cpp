#include <gtest/gtest.h>

#include "snipbox/utils/string_utils.hpp"

using snipbox::utils::StringUtils;

TEST(StringUtils, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ("abc", StringUtils::Trim("  abc\t\n"));
    EXPECT_EQ("a b", StringUtils::Trim("a b"));
    EXPECT_EQ("", StringUtils::Trim(" \n\t "));
    EXPECT_EQ("", StringUtils::Trim(""));
}

TEST(StringUtils, StartsWith) {
    EXPECT_TRUE(StringUtils::StartsWith("timeout after 1s", "timeout"));
    EXPECT_TRUE(StringUtils::StartsWith("abc", ""));
    EXPECT_FALSE(StringUtils::StartsWith("ab", "abc"));
}

TEST(StringUtils, TruncateAppendsSuffix) {
    EXPECT_EQ("hello", StringUtils::Truncate("hello", 5));
    EXPECT_EQ("he...", StringUtils::Truncate("hello world", 5));
    EXPECT_EQ("..", StringUtils::Truncate("hello world", 2));
}

TEST(StringUtils, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(0u, StringUtils::Utf8Length(""));
    EXPECT_EQ(5u, StringUtils::Utf8Length("hello"));
    EXPECT_EQ(5u, StringUtils::Utf8Length("h\xC3\xA9llo"));  // é is two bytes
    EXPECT_EQ(1u, StringUtils::Utf8Length("\xF0\x9F\x90\x8D"));  // 🐍
}

TEST(StringUtils, Utf8TruncateNeverSplitsSequences) {
    const std::string text = "a\xC3\xA9" "b\xF0\x9F\x90\x8D" "c";  // aébXc

    EXPECT_EQ("a", StringUtils::Utf8Truncate(text, 1));
    EXPECT_EQ("a\xC3\xA9", StringUtils::Utf8Truncate(text, 2));
    EXPECT_EQ("a\xC3\xA9" "b\xF0\x9F\x90\x8D", StringUtils::Utf8Truncate(text, 4));
    EXPECT_EQ(text, StringUtils::Utf8Truncate(text, 5));
    EXPECT_EQ(text, StringUtils::Utf8Truncate(text, 100));
    EXPECT_EQ("", StringUtils::Utf8Truncate(text, 0));
}

TEST(StringUtils, Utf8OffsetIsByteOffset) {
    const std::string text = "\xC3\xA9\xC3\xA9";
    EXPECT_EQ(0u, StringUtils::Utf8Offset(text, 0));
    EXPECT_EQ(2u, StringUtils::Utf8Offset(text, 1));
    EXPECT_EQ(4u, StringUtils::Utf8Offset(text, 2));
    EXPECT_EQ(4u, StringUtils::Utf8Offset(text, 3));
}

TEST(StringUtils, FormatSeconds) {
    EXPECT_EQ("1s", StringUtils::FormatSeconds(std::chrono::milliseconds(1000)));
    EXPECT_EQ("8s", StringUtils::FormatSeconds(std::chrono::milliseconds(8000)));
    EXPECT_EQ("0.5s", StringUtils::FormatSeconds(std::chrono::milliseconds(500)));
    EXPECT_EQ("1.25s", StringUtils::FormatSeconds(std::chrono::milliseconds(1250)));
    EXPECT_EQ("0s", StringUtils::FormatSeconds(std::chrono::milliseconds(0)));
    EXPECT_EQ("0.001s", StringUtils::FormatSeconds(std::chrono::milliseconds(1)));
    EXPECT_EQ("0.05s", StringUtils::FormatSeconds(std::chrono::milliseconds(50)));
}

TEST(StringUtils, FormatSecondsKeepsEveryDigit) {
    EXPECT_EQ("1234.567s", StringUtils::FormatSeconds(std::chrono::milliseconds(1234567)));
    EXPECT_EQ("86400s", StringUtils::FormatSeconds(std::chrono::hours(24)));
    EXPECT_EQ("1000000s", StringUtils::FormatSeconds(std::chrono::seconds(1000000)));
}
