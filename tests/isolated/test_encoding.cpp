/*
 * test_encoding.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "isolated/encoding.hpp"

using namespace sandrun::isolated;

TEST(EncodingTest, AsciiAndMultibyteAreValid) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("hello world\n"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9"));
    EXPECT_TRUE(isValidUtf8("\xE2\x82\xAC"));
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80"));
}

TEST(EncodingTest, RejectsMalformedSequences) {
    EXPECT_FALSE(isValidUtf8("\xFF"));
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));          // overlong
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));  // above U+10FFFF
    EXPECT_FALSE(isValidUtf8("\xE2\x82"));          // truncated
}

TEST(EncodingTest, SanitizeKeepsValidInputUnchanged) {
    std::string text = "na\xC3\xAFve \xE2\x9C\x93\n";
    EXPECT_EQ(sanitizeUtf8(text), text);
}

TEST(EncodingTest, SanitizeReplacesEachBadByte) {
    EXPECT_EQ(sanitizeUtf8("a\xFF\xFE" "b"), "a\xEF\xBF\xBD\xEF\xBF\xBD" "b");
}

TEST(EncodingTest, SanitizeTruncatedTail) {
    auto result = sanitizeUtf8("ok\xE2\x82");
    EXPECT_TRUE(result.starts_with("ok"));
    EXPECT_TRUE(isValidUtf8(result));
    EXPECT_NE(result.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST(EncodingTest, SanitizedOutputIsAlwaysValid) {
    std::string bytes;
    for (int i = 0; i < 256; ++i) {
        bytes.push_back(static_cast<char>(i));
    }
    EXPECT_TRUE(isValidUtf8(sanitizeUtf8(bytes)));
}
