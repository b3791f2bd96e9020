#include <gtest/gtest.h>
#include "core/encoding/TextCodec.hpp"

using core::encoding::TextCodec;

TEST(TextCodecTest, AsciiIsUnchanged) {
    EXPECT_EQ(TextCodec::utf8ToGbk("Hello, printer!\n"), "Hello, printer!\n");
}

TEST(TextCodecTest, ChineseIsConvertedToGbk) {
    // U+4F60 U+597D
    EXPECT_EQ(TextCodec::utf8ToGbk("\xE4\xBD\xA0\xE5\xA5\xBD"), "\xC4\xE3\xBA\xC3");
}

TEST(TextCodecTest, UnrepresentableCharactersAreDropped) {
    // U+1F600 has no GBK mapping
    EXPECT_EQ(TextCodec::utf8ToGbk("a\xF0\x9F\x98\x80" "b"), "ab");
    EXPECT_EQ(TextCodec::utf8ToGbk("\xF0\x9F\x98\x80"), "");
}

TEST(TextCodecTest, CountsCodePoints) {
    EXPECT_EQ(TextCodec::codePointCount(""), 0u);
    EXPECT_EQ(TextCodec::codePointCount("abc"), 3u);
    EXPECT_EQ(TextCodec::codePointCount("\xE4\xBD\xA0\xE5\xA5\xBD"), 2u);
    EXPECT_EQ(TextCodec::codePointCount("a\xF0\x9F\x98\x80"), 2u);
}
