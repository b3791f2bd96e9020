#include <gtest/gtest.h>
#include "core/utils/Base64.hpp"

using core::utils::base64Decode;
using core::utils::base64Encode;

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64Encode(std::string("")), "");
    EXPECT_EQ(base64Encode(std::string("f")), "Zg==");
    EXPECT_EQ(base64Encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(std::string("Hello")), "SGVsbG8=");
}

TEST(Base64Test, DecodesPaddedAndUnpadded) {
    auto padded = base64Decode("SGVsbG8=");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(std::string(padded->begin(), padded->end()), "Hello");

    auto unpadded = base64Decode("SGVsbG8");
    ASSERT_TRUE(unpadded.has_value());
    EXPECT_EQ(std::string(unpadded->begin(), unpadded->end()), "Hello");
}

TEST(Base64Test, DecodeSkipsWhitespaceAndAcceptsUrlSafeAlphabet) {
    auto wrapped = base64Decode("SGVs\nbG8=\r\n");
    ASSERT_TRUE(wrapped.has_value());
    EXPECT_EQ(std::string(wrapped->begin(), wrapped->end()), "Hello");

    auto urlSafe = base64Decode("-_8");
    ASSERT_TRUE(urlSafe.has_value());
    ASSERT_EQ(urlSafe->size(), 2u);
    EXPECT_EQ((*urlSafe)[0], 0xFB);
    EXPECT_EQ((*urlSafe)[1], 0xFF);
}

TEST(Base64Test, DecodeRejectsInvalidInput) {
    EXPECT_FALSE(base64Decode("SGVs*G8=").has_value());
    EXPECT_FALSE(base64Decode("SGVsb").has_value());
    EXPECT_FALSE(base64Decode("SG==VsbG8").has_value());
}

TEST(Base64Test, BinaryBytesSurviveEncodeAndDecode) {
    std::vector<uint8_t> bytes;
    for (int i = 0; i < 256; ++i) {
        bytes.push_back(static_cast<uint8_t>(i));
    }

    std::string encoded = base64Encode(bytes);
    EXPECT_EQ(encoded.size(), 344u);
    EXPECT_EQ(encoded.substr(encoded.size() - 4), "/w==");

    auto decoded = base64Decode(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}
