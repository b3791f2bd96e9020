#include <gtest/gtest.h>
#include "core/encoding/ContentEncoder.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Base64.hpp"
#include "support/FakeHttpTransport.hpp"
#include "support/TestImages.hpp"

using namespace core::types;
using core::encoding::ContentEncoder;

namespace {
    std::vector<uint8_t> decodeBase64(const std::string &data) {
        auto decoded = core::utils::base64Decode(data);
        if (!decoded) throw std::runtime_error("payload is not base64");
        return *decoded;
    }

    std::vector<std::string> splitBytes(const std::vector<uint8_t> &bytes, size_t pieceSize) {
        std::vector<std::string> pieces;
        for (size_t offset = 0; offset < bytes.size(); offset += pieceSize) {
            size_t length = std::min(pieceSize, bytes.size() - offset);
            pieces.emplace_back(reinterpret_cast<const char *>(bytes.data() + offset), length);
        }
        return pieces;
    }

    test::ScriptedResponse imageResponse(const std::vector<uint8_t> &bytes, const std::string &contentType) {
        test::ScriptedResponse response;
        response.headers["content-type"] = contentType;
        response.chunks = splitBytes(bytes, 1024);
        return response;
    }
}

class ContentEncoderTest : public ::testing::Test {
protected:
    std::shared_ptr<test::FakeHttpTransport> transport = std::make_shared<test::FakeHttpTransport>();
    core::config::EncoderConfig config;

    ContentEncoder makeEncoder() const {
        return ContentEncoder(transport, config);
    }
};

TEST_F(ContentEncoderTest, EncodesTextAsBase64Gbk) {
    EncodedPayload payload = makeEncoder().encode(TextContent{"Hello"});
    EXPECT_EQ(payload.kind, ContentKind::Text);
    EXPECT_EQ(payload.data, "SGVsbG8=");
    EXPECT_EQ(ContentEncoder::toWirePart(payload), "T:SGVsbG8=");

    EncodedPayload chinese = makeEncoder().encode(TextContent{"\xE4\xBD\xA0\xE5\xA5\xBD"});
    EXPECT_EQ(chinese.data, core::utils::base64Encode(std::string("\xC4\xE3\xBA\xC3")));
}

TEST_F(ContentEncoderTest, RejectsEmptyText) {
    EXPECT_THROW(makeEncoder().encode(TextContent{""}), InvalidContentException);
    EXPECT_THROW(makeEncoder().encode(TextContent{"\xF0\x9F\x98\x80"}), InvalidContentException);
}

TEST_F(ContentEncoderTest, ResizesWideImageToConfiguredWidth) {
    config.maxImageWidth = 576;
    auto png = test::makeSolidPng(3000, 1500, {40, 40, 40, 255});

    EncodedPayload payload = makeEncoder().encode(ImageContent{png, 3000, 1500});
    ASSERT_EQ(payload.kind, ContentKind::Image);
    EXPECT_EQ(ContentEncoder::toWirePart(payload).substr(0, 2), "P:");

    std::vector<uint8_t> bmp = decodeBase64(payload.data);
    EXPECT_EQ(test::bmpWidth(bmp), 576);
    EXPECT_EQ(test::bmpHeight(bmp), 288);
}

TEST_F(ContentEncoderTest, DeclaredSizeIsAdvisory) {
    auto png = test::makeSolidPng(20, 10, {255, 255, 255, 255});
    EncodedPayload payload = makeEncoder().encode(ImageContent{png, 999, 999});
    std::vector<uint8_t> bmp = decodeBase64(payload.data);
    EXPECT_EQ(test::bmpWidth(bmp), 20);
    EXPECT_EQ(test::bmpHeight(bmp), 10);
}

TEST_F(ContentEncoderTest, InvalidImageBytesFail) {
    ImageContent garbage{{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'}, 0, 0};
    EXPECT_THROW(makeEncoder().encode(garbage), InvalidImageException);
}

TEST_F(ContentEncoderTest, EncodingIsDeterministic) {
    auto png = test::makePng(800, 200, [](int x, int y) {
        auto level = static_cast<uint8_t>((x ^ y) & 0xFF);
        return test::Rgba{level, static_cast<uint8_t>(255 - level), level, 255};
    });
    ContentEncoder encoder = makeEncoder();
    EXPECT_EQ(encoder.encode(ImageContent{png, 0, 0}).data, encoder.encode(ImageContent{png, 0, 0}).data);
}

TEST_F(ContentEncoderTest, FetchesRemoteImageThroughStream) {
    auto png = test::makeSolidPng(1000, 100, {0, 0, 0, 255});
    transport->on("/cat.png", imageResponse(png, "image/png"));

    EncodedPayload payload = makeEncoder().encode(RemoteImageContent{"http://images.test/cat.png"});
    ASSERT_EQ(payload.kind, ContentKind::Image);
    EXPECT_EQ(test::bmpWidth(decodeBase64(payload.data)), 384);

    EXPECT_EQ(transport->openedStreams(), 1);
    EXPECT_EQ(transport->closedStreams(), 1);
    auto requests = transport->requestsTo("/cat.png");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, core::http::HttpMethod::Get);
}

TEST_F(ContentEncoderTest, RemoteImageLogOmitsQueryString) {
    auto png = test::makeSolidPng(40, 40, {0, 0, 0, 255});
    transport->on("/cat.png?X-Amz-Signature=s3cr3t", imageResponse(png, "image/png"));

    testing::internal::CaptureStderr();
    makeEncoder().encode(RemoteImageContent{"http://images.test/cat.png?X-Amz-Signature=s3cr3t"});
    std::string logged = testing::internal::GetCapturedStderr();

    EXPECT_NE(logged.find("http://images.test/cat.png"), std::string::npos);
    EXPECT_EQ(logged.find("s3cr3t"), std::string::npos);
}

TEST_F(ContentEncoderTest, RemoteImageWithoutContentTypeIsDecidedByContent) {
    auto png = test::makeSolidPng(10, 10, {0, 0, 0, 255});
    transport->on("/raw", imageResponse(png, ""));
    EXPECT_EQ(makeEncoder().encode(RemoteImageContent{"http://images.test/raw"}).kind, ContentKind::Image);
}

TEST_F(ContentEncoderTest, NonImageContentTypeFailsAndReleasesStream) {
    test::ScriptedResponse html;
    html.headers["content-type"] = "text/html; charset=utf-8";
    html.chunks = {"<html>not an image</html>"};
    transport->on("/page", html);

    EXPECT_THROW(makeEncoder().encode(RemoteImageContent{"http://images.test/page"}), InvalidImageException);
    EXPECT_EQ(transport->openedStreams(), 1);
    EXPECT_EQ(transport->closedStreams(), 1);
}

TEST_F(ContentEncoderTest, RemoteTimeoutPropagates) {
    transport->on("/slow.png", test::ScriptedResponse::timeout());
    EXPECT_THROW(makeEncoder().encode(RemoteImageContent{"http://images.test/slow.png"}), TimeoutException);
}

TEST_F(ContentEncoderTest, RemoteHttpErrorPropagates) {
    test::ScriptedResponse missing;
    missing.status = 404;
    transport->on("/missing.png", missing);
    try {
        makeEncoder().encode(RemoteImageContent{"http://images.test/missing.png"});
        FAIL() << "expected HttpStatusException";
    } catch (const HttpStatusException &e) {
        EXPECT_EQ(e.statusCode(), 404);
    }
}

TEST_F(ContentEncoderTest, FailureMidStreamReleasesStream) {
    auto png = test::makeSolidPng(300, 300, {0, 0, 0, 255});
    test::ScriptedResponse broken = imageResponse(png, "image/png");
    broken.failure = test::ScriptedResponse::Failure::Connectivity;
    broken.failAfterChunks = 1;
    transport->on("/broken.png", broken);

    EXPECT_THROW(makeEncoder().encode(RemoteImageContent{"http://images.test/broken.png"}), ConnectivityException);
    EXPECT_EQ(transport->openedStreams(), 1);
    EXPECT_EQ(transport->closedStreams(), 1);
}

TEST_F(ContentEncoderTest, CorruptRemoteImageReleasesStream) {
    test::ScriptedResponse corrupt;
    corrupt.headers["content-type"] = "image/png";
    corrupt.chunks = {"\x89PNG\r\n\x1a\n", "garbage"};
    transport->on("/corrupt.png", corrupt);

    EXPECT_THROW(makeEncoder().encode(RemoteImageContent{"http://images.test/corrupt.png"}), InvalidImageException);
    EXPECT_EQ(transport->closedStreams(), 1);
}

TEST_F(ContentEncoderTest, OversizedRemoteImageIsRejected) {
    config.maxRemoteImageBytes = 2048;
    // Noise does not compress
    auto png = test::makePng(200, 200, [](int x, int y) {
        uint32_t h = (static_cast<uint32_t>(x) * 73856093u) ^ (static_cast<uint32_t>(y) * 19349663u);
        h ^= h >> 13;
        h *= 0x5bd1e995u;
        h ^= h >> 15;
        return test::Rgba{static_cast<uint8_t>(h), static_cast<uint8_t>(h >> 8), static_cast<uint8_t>(h >> 16), 255};
    });
    ASSERT_GT(png.size(), 2048u);
    transport->on("/big.png", imageResponse(png, "image/png"));

    EXPECT_THROW(makeEncoder().encode(RemoteImageContent{"http://images.test/big.png"}), InvalidImageException);
    EXPECT_EQ(transport->closedStreams(), 1);
}

TEST_F(ContentEncoderTest, WebPageIsForwardedVerbatimWithoutNetwork) {
    EncodedPayload payload = makeEncoder().encode(UrlContent{"https://example.com/page?a=1&b=2"});
    EXPECT_EQ(payload.kind, ContentKind::Url);
    EXPECT_EQ(payload.data, "https://example.com/page?a=1&b=2");
    EXPECT_TRUE(transport->requests().empty());

    EXPECT_THROW(makeEncoder().encode(UrlContent{"  "}), InvalidContentException);
}

TEST_F(ContentEncoderTest, DocumentJoinsPartsWithNewlineAfterText) {
    auto png = test::makeSolidPng(8, 8, {0, 0, 0, 255});
    PrintDocument document{TextContent{"Title"}, ImageContent{png, 8, 8}, TextContent{"end"}};

    std::string printContent = makeEncoder().encodeDocument(document);

    std::string title = "T:" + core::utils::base64Encode(std::string("Title\n"));
    std::string tail = "|T:" + core::utils::base64Encode(std::string("end"));
    EXPECT_EQ(printContent.substr(0, title.size() + 3), title + "|P:");
    EXPECT_EQ(printContent.substr(printContent.size() - tail.size()), tail);
}

TEST_F(ContentEncoderTest, DocumentRejectsEmptyAndWebPageParts) {
    EXPECT_THROW(makeEncoder().encodeDocument({}), InvalidContentException);
    EXPECT_THROW(makeEncoder().encodeDocument({TextContent{"a"}, UrlContent{"https://example.com"}}),
                 InvalidContentException);
}
