#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace core::types {

    struct TextContent {
        std::string body;
    };

    /**
     * @brief Raw image bytes (PNG or JPEG). Width and height are advisory, the decoded header wins.
     */
    struct ImageContent {
        std::vector<uint8_t> bytes;
        int width = 0;
        int height = 0;
    };

    /**
     * @brief Image hosted remotely, fetched and encoded locally.
     */
    struct RemoteImageContent {
        std::string url;
    };

    /**
     * @brief Web page rendered by the printer service itself.
     */
    struct UrlContent {
        std::string address;
    };

    using PrintContent = std::variant<TextContent, ImageContent, RemoteImageContent, UrlContent>;

    /**
     * @brief Ordered parts printed as a single job. UrlContent parts are not allowed.
     */
    using PrintDocument = std::vector<PrintContent>;

    enum class ContentKind {
        Text,
        Image,
        Url
    };

    struct EncodedPayload {
        ContentKind kind = ContentKind::Text;
        std::string data; // base64 for Text/Image, verbatim address for Url
    };

    struct PrintReceipt {
        int contentId = 0;
        std::vector<int> contentIds;
    };

    struct Credentials {
        std::string apiKey;
        std::string deviceId;
        std::string userIdentifying;
    };

}
