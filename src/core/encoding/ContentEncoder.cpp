#include "core/encoding/ContentEncoder.hpp"
#include "core/encoding/TextCodec.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Base64.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"
#include <type_traits>
#include <variant>

namespace core::encoding {

    ContentEncoder::ContentEncoder(std::shared_ptr<http::HttpTransport> transport, const config::EncoderConfig &config)
            : transport_(std::move(transport)),
              config_(config),
              imageProcessor_(config.maxImageWidth) {
    }

    types::EncodedPayload ContentEncoder::encode(const types::PrintContent &content) const {
        return std::visit([this](const auto &part) -> types::EncodedPayload {
            using T = std::decay_t<decltype(part)>;
            if constexpr (std::is_same_v<T, types::TextContent>) {
                return encodeText(part.body);
            } else if constexpr (std::is_same_v<T, types::ImageContent>) {
                return encodeImage(part);
            } else if constexpr (std::is_same_v<T, types::RemoteImageContent>) {
                return encodeRemoteImage(part.url);
            } else {
                return encodeWebPage(part.address);
            }
        }, content);
    }

    std::string ContentEncoder::encodeDocument(const types::PrintDocument &document) const {
        if (document.empty()) {
            throw types::InvalidContentException("cannot print an empty document");
        }

        std::string printContent;
        for (size_t index = 0; index < document.size(); ++index) {
            const types::PrintContent &part = document[index];
            if (std::holds_alternative<types::UrlContent>(part)) {
                throw types::InvalidContentException("a web page cannot be part of a document");
            }

            types::EncodedPayload encoded;
            const auto *text = std::get_if<types::TextContent>(&part);
            bool isLast = index + 1 == document.size();
            if (text && !isLast && (text->body.empty() || text->body.back() != '\n')) {
                // Parts are printed back to back: keep the next part on its own line
                encoded = encodeText(text->body + "\n");
            } else {
                encoded = encode(part);
            }

            if (!printContent.empty()) {
                printContent += '|';
            }
            printContent += toWirePart(encoded);
        }
        return printContent;
    }

    std::string ContentEncoder::toWirePart(const types::EncodedPayload &payload) {
        switch (payload.kind) {
            case types::ContentKind::Text:
                return "T:" + payload.data;
            case types::ContentKind::Image:
                return "P:" + payload.data;
            default:
                throw types::InvalidContentException("a web page has no inline wire representation");
        }
    }

    types::EncodedPayload ContentEncoder::encodeText(const std::string &text) const {
        if (text.empty()) {
            throw types::InvalidContentException("cannot print empty text");
        }

        std::string gbk = TextCodec::utf8ToGbk(text);
        if (gbk.empty()) {
            throw types::InvalidContentException("text has no characters printable in GBK");
        }
        return {types::ContentKind::Text, utils::base64Encode(gbk)};
    }

    types::EncodedPayload ContentEncoder::encodeImage(const types::ImageContent &image) const {
        GrayImage decoded = ImageProcessor::decode(image.bytes);
        if ((image.width > 0 || image.height > 0) &&
            (decoded.width != image.width || decoded.height != image.height)) {
            Logger::logWarning("[ContentEncoder] Declared size " + std::to_string(image.width) + "x" +
                               std::to_string(image.height) + " differs from decoded " +
                               std::to_string(decoded.width) + "x" + std::to_string(decoded.height));
        }
        return {types::ContentKind::Image, utils::base64Encode(imageProcessor_.toPrintableBitmap(decoded))};
    }

    types::EncodedPayload ContentEncoder::encodeRemoteImage(const std::string &url) const {
        if (url.empty()) {
            throw types::InvalidContentException("image URL is empty");
        }
        std::vector<uint8_t> bytes = fetchImage(url);
        return {types::ContentKind::Image, utils::base64Encode(imageProcessor_.toPrintableBitmap(bytes))};
    }

    types::EncodedPayload ContentEncoder::encodeWebPage(const std::string &address) const {
        if (utils::trim(address).empty()) {
            throw types::InvalidContentException("web page URL is empty");
        }
        return {types::ContentKind::Url, address};
    }

    std::vector<uint8_t> ContentEncoder::fetchImage(const std::string &url) const {
        http::HttpRequest request;
        request.method = http::HttpMethod::Get;
        request.url = url;
        request.headers["Accept"] = "image/*";
        request.timeout = std::chrono::seconds(config_.imageFetchTimeoutSeconds);

        Logger::logInfo("[ContentEncoder] Fetching image: " + utils::redactUrl(url));

        // The stream owns the connection; leaving this scope on any path releases it
        std::unique_ptr<http::HttpStream> stream = transport_->openStream(request);

        std::string contentType = utils::toLower(stream->header("content-type"));
        if (!contentType.empty() && !utils::startsWith(contentType, "image/")) {
            stream->close();
            throw types::InvalidImageException("URL returned non-image content type '" + contentType + "'");
        }

        std::vector<uint8_t> bytes;
        std::string chunk;
        while (stream->nextChunk(chunk)) {
            if (bytes.size() + chunk.size() > config_.maxRemoteImageBytes) {
                stream->close();
                throw types::InvalidImageException("remote image exceeds " +
                                                   std::to_string(config_.maxRemoteImageBytes) + " bytes");
            }
            bytes.insert(bytes.end(), chunk.begin(), chunk.end());
        }
        stream->close();

        Logger::logInfo("[ContentEncoder] Fetched " + std::to_string(bytes.size()) + " bytes from " + utils::redactUrl(url));
        return bytes;
    }

} // namespace core::encoding
