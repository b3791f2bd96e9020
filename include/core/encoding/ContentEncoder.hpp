#pragma once

#include "core/config/ClientConfig.hpp"
#include "core/encoding/ImageProcessor.hpp"
#include "core/http/HttpTransport.hpp"
#include "core/types/PrintContent.hpp"
#include <memory>
#include <string>

namespace core::encoding {

    /**
     * @brief Converts print content into the printer service wire representation.
     *
     * Text becomes base64(GBK), images base64(1-bit BMP), web pages pass through verbatim.
     * Remote images are pulled through the transport's streamed form; nothing else touches the network.
     */
    class ContentEncoder {
    public:
        ContentEncoder(std::shared_ptr<http::HttpTransport> transport, const config::EncoderConfig &config);

        types::EncodedPayload encode(const types::PrintContent &content) const;

        /**
         * @brief Encodes every part and joins them into one "printcontent" value.
         * @throws InvalidContentException for an empty document or a UrlContent part.
         */
        std::string encodeDocument(const types::PrintDocument &document) const;

        /**
         * @brief "T:<data>" or "P:<data>" for a single encoded part.
         */
        static std::string toWirePart(const types::EncodedPayload &payload);

    private:
        std::shared_ptr<http::HttpTransport> transport_;
        config::EncoderConfig config_;
        ImageProcessor imageProcessor_;

        types::EncodedPayload encodeText(const std::string &text) const;

        types::EncodedPayload encodeImage(const types::ImageContent &image) const;

        types::EncodedPayload encodeRemoteImage(const std::string &url) const;

        types::EncodedPayload encodeWebPage(const std::string &address) const;

        std::vector<uint8_t> fetchImage(const std::string &url) const;
    };

} // namespace core::encoding
