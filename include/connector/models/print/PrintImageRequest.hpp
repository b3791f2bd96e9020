#pragma once

#include "../BaseModel.hpp"

namespace connector::models::print {

    /**
     * @brief Arguments of the print_image tool: raw base64 or a "data:image/...;base64," URL
     */
    class PrintImageRequest : public BaseModel {
    public:
        std::string imageBase64;

        PrintImageRequest() = default;

        explicit PrintImageRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{{"imageBase64", imageBase64}};
        }

        void fromJson(const nlohmann::json &json) override {
            imageBase64 = requireString(json, "imageBase64");
        }

        bool isValid() const override {
            return !imageBase64.empty();
        }

        bool isDataUrl() const {
            return imageBase64.rfind("data:", 0) == 0;
        }

        /**
         * @brief The base64 payload with any data URL prefix removed. Empty if the data URL is not base64.
         */
        std::string payload() const {
            if (!isDataUrl()) {
                return imageBase64;
            }
            const std::string marker = ";base64,";
            size_t pos = imageBase64.find(marker);
            if (pos == std::string::npos) {
                return "";
            }
            return imageBase64.substr(pos + marker.size());
        }

        std::string getTypeName() const override {
            return "PrintImageRequest";
        }
    };

}
