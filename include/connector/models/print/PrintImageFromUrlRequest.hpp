#pragma once

#include "../BaseModel.hpp"

namespace connector::models::print {

    /**
     * @brief Arguments of the print_image_from_url tool
     */
    class PrintImageFromUrlRequest : public BaseModel {
    public:
        std::string url;

        PrintImageFromUrlRequest() = default;

        explicit PrintImageFromUrlRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{{"url", url}};
        }

        void fromJson(const nlohmann::json &json) override {
            url = requireString(json, "url");
        }

        bool isValid() const override {
            return !url.empty();
        }

        std::string getTypeName() const override {
            return "PrintImageFromUrlRequest";
        }
    };

}
