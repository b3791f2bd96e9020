#pragma once

#include "../BaseModel.hpp"

namespace connector::models::print {

    /**
     * @brief Arguments of the print_url tool, the page is rendered by the printer service
     */
    class PrintUrlRequest : public BaseModel {
    public:
        std::string url;

        PrintUrlRequest() = default;

        explicit PrintUrlRequest(const nlohmann::json &json) { fromJson(json); }

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
            return "PrintUrlRequest";
        }
    };

}
