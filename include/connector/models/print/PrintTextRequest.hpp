#pragma once

#include "../BaseModel.hpp"

namespace connector::models::print {

    /**
     * @brief Arguments of the print_text tool
     */
    class PrintTextRequest : public BaseModel {
    public:
        std::string text;

        PrintTextRequest() = default;

        explicit PrintTextRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{{"text", text}};
        }

        void fromJson(const nlohmann::json &json) override {
            text = requireString(json, "text");
        }

        bool isValid() const override {
            return !text.empty();
        }

        std::string getTypeName() const override {
            return "PrintTextRequest";
        }
    };

}
