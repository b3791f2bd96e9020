#pragma once

#include "../BaseModel.hpp"

namespace connector::models::status {

    class PrintStatusResponse : public BaseModel {
    public:
        int contentId = 0;
        std::string status; // PENDING, PRINTED, FAILED or UNKNOWN

        PrintStatusResponse() = default;

        explicit PrintStatusResponse(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{
                {"contentId", contentId},
                {"status", status}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            contentId = json.at("contentId").get<int>();
            status = json.at("status").get<std::string>();
        }

        bool isValid() const override {
            return status == "PENDING" || status == "PRINTED" || status == "FAILED" || status == "UNKNOWN";
        }

        std::string getTypeName() const override {
            return "PrintStatusResponse";
        }
    };

}
