#pragma once

#include "../BaseModel.hpp"
#include <vector>

namespace connector::models::print {

    /**
     * @brief Result of every print tool. contentIds lists every job when the content was split.
     */
    class PrintJobResponse : public BaseModel {
    public:
        int contentId = 0;
        std::vector<int> contentIds;

        PrintJobResponse() = default;

        explicit PrintJobResponse(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            nlohmann::json json{{"contentId", contentId}};
            if (!contentIds.empty()) {
                json["contentIds"] = contentIds;
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            contentId = json.at("contentId").get<int>();
            contentIds.clear();
            if (json.contains("contentIds")) {
                contentIds = json.at("contentIds").get<std::vector<int>>();
            }
        }

        bool isValid() const override {
            return contentId != 0;
        }

        std::string getTypeName() const override {
            return "PrintJobResponse";
        }
    };

}
