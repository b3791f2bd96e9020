#pragma once

#include "../BaseModel.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

namespace connector::models::status {

    /**
     * @brief Arguments of the check_print_status tool
     */
    class PrintStatusRequest : public BaseModel {
    public:
        int contentId = 0;

        PrintStatusRequest() = default;

        explicit PrintStatusRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{{"contentId", contentId}};
        }

        void fromJson(const nlohmann::json &json) override {
            if (!json.is_object() || !json.contains("contentId")) {
                throw std::invalid_argument("Missing required argument 'contentId'");
            }
            const nlohmann::json &value = json.at("contentId");
            constexpr auto MAX = std::numeric_limits<int>::max();
            constexpr auto MIN = std::numeric_limits<int>::min();
            if (value.is_number_unsigned()) {
                if (value.get<uint64_t>() > static_cast<uint64_t>(MAX)) {
                    throw std::invalid_argument("Argument 'contentId' is out of range");
                }
                contentId = static_cast<int>(value.get<uint64_t>());
            } else if (value.is_number_integer()) {
                int64_t id = value.get<int64_t>();
                if (id < MIN || id > MAX) {
                    throw std::invalid_argument("Argument 'contentId' is out of range");
                }
                contentId = static_cast<int>(id);
            } else if (value.is_number_float()) {
                double id = value.get<double>();
                if (!std::isfinite(id) || std::floor(id) != id) {
                    throw std::invalid_argument("Argument 'contentId' must be an integer");
                }
                if (id < static_cast<double>(MIN) || id > static_cast<double>(MAX)) {
                    throw std::invalid_argument("Argument 'contentId' is out of range");
                }
                contentId = static_cast<int>(id);
            } else {
                throw std::invalid_argument("Argument 'contentId' must be an integer");
            }
        }

        bool isValid() const override {
            return contentId > 0;
        }

        std::string getTypeName() const override {
            return "PrintStatusRequest";
        }
    };

}
