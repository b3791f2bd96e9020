#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace connector::models {

    /**
     * @brief Base interface for tool argument and result models
     */
    class BaseModel {
    public:
        virtual ~BaseModel() = default;

        /**
         * @brief Serialize model to JSON
         */
        virtual nlohmann::json toJson() const = 0;

        /**
         * @brief Deserialize model from JSON
         * @throws std::invalid_argument when a required field is missing or has the wrong type
         */
        virtual void fromJson(const nlohmann::json &json) = 0;

        /**
         * @brief Validate model data
         */
        virtual bool isValid() const = 0;

        /**
         * @brief Get model type name
         */
        virtual std::string getTypeName() const = 0;

    protected:
        static std::string requireString(const nlohmann::json &json, const std::string &key) {
            if (!json.is_object() || !json.contains(key)) {
                throw std::invalid_argument("Missing required argument '" + key + "'");
            }
            const nlohmann::json &value = json.at(key);
            if (!value.is_string()) {
                throw std::invalid_argument("Argument '" + key + "' must be a string");
            }
            return value.get<std::string>();
        }
    };

} // namespace connector::models
