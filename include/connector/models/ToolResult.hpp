#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/utils/StringUtils.hpp"

namespace connector {

    /**
     * @brief Outcome of a tool call, rendered as a text block carrying the JSON plus structured content.
     */
    struct ToolResult {
        nlohmann::json structuredContent = nlohmann::json::object();
        bool isError = false;

        static ToolResult success(nlohmann::json content) {
            return ToolResult{std::move(content), false};
        }

        static ToolResult failure(const std::string &errorKind, const std::string &message) {
            return ToolResult{{{"error", errorKind}, {"message", core::utils::toValidUtf8(message)}}, true};
        }
    };

    inline void to_json(nlohmann::json &j, const ToolResult &r) {
        std::string text = r.structuredContent.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        j = nlohmann::json{
                {"content",           nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
                {"structuredContent", r.structuredContent},
                {"isError",           r.isError}
        };
    }

}
