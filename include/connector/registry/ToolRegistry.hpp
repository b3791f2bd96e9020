#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "connector/models/ToolResult.hpp"

namespace connector {

    using ToolHandler = std::function<ToolResult(const nlohmann::json &arguments)>;

    struct ToolDefinition {
        std::string name;
        std::string description;
        nlohmann::json inputSchema;
        ToolHandler handler;
    };

    /**
     * @brief Named tools in registration order.
     */
    class ToolRegistry {
    public:
        void registerTool(ToolDefinition tool);

        bool contains(const std::string &name) const;

        /**
         * @brief Runs the tool.
         * @throws std::invalid_argument for an unknown tool or arguments the tool rejects.
         */
        ToolResult call(const std::string &name, const nlohmann::json &arguments) const;

        /**
         * @brief "tools" array of a tools/list result.
         */
        nlohmann::json describe() const;

        size_t size() const { return tools_.size(); }

    private:
        std::vector<ToolDefinition> tools_;

        const ToolDefinition *find(const std::string &name) const;
    };
}
