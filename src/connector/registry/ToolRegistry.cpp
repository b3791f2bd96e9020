#include "connector/registry/ToolRegistry.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>

namespace connector {

    void ToolRegistry::registerTool(ToolDefinition tool) {
        if (tool.name.empty() || !tool.handler) {
            throw std::invalid_argument("Tool needs a name and a handler");
        }
        for (auto &existing: tools_) {
            if (existing.name == tool.name) {
                Logger::logWarning("[ToolRegistry] Replacing tool: " + tool.name);
                existing = std::move(tool);
                return;
            }
        }
        Logger::logInfo("[ToolRegistry] Registered tool: " + tool.name);
        tools_.push_back(std::move(tool));
    }

    bool ToolRegistry::contains(const std::string &name) const {
        return find(name) != nullptr;
    }

    ToolResult ToolRegistry::call(const std::string &name, const nlohmann::json &arguments) const {
        const ToolDefinition *tool = find(name);
        if (!tool) {
            Logger::logWarning("[ToolRegistry] Unknown tool: " + name);
            throw std::invalid_argument("Unknown tool: " + name);
        }
        return tool->handler(arguments.is_null() ? nlohmann::json::object() : arguments);
    }

    nlohmann::json ToolRegistry::describe() const {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto &tool: tools_) {
            tools.push_back({
                    {"name",        tool.name},
                    {"description", tool.description},
                    {"inputSchema", tool.inputSchema}
            });
        }
        return tools;
    }

    const ToolDefinition *ToolRegistry::find(const std::string &name) const {
        for (const auto &tool: tools_) {
            if (tool.name == name) {
                return &tool;
            }
        }
        return nullptr;
    }
}
