#pragma once

#include "connector/models/rpc/RpcMessage.hpp"
#include "connector/registry/ToolRegistry.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace connector::protocol {

    struct ServerInfo {
        std::string name = "Memobird Printer Server";
        std::string version = "1.0.0";
    };

    /**
     * @brief JSON-RPC 2.0 endpoint of the tool-call protocol (initialize, ping, tools/list, tools/call).
     *
     * Stateless apart from the initialization flag, so transports may call it from several threads.
     */
    class McpHandler {
    public:
        static constexpr const char *PROTOCOL_VERSION = "2024-11-05";

        explicit McpHandler(const ToolRegistry &registry, ServerInfo info = {});

        /**
         * @brief Handles one request, notification or batch.
         * @return The response, or std::nullopt when nothing must be sent back.
         */
        std::optional<nlohmann::json> handle(const nlohmann::json &message);

        /**
         * @brief Parses and handles one serialized message. Malformed JSON yields a parse error response.
         */
        std::optional<std::string> handleLine(const std::string &line);

        bool isInitialized() const { return initialized_; }

    private:
        const ToolRegistry &registry_;
        ServerInfo info_;
        std::atomic<bool> initialized_{false};

        std::optional<nlohmann::json> handleSingle(const nlohmann::json &message);

        nlohmann::json dispatch(const rpc::RpcRequest &request);

        nlohmann::json handleInitialize(const nlohmann::json &params);

        nlohmann::json handleToolsCall(const nlohmann::json &params);
    };

}
