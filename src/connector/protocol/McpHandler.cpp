#include "connector/protocol/McpHandler.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>

namespace connector::protocol {

    McpHandler::McpHandler(const ToolRegistry &registry, ServerInfo info)
            : registry_(registry), info_(std::move(info)) {
    }

    std::optional<std::string> McpHandler::handleLine(const std::string &line) {
        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error &e) {
            Logger::logWarning("[McpHandler] Malformed message: " + std::string(e.what()));
            return rpc::serialize(rpc::makeError(nullptr, rpc::PARSE_ERROR, "Parse error"));
        }

        std::optional<nlohmann::json> response = handle(message);
        if (!response) {
            return std::nullopt;
        }
        return rpc::serialize(*response);
    }

    std::optional<nlohmann::json> McpHandler::handle(const nlohmann::json &message) {
        if (!message.is_array()) {
            return handleSingle(message);
        }

        if (message.empty()) {
            return rpc::makeError(nullptr, rpc::INVALID_REQUEST, "Empty batch");
        }
        nlohmann::json responses = nlohmann::json::array();
        for (const auto &item: message) {
            if (std::optional<nlohmann::json> response = handleSingle(item)) {
                responses.push_back(std::move(*response));
            }
        }
        if (responses.empty()) {
            return std::nullopt;
        }
        return responses;
    }

    std::optional<nlohmann::json> McpHandler::handleSingle(const nlohmann::json &message) {
        rpc::RpcRequest request;
        try {
            request = message.get<rpc::RpcRequest>();
        } catch (const rpc::RpcException &e) {
            nlohmann::json id = nullptr;
            if (message.is_object() && message.contains("id") &&
                (message.at("id").is_string() || message.at("id").is_number())) {
                id = message.at("id");
            }
            return rpc::makeError(id, e.code(), e.what());
        }

        try {
            nlohmann::json result = dispatch(request);
            if (request.isNotification()) {
                return std::nullopt;
            }
            return rpc::makeResult(request.id, std::move(result));
        } catch (const rpc::RpcException &e) {
            Logger::logWarning("[McpHandler] " + request.method + ": " + std::string(e.what()));
            if (request.isNotification()) return std::nullopt;
            return rpc::makeError(request.id, e.code(), e.what());
        } catch (const std::invalid_argument &e) {
            Logger::logWarning("[McpHandler] " + request.method + ": invalid params: " + std::string(e.what()));
            if (request.isNotification()) return std::nullopt;
            return rpc::makeError(request.id, rpc::INVALID_PARAMS, e.what());
        } catch (const std::exception &e) {
            Logger::logError("[McpHandler] " + request.method + " failed: " + std::string(e.what()));
            if (request.isNotification()) return std::nullopt;
            return rpc::makeError(request.id, rpc::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        }
    }

    nlohmann::json McpHandler::dispatch(const rpc::RpcRequest &request) {
        const std::string &method = request.method;
        Logger::logDebug("[McpHandler] " + method + (request.isNotification() ? " (notification)" : " id=" + request.id.dump()));

        if (method == "initialize") {
            return handleInitialize(request.params);
        }
        if (method == "notifications/initialized") {
            initialized_ = true;
            Logger::logInfo("[McpHandler] Client initialized");
            return nullptr;
        }
        if (method == "ping") {
            return nlohmann::json::object();
        }
        if (method == "tools/list") {
            return {{"tools", registry_.describe()}};
        }
        if (method == "tools/call") {
            return handleToolsCall(request.params);
        }
        if (method.rfind("notifications/", 0) == 0) {
            // Other notifications carry nothing we act on
            return nullptr;
        }

        throw rpc::RpcException(rpc::METHOD_NOT_FOUND, "Method not found: " + method);
    }

    nlohmann::json McpHandler::handleInitialize(const nlohmann::json &params) {
        std::string clientName = "unknown";
        if (params.is_object() && params.contains("clientInfo") && params.at("clientInfo").is_object()) {
            clientName = params.at("clientInfo").value("name", clientName);
        }
        Logger::logInfo("[McpHandler] Initialize from client: " + clientName);

        return {
                {"protocolVersion", PROTOCOL_VERSION},
                {"capabilities",    {{"tools", {{"listChanged", false}}}}},
                {"serverInfo",      {{"name", info_.name}, {"version", info_.version}}}
        };
    }

    nlohmann::json McpHandler::handleToolsCall(const nlohmann::json &params) {
        if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
            throw std::invalid_argument("tools/call requires a tool 'name'");
        }
        std::string name = params.at("name").get<std::string>();

        nlohmann::json arguments = nlohmann::json::object();
        if (params.contains("arguments") && !params.at("arguments").is_null()) {
            arguments = params.at("arguments");
            if (!arguments.is_object()) {
                throw std::invalid_argument("tools/call 'arguments' must be an object");
            }
        }

        return nlohmann::json(registry_.call(name, arguments));
    }

}
