#pragma once

#include <nlohmann/json.hpp>
#include "core/utils/StringUtils.hpp"
#include <stdexcept>
#include <string>

namespace connector::rpc {

    // JSON-RPC 2.0 error codes
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    struct RpcRequest {
        nlohmann::json id; // null for notifications
        std::string method;
        nlohmann::json params = nlohmann::json::object();

        bool isNotification() const { return id.is_null(); }
    };

    /**
     * @brief Raised while handling a request, answered as a JSON-RPC error object.
     */
    class RpcException : public std::runtime_error {
    public:
        RpcException(int code, const std::string &message)
                : std::runtime_error(message), code_(code) {}

        int code() const { return code_; }

    private:
        int code_;
    };

    /**
     * @throws RpcException (INVALID_REQUEST) when @p j is not a JSON-RPC 2.0 request object.
     */
    inline void from_json(const nlohmann::json &j, RpcRequest &r) {
        if (!j.is_object()) {
            throw RpcException(INVALID_REQUEST, "Request must be a JSON object");
        }
        if (!j.contains("jsonrpc") || j.at("jsonrpc") != "2.0") {
            throw RpcException(INVALID_REQUEST, "Missing or unsupported 'jsonrpc' version");
        }
        if (!j.contains("method") || !j.at("method").is_string()) {
            throw RpcException(INVALID_REQUEST, "Missing 'method'");
        }
        r.method = j.at("method").get<std::string>();

        r.id = nullptr;
        if (j.contains("id")) {
            const nlohmann::json &id = j.at("id");
            if (!id.is_string() && !id.is_number() && !id.is_null()) {
                throw RpcException(INVALID_REQUEST, "'id' must be a string or a number");
            }
            r.id = id;
        }

        r.params = nlohmann::json::object();
        if (j.contains("params") && !j.at("params").is_null()) {
            if (!j.at("params").is_object() && !j.at("params").is_array()) {
                throw RpcException(INVALID_REQUEST, "'params' must be an object or an array");
            }
            r.params = j.at("params");
        }
    }

    inline nlohmann::json makeResult(const nlohmann::json &id, nlohmann::json result) {
        return nlohmann::json{
                {"jsonrpc", "2.0"},
                {"id",      id},
                {"result",  std::move(result)}
        };
    }

    inline nlohmann::json makeError(const nlohmann::json &id, int code, const std::string &message) {
        return nlohmann::json{
                {"jsonrpc", "2.0"},
                {"id",      id},
                {"error",   {{"code", code}, {"message", core::utils::toValidUtf8(message)}}}
        };
    }

    /**
     * @brief Serializes a message for the wire. Invalid UTF-8 in strings becomes U+FFFD instead of throwing.
     */
    inline std::string serialize(const nlohmann::json &message) {
        return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

}
