#include "connector/transport/HttpServerTransport.hpp"
#include "logger/Logger.hpp"
#include <ixwebsocket/IXHttpServer.h>
#include <ixwebsocket/IXNetSystem.h>
#include <stdexcept>

namespace connector::transport {
    namespace {
        ix::HttpResponsePtr jsonResponse(int status, const std::string &description, const std::string &body) {
            ix::WebSocketHttpHeaders headers;
            headers["Content-Type"] = "application/json";
            return std::make_shared<ix::HttpResponse>(status, description, ix::HttpErrorCode::Ok, headers, body);
        }

        std::string pathOf(const std::string &uri) {
            size_t query = uri.find('?');
            return query == std::string::npos ? uri : uri.substr(0, query);
        }
    }

    HttpServerTransport::HttpServerTransport(protocol::McpHandler &handler, std::string host, int port)
            : handler_(handler), host_(std::move(host)), port_(port) {
    }

    HttpServerTransport::~HttpServerTransport() {
        stop();
    }

    void HttpServerTransport::start() {
        ix::initNetSystem();
        server_ = std::make_unique<ix::HttpServer>(port_, host_);

        server_->setOnConnectionCallback(
                [this](ix::HttpRequestPtr request, std::shared_ptr<ix::ConnectionState> /*state*/) -> ix::HttpResponsePtr {
                    std::string path = pathOf(request->uri);

                    if (request->method == "GET" && path == "/") {
                        nlohmann::json welcome = {
                                {"name",      "Memobird Printer Server"},
                                {"transport", "http"},
                                {"endpoint",  "/mcp"}
                        };
                        return jsonResponse(200, "OK", welcome.dump());
                    }
                    if (path != "/mcp") {
                        return jsonResponse(404, "Not Found", R"({"error":"not found"})");
                    }
                    if (request->method != "POST") {
                        return jsonResponse(405, "Method Not Allowed", R"({"error":"use POST"})");
                    }

                    std::optional<std::string> response;
                    try {
                        response = handler_.handleLine(request->body);
                    } catch (const std::exception &e) {
                        Logger::logError("[HttpServerTransport] Failed to handle message: " + std::string(e.what()));
                        return jsonResponse(500, "Internal Server Error",
                                            rpc::serialize(rpc::makeError(nullptr, rpc::INTERNAL_ERROR, e.what())));
                    }
                    if (!response) {
                        // Notification: accepted, nothing to answer
                        return std::make_shared<ix::HttpResponse>(202, "Accepted");
                    }
                    return jsonResponse(200, "OK", *response);
                });

        auto result = server_->listen();
        if (!result.first) {
            throw std::runtime_error("Cannot listen on " + host_ + ":" + std::to_string(port_) + ": " + result.second);
        }
        server_->start();
        Logger::logInfo("[HttpServerTransport] Listening on http://" + host_ + ":" + std::to_string(port_) + "/mcp");
    }

    void HttpServerTransport::stop() {
        if (server_) {
            server_->stop();
            server_.reset();
            Logger::logInfo("[HttpServerTransport] Stopped");
        }
    }

}
