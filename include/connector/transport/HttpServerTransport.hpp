#pragma once

#include "connector/protocol/McpHandler.hpp"
#include <memory>
#include <string>

namespace ix {
    class HttpServer;
}

namespace connector::transport {

    /**
     * @brief JSON-RPC over HTTP: POST /mcp carries one message, GET / answers a welcome document.
     */
    class HttpServerTransport {
    public:
        HttpServerTransport(protocol::McpHandler &handler, std::string host, int port);

        ~HttpServerTransport();

        /**
         * @throws std::runtime_error when the address cannot be bound.
         */
        void start();

        void stop();

    private:
        protocol::McpHandler &handler_;
        std::string host_;
        int port_;
        std::unique_ptr<ix::HttpServer> server_;
    };

}
