#pragma once

#include "connector/protocol/McpHandler.hpp"
#include <istream>
#include <mutex>
#include <ostream>

namespace connector::transport {

    /**
     * @brief Newline-delimited JSON-RPC over a pair of streams (stdin/stdout in production).
     *
     * Requests are handled concurrently, each response is written as one line under a lock.
     * End of input waits for the requests still running, then returns.
     */
    class StdioTransport {
    public:
        explicit StdioTransport(protocol::McpHandler &handler);

        /**
         * @return Number of messages read.
         */
        size_t run(std::istream &input, std::ostream &output);

    private:
        protocol::McpHandler &handler_;
        std::mutex writeMutex_;

        void process(const std::string &line, std::ostream &output);
    };

}
