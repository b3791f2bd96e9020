#include "connector/transport/StdioTransport.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"
#include <chrono>
#include <future>
#include <list>
#include <string>

namespace connector::transport {

    StdioTransport::StdioTransport(protocol::McpHandler &handler)
            : handler_(handler) {
    }

    size_t StdioTransport::run(std::istream &input, std::ostream &output) {
        Logger::logInfo("[StdioTransport] Listening on stdin");

        std::list<std::future<void>> inFlight;
        size_t received = 0;
        std::string line;

        while (std::getline(input, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (core::utils::trim(line).empty()) {
                continue;
            }
            ++received;

            inFlight.push_back(std::async(std::launch::async, [this, line, &output]() {
                process(line, output);
            }));

            // Reap finished requests
            for (auto it = inFlight.begin(); it != inFlight.end();) {
                if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                    it->get();
                    it = inFlight.erase(it);
                } else {
                    ++it;
                }
            }
        }

        Logger::logInfo("[StdioTransport] Input closed, waiting for " + std::to_string(inFlight.size()) +
                        " request(s) in flight");
        for (auto &request: inFlight) {
            request.get();
        }
        return received;
    }

    void StdioTransport::process(const std::string &line, std::ostream &output) {
        std::optional<std::string> response;
        try {
            response = handler_.handleLine(line);
        } catch (const std::exception &e) {
            Logger::logError("[StdioTransport] Failed to handle message: " + std::string(e.what()));
            response = rpc::serialize(rpc::makeError(nullptr, rpc::INTERNAL_ERROR, e.what()));
        }
        if (!response) {
            return;
        }

        std::lock_guard<std::mutex> lock(writeMutex_);
        output << *response << '\n';
        output.flush();
    }

}
