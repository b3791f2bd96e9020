#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace core::http {

    enum class HttpMethod {
        Get,
        Post
    };

    /**
     * @brief Response header names are stored lower-case.
     */
    using HttpHeaders = std::map<std::string, std::string>;

    struct HttpRequest {
        HttpMethod method = HttpMethod::Get;
        std::string url;
        std::vector<std::pair<std::string, std::string>> query;
        HttpHeaders headers;
        std::string body;
        std::chrono::seconds timeout{0}; // 0 = transport default
    };

    struct HttpResponse {
        long statusCode = 0;
        HttpHeaders headers;
        std::string body;

        bool isSuccess() const {
            return statusCode >= 200 && statusCode < 300;
        }

        std::string header(const std::string &lowerCaseName) const {
            auto it = headers.find(lowerCaseName);
            return it != headers.end() ? it->second : std::string();
        }
    };

    /**
     * @brief Body of an open response, consumed chunk by chunk.
     *
     * Finite and not restartable. Status and headers are known once the stream is returned.
     * The connection is released by close() or by the destructor, whichever comes first.
     */
    class HttpStream {
    public:
        virtual ~HttpStream() = default;

        virtual long statusCode() const = 0;

        virtual const HttpHeaders &headers() const = 0;

        /**
         * @brief Moves the next chunk into @p chunk.
         * @return false once the body is exhausted.
         * @throws TimeoutException, ConnectivityException if the transfer breaks mid-body.
         */
        virtual bool nextChunk(std::string &chunk) = 0;

        virtual void close() = 0;

        std::string header(const std::string &lowerCaseName) const {
            auto it = headers().find(lowerCaseName);
            return it != headers().end() ? it->second : std::string();
        }
    };

    /**
     * @brief Outbound HTTP. No retries at this layer.
     *
     * Both forms throw ConnectivityException, TimeoutException, or HttpStatusException for non-2xx.
     */
    class HttpTransport {
    public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse send(const HttpRequest &request) = 0;

        virtual std::unique_ptr<HttpStream> openStream(const HttpRequest &request) = 0;
    };

} // namespace core::http
