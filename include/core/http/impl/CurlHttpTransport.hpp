#pragma once

#include "../HttpTransport.hpp"
#include <chrono>
#include <string>

// Forward declare CURL to keep curl.h out of the public headers
typedef void CURL;
struct curl_slist;

namespace core::http {

    /**
     * @brief HttpTransport over libcurl. One easy handle per call, safe to share across threads.
     */
    class CurlHttpTransport : public HttpTransport {
    public:
        explicit CurlHttpTransport(std::chrono::seconds defaultTimeout = std::chrono::seconds(15),
                                   std::string userAgent = "memobird-bridge/1.0");

        ~CurlHttpTransport() override;

        CurlHttpTransport(const CurlHttpTransport &) = delete;

        CurlHttpTransport &operator=(const CurlHttpTransport &) = delete;

        HttpResponse send(const HttpRequest &request) override;

        std::unique_ptr<HttpStream> openStream(const HttpRequest &request) override;

    private:
        std::chrono::seconds defaultTimeout_;
        std::string userAgent_;

        /**
         * @brief Creates an easy handle configured for @p request. Caller owns handle and header list.
         */
        CURL *prepareHandle(const HttpRequest &request, curl_slist **headerList, std::string *url) const;

        static std::string buildUrl(CURL *curl, const HttpRequest &request);

        static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);

        static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userp);
    };

} // namespace core::http
