#include "core/http/impl/CurlHttpTransport.hpp"
#include "core/types/Error.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"
#include <curl/curl.h>
#include <algorithm>

namespace core::http {
    namespace {
        constexpr long CONNECT_TIMEOUT_SECONDS = 10;
        constexpr long MAX_REDIRECTS = 5;
        constexpr int POLL_TIMEOUT_MS = 1000;
        constexpr size_t ERROR_BODY_SNIPPET = 200;

        [[noreturn]] void throwTransferError(CURLcode code, const std::string &url) {
            if (code == CURLE_OPERATION_TIMEDOUT) {
                throw types::TimeoutException(url);
            }
            throw types::ConnectivityException(std::string(curl_easy_strerror(code)) + " (" + url + ")");
        }
    }

    /**
     * @brief Streamed body driven through a private multi handle.
     *
     * The write callback holds at most one chunk: while a chunk is pending the transfer is
     * paused, so memory stays bounded by libcurl's receive buffer whatever the body size.
     */
    class CurlHttpStream : public HttpStream {
    public:
        CurlHttpStream(CURL *easy, curl_slist *headerList, std::string url)
                : easy_(easy), headerList_(headerList), url_(std::move(url)) {
        }

        ~CurlHttpStream() override {
            close();
        }

        void open() {
            multi_ = curl_multi_init();
            if (!multi_) {
                throw types::ConnectivityException("Failed to initialize CURL multi handle");
            }

            curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlHttpStream::writeCallback);
            curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
            curl_easy_setopt(easy_, CURLOPT_HEADERDATA, &headers_);
            curl_multi_add_handle(multi_, easy_);

            // Headers are complete once the first body byte arrives or the transfer ends
            pump();
            if (finished_ && transferResult_ != CURLE_OK) {
                throwTransferError(transferResult_, url_);
            }

            curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &statusCode_);
            if (statusCode_ < 200 || statusCode_ >= 300) {
                std::string snippet = utils::truncateForLog(pending_, ERROR_BODY_SNIPPET);
                throw types::HttpStatusException(statusCode_, url_, snippet);
            }
        }

        long statusCode() const override {
            return statusCode_;
        }

        const HttpHeaders &headers() const override {
            return headers_;
        }

        bool nextChunk(std::string &chunk) override {
            if (closed_) {
                return false;
            }
            if (pending_.empty() && !finished_) {
                pump();
            }
            if (!pending_.empty()) {
                chunk.clear();
                chunk.swap(pending_);
                return true;
            }
            if (transferResult_ != CURLE_OK) {
                throwTransferError(transferResult_, url_);
            }
            return false;
        }

        void close() override {
            if (closed_) {
                return;
            }
            closed_ = true;
            if (multi_) {
                curl_multi_remove_handle(multi_, easy_);
            }
            curl_easy_cleanup(easy_);
            curl_slist_free_all(headerList_);
            if (multi_) {
                curl_multi_cleanup(multi_);
            }
            easy_ = nullptr;
            headerList_ = nullptr;
            multi_ = nullptr;
            pending_.clear();
        }

    private:
        CURL *easy_;
        curl_slist *headerList_;
        CURLM *multi_ = nullptr;
        std::string url_;
        HttpHeaders headers_;
        std::string pending_;
        long statusCode_ = 0;
        bool paused_ = false;
        bool finished_ = false;
        bool closed_ = false;
        CURLcode transferResult_ = CURLE_OK;

        void pump() {
            if (paused_) {
                paused_ = false;
                // May deliver the previously refused data synchronously
                curl_easy_pause(easy_, CURLPAUSE_CONT);
            }

            while (pending_.empty() && !finished_) {
                int running = 0;
                CURLMcode mc = curl_multi_perform(multi_, &running);
                if (mc != CURLM_OK) {
                    throw types::ConnectivityException(std::string(curl_multi_strerror(mc)) + " (" + url_ + ")");
                }
                collectResult();
                if (!pending_.empty() || finished_) {
                    break;
                }
                mc = curl_multi_poll(multi_, nullptr, 0, POLL_TIMEOUT_MS, nullptr);
                if (mc != CURLM_OK) {
                    throw types::ConnectivityException(std::string(curl_multi_strerror(mc)) + " (" + url_ + ")");
                }
            }
        }

        void collectResult() {
            int messagesLeft = 0;
            while (CURLMsg *msg = curl_multi_info_read(multi_, &messagesLeft)) {
                if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                    finished_ = true;
                    transferResult_ = msg->data.result;
                }
            }
        }

        static size_t writeCallback(char *data, size_t size, size_t nmemb, void *userp) {
            auto *self = static_cast<CurlHttpStream *>(userp);
            size_t totalSize = size * nmemb;
            if (!self->pending_.empty()) {
                self->paused_ = true;
                return CURL_WRITEFUNC_PAUSE;
            }
            self->pending_.assign(data, totalSize);
            return totalSize;
        }
    };

    CurlHttpTransport::CurlHttpTransport(std::chrono::seconds defaultTimeout, std::string userAgent)
            : defaultTimeout_(defaultTimeout), userAgent_(std::move(userAgent)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    CurlHttpTransport::~CurlHttpTransport() {
        curl_global_cleanup();
    }

    HttpResponse CurlHttpTransport::send(const HttpRequest &request) {
        curl_slist *headerList = nullptr;
        std::string url;
        CURL *curl = prepareHandle(request, &headerList, &url);
        // Errors name the endpoint only: the query string carries the API key
        std::string endpoint = utils::redactUrl(request.url);
        Logger::logDebug("[CurlHttpTransport] " + std::string(request.method == HttpMethod::Post ? "POST " : "GET ") +
                         endpoint);

        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);

        curl_easy_cleanup(curl);
        curl_slist_free_all(headerList);

        if (res != CURLE_OK) {
            Logger::logError("[CurlHttpTransport] Request failed: " + std::string(curl_easy_strerror(res)) +
                             " (" + endpoint + ")");
            throwTransferError(res, endpoint);
        }
        if (!response.isSuccess()) {
            Logger::logError("[CurlHttpTransport] HTTP error " + std::to_string(response.statusCode) +
                             " (" + endpoint + ")");
            throw types::HttpStatusException(response.statusCode, endpoint,
                                             utils::truncateForLog(response.body, ERROR_BODY_SNIPPET));
        }
        return response;
    }

    std::unique_ptr<HttpStream> CurlHttpTransport::openStream(const HttpRequest &request) {
        curl_slist *headerList = nullptr;
        std::string url;
        CURL *curl = prepareHandle(request, &headerList, &url);

        // Owns the handle from here on: any throw below releases the connection.
        // Errors and logs carry no query string: signed URLs keep their credentials there.
        std::string endpoint = utils::redactUrl(url);
        auto stream = std::make_unique<CurlHttpStream>(curl, headerList, endpoint);
        stream->open();

        Logger::logInfo("[CurlHttpTransport] Stream opened: " + endpoint + " (HTTP " +
                        std::to_string(stream->statusCode()) + ")");
        return stream;
    }

    CURL *CurlHttpTransport::prepareHandle(const HttpRequest &request, curl_slist **headerList,
                                           std::string *url) const {
        CURL *curl = curl_easy_init();
        if (!curl) {
            throw types::ConnectivityException("Failed to initialize CURL");
        }

        try {
            *url = buildUrl(curl, request);
        } catch (const types::BridgeException &) {
            curl_easy_cleanup(curl);
            throw;
        }
        long timeout = static_cast<long>(request.timeout.count() > 0 ? request.timeout.count()
                                                                     : defaultTimeout_.count());

        curl_easy_setopt(curl, CURLOPT_URL, url->c_str());
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);

        // Timeouts
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(CONNECT_TIMEOUT_SECONDS, timeout));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());

        if (request.method == HttpMethod::Post) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, request.body.c_str());
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }

        for (const auto &[name, value]: request.headers) {
            std::string line = name + ": " + value;
            curl_slist *extended = curl_slist_append(*headerList, line.c_str());
            if (!extended) {
                curl_slist_free_all(*headerList);
                curl_easy_cleanup(curl);
                throw types::ConnectivityException("Failed to build request headers");
            }
            *headerList = extended;
        }
        if (*headerList) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, *headerList);
        }

        return curl;
    }

    std::string CurlHttpTransport::buildUrl(CURL *curl, const HttpRequest &request) {
        if (request.query.empty()) {
            return request.url;
        }

        std::string url = request.url;
        char separator = url.find('?') == std::string::npos ? '?' : '&';
        for (const auto &[key, value]: request.query) {
            char *escapedKey = curl_easy_escape(curl, key.c_str(), static_cast<int>(key.size()));
            char *escapedValue = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
            if (!escapedKey || !escapedValue) {
                curl_free(escapedKey);
                curl_free(escapedValue);
                throw types::ConnectivityException("Failed to encode query parameter " + key);
            }
            url += separator;
            url += escapedKey;
            url += '=';
            url += escapedValue;
            separator = '&';
            curl_free(escapedKey);
            curl_free(escapedValue);
        }
        return url;
    }

    size_t CurlHttpTransport::writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
        auto *body = static_cast<std::string *>(userp);
        size_t totalSize = size * nmemb;
        body->append(static_cast<char *>(contents), totalSize);
        return totalSize;
    }

    size_t CurlHttpTransport::headerCallback(char *buffer, size_t size, size_t nitems, void *userp) {
        auto *headers = static_cast<HttpHeaders *>(userp);
        size_t totalSize = size * nitems;
        if (!headers) {
            return totalSize;
        }

        std::string line(buffer, totalSize);
        if (utils::startsWith(line, "HTTP/")) {
            // New status line: a redirect hop or a 100-continue, keep only the last block
            headers->clear();
            return totalSize;
        }

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = utils::toLower(utils::trim(line.substr(0, colon)));
            (*headers)[name] = utils::trim(line.substr(colon + 1));
        }
        return totalSize;
    }

} // namespace core::http
