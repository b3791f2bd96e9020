#pragma once

#include "core/config/ClientConfig.hpp"
#include "core/http/HttpTransport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace core::service {

    /**
     * @brief Endpoint calls of the printer service, one method per endpoint.
     *
     * Builds the signed requests (ak + timestamp on every call) and validates the
     * "showapi" envelope. Holds no session state.
     */
    class MemobirdApi {
    public:
        static constexpr int RESULT_CODE_SUCCESS = 1;
        static constexpr int RESULT_CODE_MALFORMED = -2;

        MemobirdApi(std::shared_ptr<http::HttpTransport> transport, config::ServiceConfig config, std::string apiKey);

        /**
         * @brief Binds the device to the API key.
         * @return User token ("showapi_userid").
         */
        std::string bindUser(const std::string &deviceId, const std::string &userIdentifying) const;

        /**
         * @return Content id assigned to the job.
         * @throws TokenRejectedException when the service refuses @p userId.
         */
        int printPaper(const std::string &deviceId, const std::string &userId, const std::string &printContent) const;

        int printUrl(const std::string &deviceId, const std::string &userId, const std::string &url) const;

        /**
         * @return The raw "printflag", or std::nullopt if the service did not report one.
         */
        std::optional<int> getPrintFlag(int contentId) const;

        const config::ServiceConfig &config() const { return config_; }

    private:
        std::shared_ptr<http::HttpTransport> transport_;
        config::ServiceConfig config_;
        std::string apiKey_;

        http::HttpRequest makeRequest(http::HttpMethod method, const std::string &path, int timeoutSeconds) const;

        nlohmann::json post(const std::string &path, nlohmann::json body, int timeoutSeconds) const;

        nlohmann::json execute(const http::HttpRequest &request) const;

        nlohmann::json parseEnvelope(const http::HttpResponse &response) const;

        bool isAuthFailureCode(int code) const;

        static int extractContentId(const nlohmann::json &data, const std::string &operation);
    };

} // namespace core::service
