#include "core/service/MemobirdApi.hpp"
#include "core/types/Error.hpp"
#include "core/utils/StringUtils.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace core::service {
    namespace {
        constexpr long HTTP_UNAUTHORIZED = 401;
        constexpr long HTTP_FORBIDDEN = 403;

        [[noreturn]] void throwOutOfRange(const std::string &field, const std::string &value) {
            throw types::PrinterServiceException(MemobirdApi::RESULT_CODE_MALFORMED,
                                                 "'" + field + "' is out of range: " + value);
        }

        /**
         * @brief Reads an integer field that the service may send as a number or a numeric string.
         * @return std::nullopt if the value is not an integer at all.
         * @throws types::PrinterServiceException if it is an integer that does not fit in an int.
         */
        std::optional<int> readInt(const nlohmann::json &value, const std::string &field) {
            constexpr auto MIN = std::numeric_limits<int>::min();
            constexpr auto MAX = std::numeric_limits<int>::max();

            if (value.is_number_unsigned()) {
                auto number = value.get<uint64_t>();
                if (number > static_cast<uint64_t>(MAX)) throwOutOfRange(field, value.dump());
                return static_cast<int>(number);
            }
            if (value.is_number_integer()) {
                auto number = value.get<int64_t>();
                if (number < MIN || number > MAX) throwOutOfRange(field, value.dump());
                return static_cast<int>(number);
            }
            if (value.is_number_float()) {
                double number = value.get<double>();
                if (!std::isfinite(number) || std::floor(number) != number) return std::nullopt;
                if (number < static_cast<double>(MIN) || number > static_cast<double>(MAX)) {
                    throwOutOfRange(field, value.dump());
                }
                return static_cast<int>(number);
            }
            if (value.is_string()) {
                const std::string text = utils::trim(value.get<std::string>());
                if (text.empty()) return std::nullopt;
                long long parsed = 0;
                size_t consumed = 0;
                try {
                    parsed = std::stoll(text, &consumed);
                } catch (const std::out_of_range &) {
                    throwOutOfRange(field, text);
                } catch (const std::invalid_argument &) {
                    return std::nullopt;
                }
                if (consumed != text.size()) return std::nullopt;
                if (parsed < MIN || parsed > MAX) throwOutOfRange(field, text);
                return static_cast<int>(parsed);
            }
            return std::nullopt;
        }
    }

    MemobirdApi::MemobirdApi(std::shared_ptr<http::HttpTransport> transport, config::ServiceConfig config,
                             std::string apiKey)
            : transport_(std::move(transport)),
              config_(std::move(config)),
              apiKey_(std::move(apiKey)) {
        if (apiKey_.empty()) {
            throw std::invalid_argument("Memobird API key (ak) cannot be empty");
        }
    }

    std::string MemobirdApi::bindUser(const std::string &deviceId, const std::string &userIdentifying) const {
        http::HttpRequest request = makeRequest(http::HttpMethod::Get, "/setuserbind", config_.requestTimeoutSeconds);
        request.query.emplace_back("memobirdID", deviceId);
        request.query.emplace_back("useridentifying", userIdentifying);

        Logger::logInfo("[MemobirdApi] Getting user ID for device " + deviceId + "...");
        nlohmann::json data = execute(request);

        auto it = data.find("showapi_userid");
        if (it == data.end() || it->is_null()) {
            throw types::PrinterServiceException(RESULT_CODE_SUCCESS, "User ID not found in successful API response");
        }

        std::string userId = it->is_string() ? it->get<std::string>() : it->dump();
        if (userId.empty()) {
            throw types::PrinterServiceException(RESULT_CODE_SUCCESS, "User ID in API response is empty");
        }
        Logger::logInfo("[MemobirdApi] Obtained user ID: " + userId);
        return userId;
    }

    int MemobirdApi::printPaper(const std::string &deviceId, const std::string &userId,
                                const std::string &printContent) const {
        Logger::logInfo("[MemobirdApi] Sending content to device " + deviceId + " (User: " + userId + ", " +
                        std::to_string(printContent.size()) + " bytes)...");
        nlohmann::json data = post("/printpaper", {
                {"printcontent", printContent},
                {"memobirdID",   deviceId},
                {"userID",       userId}
        }, config_.printTimeoutSeconds);

        int contentId = extractContentId(data, "print");
        Logger::logInfo("[MemobirdApi] Print request successful. Content ID: " + std::to_string(contentId));
        return contentId;
    }

    int MemobirdApi::printUrl(const std::string &deviceId, const std::string &userId, const std::string &url) const {
        Logger::logInfo("[MemobirdApi] Sending URL " + utils::redactUrl(url) + " to device " + deviceId + " (User: " + userId + ")...");
        nlohmann::json data = post("/printpaperFromUrl", {
                {"printUrl",   url},
                {"memobirdID", deviceId},
                {"userID",     userId}
        }, config_.urlPrintTimeoutSeconds);

        int contentId = extractContentId(data, "print URL");
        Logger::logInfo("[MemobirdApi] Print URL request successful. Content ID: " + std::to_string(contentId));
        return contentId;
    }

    std::optional<int> MemobirdApi::getPrintFlag(int contentId) const {
        http::HttpRequest request = makeRequest(http::HttpMethod::Get, "/getprintstatus", config_.requestTimeoutSeconds);
        request.query.emplace_back("printcontentid", std::to_string(contentId));

        Logger::logInfo("[MemobirdApi] Checking print status for Content ID: " + std::to_string(contentId) + "...");
        nlohmann::json data = execute(request);

        auto it = data.find("printflag");
        if (it == data.end()) {
            Logger::logWarning("[MemobirdApi] No printflag in status response for " + std::to_string(contentId));
            return std::nullopt;
        }
        try {
            return readInt(*it, "printflag");
        } catch (const types::PrinterServiceException &e) {
            // Unknown flags map to UNKNOWN, however large
            Logger::logWarning("[MemobirdApi] " + e.serviceMessage());
            return std::nullopt;
        }
    }

    http::HttpRequest MemobirdApi::makeRequest(http::HttpMethod method, const std::string &path,
                                               int timeoutSeconds) const {
        http::HttpRequest request;
        request.method = method;
        request.url = config_.apiBaseUrl + path;
        request.timeout = std::chrono::seconds(timeoutSeconds);
        request.headers["Accept"] = "application/json";
        if (method == http::HttpMethod::Get) {
            request.query.emplace_back("ak", apiKey_);
            request.query.emplace_back("timestamp", utils::serviceTimestamp());
        }
        return request;
    }

    nlohmann::json MemobirdApi::post(const std::string &path, nlohmann::json body, int timeoutSeconds) const {
        http::HttpRequest request = makeRequest(http::HttpMethod::Post, path, timeoutSeconds);
        body["ak"] = apiKey_;
        body["timestamp"] = utils::serviceTimestamp();
        request.headers["Content-Type"] = "application/json";
        request.body = body.dump();
        return execute(request);
    }

    nlohmann::json MemobirdApi::execute(const http::HttpRequest &request) const {
        http::HttpResponse response;
        try {
            response = transport_->send(request);
        } catch (const types::HttpStatusException &e) {
            if (e.statusCode() == HTTP_UNAUTHORIZED || e.statusCode() == HTTP_FORBIDDEN) {
                throw types::TokenRejectedException(static_cast<int>(e.statusCode()), e.what());
            }
            throw;
        }
        return parseEnvelope(response);
    }

    nlohmann::json MemobirdApi::parseEnvelope(const http::HttpResponse &response) const {
        nlohmann::json data = nlohmann::json::parse(response.body, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            throw types::PrinterServiceException(
                    RESULT_CODE_MALFORMED,
                    "Failed to decode JSON response. Response text: " + utils::truncateForLog(response.body, 100));
        }

        std::optional<int> code;
        if (auto it = data.find("showapi_res_code"); it != data.end()) {
            code = readInt(*it, "showapi_res_code");
        }

        if (code != RESULT_CODE_SUCCESS) {
            int resultCode = code.value_or(-1);
            std::string message = "Unknown API error";
            if (auto it = data.find("showapi_res_error"); it != data.end() && it->is_string()) {
                message = it->get<std::string>();
            }

            Logger::logError("[MemobirdApi] API error (HTTP " + std::to_string(response.statusCode) + ", code " +
                             std::to_string(resultCode) + "): " + message);
            if (isAuthFailureCode(resultCode)) {
                throw types::TokenRejectedException(resultCode, message);
            }
            throw types::PrinterServiceException(resultCode, message);
        }
        return data;
    }

    bool MemobirdApi::isAuthFailureCode(int code) const {
        return std::find(config_.authFailureCodes.begin(), config_.authFailureCodes.end(), code) !=
               config_.authFailureCodes.end();
    }

    int MemobirdApi::extractContentId(const nlohmann::json &data, const std::string &operation) {
        auto it = data.find("printcontentid");
        std::optional<int> contentId = it != data.end() ? readInt(*it, "printcontentid") : std::nullopt;
        if (!contentId) {
            throw types::PrinterServiceException(RESULT_CODE_SUCCESS,
                                                 "Content ID not found in successful " + operation + " API response");
        }
        return *contentId;
    }

} // namespace core::service
