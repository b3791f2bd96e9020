#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace core::config {
    struct ServiceConfig {
        std::string apiBaseUrl = "http://open.memobird.cn/home";
        int requestTimeoutSeconds = 15;
        int printTimeoutSeconds = 20;
        int urlPrintTimeoutSeconds = 30;
        std::vector<int> authFailureCodes; // envelope codes meaning "token no longer valid"
        std::string userAgent = "memobird-bridge/1.0";
    };

    struct EncoderConfig {
        int maxImageWidth = 384;
        size_t maxTextLength = 2000; // code points per submission
        size_t maxRemoteImageBytes = 20 * 1024 * 1024;
        int imageFetchTimeoutSeconds = 15;
    };

    struct ServerConfig {
        std::string transport = "stdio";
        std::string host = "127.0.0.1";
        int port = 8000;
    };

    struct LoggingConfig {
        std::string level = "INFO";
        std::string folder = "logs";
        bool fileEnabled = true;
    };
} // namespace core::config
