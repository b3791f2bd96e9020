//
// Created by Andrea on 27/08/2025.
//

#include "application/config/ConfigManager.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

namespace core::config {
    namespace {
        constexpr const char *TRANSPORT_SSE_ALIAS = "sse";

        struct EnvBinding {
            const char *envVar;
            const char *key;
        };

        const EnvBinding ENV_BINDINGS[] = {
            {"MEMOBIRD_AK", "memobird.ak"},
            {"MEMOBIRD_DEVICE_ID", "memobird.device.id"},
            {"MEMOBIRD_USER_IDENTIFYING", "memobird.user.identifying"},
            {"MEMOBIRD_API_BASE_URL", "service.api.base.url"},
            {"MEMOBIRD_REQUEST_TIMEOUT", "service.request.timeout"},
            {"MEMOBIRD_PRINT_TIMEOUT", "service.print.timeout"},
            {"MEMOBIRD_URL_PRINT_TIMEOUT", "service.url.print.timeout"},
            {"MEMOBIRD_AUTH_FAILURE_CODES", "service.auth.failure.codes"},
            {"MEMOBIRD_IMAGE_MAX_WIDTH", "encoder.image.max.width"},
            {"MEMOBIRD_TEXT_MAX_LENGTH", "encoder.text.max.length"},
            {"MEMOBIRD_TRANSPORT", "server.transport"},
            {"MEMOBIRD_HTTP_HOST", "server.host"},
            {"MEMOBIRD_HTTP_PORT", "server.port"},
            {"MEMOBIRD_LOG_LEVEL", "logging.level"},
            {"MEMOBIRD_LOG_FOLDER", "logging.folder"},
            {"MEMOBIRD_LOG_FILE", "logging.file.enabled"}
        };

        struct OptionBinding {
            const char *longName;
            const char *alias;
            const char *key;
        };

        const OptionBinding OPTION_BINDINGS[] = {
            {"--ak", "--access_key", "memobird.ak"},
            {"--did", "--device_id", "memobird.device.id"},
            {"--transport", "-t", "server.transport"},
            {"--port", "-p", "server.port"},
            {"--host", nullptr, "server.host"},
            {"--log-level", nullptr, "logging.level"}
        };

        bool isPositive(const ConfigManager &config, const std::string &key) {
            return config.get<int>(key, 0) > 0;
        }
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);

        if (!std::filesystem::exists(configPath)) {
            Logger::logInfo("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            // Flatten JSON into key-value pairs
            std::unordered_map<std::string, std::string> loaded;
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        loaded[key] = it.value().get<std::string>();
                    } else {
                        loaded[key] = it.value().dump();
                    }
                }
            };

            if (!json.is_object()) {
                throw std::runtime_error("top-level value is not an object");
            }
            flatten(json, "");
            for (auto &[key, value]: loaded) {
                config_[key] = std::move(value);
            }

            Logger::logInfo(
                "[ConfigManager] Loaded " + std::to_string(loaded.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config " + configPath + ": " + std::string(e.what()));
        }
    }

    void ConfigManager::loadEnvFile(const std::string &envFilePath) {
        std::ifstream envFile(envFilePath);
        if (!envFile.is_open()) {
            Logger::logInfo("[ConfigManager] No .env file found at: " + envFilePath + " (using system environment only)");
            return;
        }

        std::string line;
        int loadedVars = 0;

        while (std::getline(envFile, line)) {
            line = utils::trim(line);
            if (line.empty() || line[0] == '#') continue;

            // Parse KEY=VALUE
            size_t pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = utils::trim(line.substr(0, pos));
            std::string value = utils::trim(line.substr(pos + 1));
            if (utils::startsWith(key, "export ")) {
                key = utils::trim(key.substr(7));
            }
            if (key.empty()) continue;

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            // Never override a variable set by the caller
            if (std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
                loadedVars++;
            } else {
                Logger::logInfo("[ConfigManager] Skipped (already set): " + key);
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loadedVars) + " variables from " + envFilePath);
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        for (const auto &binding: ENV_BINDINGS) {
            const char *value = std::getenv(binding.envVar);
            if (value && *value) {
                config_[binding.key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::applyOverrides(const std::unordered_map<std::string, std::string> &overrides) {
        std::lock_guard<std::mutex> lock(configMutex_);
        for (const auto &[key, value]: overrides) {
            config_[key] = value;
        }
    }

    CommandLineOptions ConfigManager::parseCommandLine(const std::vector<std::string> &args) {
        CommandLineOptions options;

        for (size_t i = 0; i < args.size(); ++i) {
            std::string name = args[i];
            std::optional<std::string> inlineValue;
            size_t equals = name.find('=');
            if (utils::startsWith(name, "--") && equals != std::string::npos) {
                inlineValue = name.substr(equals + 1);
                name = name.substr(0, equals);
            }

            if (name == "-h" || name == "--help") {
                options.showHelp = true;
                continue;
            }

            auto takeValue = [&]() -> std::string {
                if (inlineValue) {
                    return *inlineValue;
                }
                if (i + 1 >= args.size()) {
                    throw std::invalid_argument("Missing value for option " + name);
                }
                return args[++i];
            };

            if (name == "--config") {
                options.configPath = takeValue();
                continue;
            }

            const OptionBinding *match = nullptr;
            for (const auto &binding: OPTION_BINDINGS) {
                if (name == binding.longName || (binding.alias && name == binding.alias)) {
                    match = &binding;
                    break;
                }
            }
            if (!match) {
                throw std::invalid_argument("Unknown option: " + name);
            }
            options.overrides[match->key] = takeValue();
        }

        return options;
    }

    std::string ConfigManager::usage(const std::string &program) {
        return "Usage: " + program + " [options]\n"
               "  --ak, --access_key <key>     Memobird API key (MEMOBIRD_AK)\n"
               "  --did, --device_id <id>      Memobird device ID (MEMOBIRD_DEVICE_ID)\n"
               "  -t, --transport <mode>       stdio, http or sse (served as http; default: stdio)\n"
               "  -p, --port <port>            HTTP transport port (default: 8000)\n"
               "  --host <host>                HTTP transport bind address (default: 127.0.0.1)\n"
               "  --config <path>              JSON configuration file (default: config.json)\n"
               "  --log-level <level>          DEBUG, INFO, WARNING or ERROR (default: INFO)\n"
               "  -h, --help                   Show this help\n";
    }

    void ConfigManager::reset() {
        std::lock_guard<std::mutex> lock(configMutex_);
        setDefaults();
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    types::Credentials ConfigManager::getCredentials() const {
        types::Credentials credentials;
        credentials.apiKey = get<std::string>("memobird.ak", "");
        credentials.deviceId = get<std::string>("memobird.device.id", "");
        credentials.userIdentifying = get<std::string>("memobird.user.identifying", "");
        return credentials;
    }

    ServiceConfig ConfigManager::getServiceConfig() const {
        ServiceConfig config;
        config.apiBaseUrl = get<std::string>("service.api.base.url", config.apiBaseUrl);
        config.requestTimeoutSeconds = get<int>("service.request.timeout", config.requestTimeoutSeconds);
        config.printTimeoutSeconds = get<int>("service.print.timeout", config.printTimeoutSeconds);
        config.urlPrintTimeoutSeconds = get<int>("service.url.print.timeout", config.urlPrintTimeoutSeconds);
        config.userAgent = get<std::string>("service.user.agent", config.userAgent);
        try {
            config.authFailureCodes = parseCodeList(get<std::string>("service.auth.failure.codes", ""));
        } catch (const std::invalid_argument &e) {
            Logger::logWarning("[ConfigManager] Ignoring service.auth.failure.codes: " + std::string(e.what()));
        }
        return config;
    }

    EncoderConfig ConfigManager::getEncoderConfig() const {
        EncoderConfig config;
        config.maxImageWidth = get<int>("encoder.image.max.width", config.maxImageWidth);
        config.maxTextLength = static_cast<size_t>(std::max(1, get<int>("encoder.text.max.length", 2000)));
        config.maxRemoteImageBytes = static_cast<size_t>(
            std::max(1, get<int>("encoder.remote.image.max.bytes", static_cast<int>(config.maxRemoteImageBytes))));
        config.imageFetchTimeoutSeconds = get<int>("encoder.image.fetch.timeout", config.imageFetchTimeoutSeconds);
        return config;
    }

    ServerConfig ConfigManager::getServerConfig() const {
        ServerConfig config;
        config.transport = utils::toLower(get<std::string>("server.transport", config.transport));
        if (config.transport == TRANSPORT_SSE_ALIAS) {
            config.transport = "http";
        }
        config.host = get<std::string>("server.host", config.host);
        config.port = get<int>("server.port", config.port);
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.level = get<std::string>("logging.level", config.level);
        config.folder = get<std::string>("logging.folder", config.folder);
        config.fileEnabled = get<bool>("logging.file.enabled", config.fileEnabled);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        // Credentials
        if (utils::trim(get<std::string>("memobird.ak", "")).empty()) {
            result.errors.push_back("Memobird API key is required (--ak or MEMOBIRD_AK)");
        }
        if (utils::trim(get<std::string>("memobird.device.id", "")).empty()) {
            result.errors.push_back("Memobird device ID is required (--did or MEMOBIRD_DEVICE_ID)");
        }

        // Service
        if (get<std::string>("service.api.base.url", "").empty()) {
            result.errors.push_back("service.api.base.url must not be empty");
        }
        for (const char *key: {"service.request.timeout", "service.print.timeout", "service.url.print.timeout",
                               "encoder.image.fetch.timeout"}) {
            if (!isPositive(*this, key)) {
                result.errors.push_back(std::string(key) + " must be > 0");
            }
        }
        try {
            parseCodeList(get<std::string>("service.auth.failure.codes", ""));
        } catch (const std::invalid_argument &e) {
            result.errors.push_back("service.auth.failure.codes: " + std::string(e.what()));
        }

        // Encoder
        if (get<int>("encoder.image.max.width", -1) < 8) {
            result.errors.push_back("encoder.image.max.width must be >= 8");
        }
        if (get<int>("encoder.text.max.length", -1) < 1) {
            result.errors.push_back("encoder.text.max.length must be >= 1");
        }
        if (!isPositive(*this, "encoder.remote.image.max.bytes")) {
            result.errors.push_back("encoder.remote.image.max.bytes must be > 0");
        }

        // Server
        std::string transport = utils::toLower(get<std::string>("server.transport", ""));
        if (transport == TRANSPORT_SSE_ALIAS) {
            Logger::logWarning("[ConfigManager] Transport 'sse' is served as 'http' (JSON-RPC over POST /mcp)");
        } else if (transport != "stdio" && transport != "http") {
            result.errors.push_back("server.transport must be 'stdio', 'http' or 'sse', got '" + transport + "'");
        }
        int port = get<int>("server.port", -1);
        if (port < 1 || port > 65535) {
            result.errors.push_back("server.port must be within 1..65535");
        }

        // Logging
        try {
            Logger::parseLevel(get<std::string>("logging.level", ""));
        } catch (const std::invalid_argument &e) {
            result.errors.push_back("logging.level: " + std::string(e.what()));
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::printConfig() const {
        types::Credentials credentials = getCredentials();
        ServiceConfig service = getServiceConfig();
        EncoderConfig encoder = getEncoderConfig();
        ServerConfig server = getServerConfig();

        Logger::logInfo("[ConfigManager] Final configuration:");
        Logger::logInfo("  API key: " + utils::maskSecret(credentials.apiKey));
        Logger::logInfo("  Device ID: " + credentials.deviceId);
        Logger::logInfo("  API base URL: " + service.apiBaseUrl);
        Logger::logInfo("  Timeouts: request " + std::to_string(service.requestTimeoutSeconds) + "s, print " +
                        std::to_string(service.printTimeoutSeconds) + "s, web page " +
                        std::to_string(service.urlPrintTimeoutSeconds) + "s");
        Logger::logInfo("  Image max width: " + std::to_string(encoder.maxImageWidth) + " px");
        Logger::logInfo("  Text max length: " + std::to_string(encoder.maxTextLength));
        Logger::logInfo("  Transport: " + server.transport +
                        (server.transport == "http" ? " on " + server.host + ":" + std::to_string(server.port) : ""));
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        ServiceConfig service;
        EncoderConfig encoder;
        ServerConfig server;

        config_["memobird.user.identifying"] = "";

        config_["service.api.base.url"] = service.apiBaseUrl;
        config_["service.request.timeout"] = std::to_string(service.requestTimeoutSeconds);
        config_["service.print.timeout"] = std::to_string(service.printTimeoutSeconds);
        config_["service.url.print.timeout"] = std::to_string(service.urlPrintTimeoutSeconds);
        config_["service.auth.failure.codes"] = "";
        config_["service.user.agent"] = service.userAgent;

        config_["encoder.image.max.width"] = std::to_string(encoder.maxImageWidth);
        config_["encoder.text.max.length"] = std::to_string(encoder.maxTextLength);
        config_["encoder.remote.image.max.bytes"] = std::to_string(encoder.maxRemoteImageBytes);
        config_["encoder.image.fetch.timeout"] = std::to_string(encoder.imageFetchTimeoutSeconds);

        config_["server.transport"] = server.transport;
        config_["server.host"] = server.host;
        config_["server.port"] = std::to_string(server.port);

        LoggingConfig logging;
        config_["logging.level"] = logging.level;
        config_["logging.folder"] = logging.folder;
        config_["logging.file.enabled"] = logging.fileEnabled ? "true" : "false";
    }

    std::vector<int> ConfigManager::parseCodeList(const std::string &value) {
        std::string list = utils::trim(value);
        // JSON arrays arrive flattened as "[1,2]"
        if (!list.empty() && list.front() == '[' && list.back() == ']') {
            list = list.substr(1, list.size() - 2);
        }

        std::vector<int> codes;
        for (const std::string &item: utils::split(list, ',')) {
            std::string code = utils::trim(item);
            if (code.empty()) continue;
            size_t consumed = 0;
            int parsed = 0;
            try {
                parsed = std::stoi(code, &consumed);
            } catch (const std::exception &) {
                throw std::invalid_argument("not an integer: '" + code + "'");
            }
            if (consumed != code.size()) {
                throw std::invalid_argument("not an integer: '" + code + "'");
            }
            codes.push_back(parsed);
        }
        return codes;
    }
} // namespace core::config
