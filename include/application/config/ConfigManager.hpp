//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include "core/config/ClientConfig.hpp"
#include "core/types/PrintContent.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::config {

    /**
     * @brief Parsed command line: config file location plus settings that override every other source.
     */
    struct CommandLineOptions {
        std::string configPath = "config.json";
        std::unordered_map<std::string, std::string> overrides;
        bool showHelp = false;
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration, later sources win
        void loadFromFile(const std::string &configPath = "config.json");

        /**
         * @brief Exports KEY=VALUE lines to the process environment without overriding set variables.
         */
        void loadEnvFile(const std::string &envFilePath = ".env");

        void loadFromEnv();

        void applyOverrides(const std::unordered_map<std::string, std::string> &overrides);

        /**
         * @throws std::invalid_argument on an unknown option or a missing option value.
         */
        static CommandLineOptions parseCommandLine(const std::vector<std::string> &args);

        static std::string usage(const std::string &program);

        // Drops every loaded setting and restores the built-in defaults
        void reset();

        void set(const std::string &key, const std::string &value);

        // Configuration access
        types::Credentials getCredentials() const;

        ServiceConfig getServiceConfig() const;

        EncoderConfig getEncoderConfig() const;

        ServerConfig getServerConfig() const;

        LoggingConfig getLoggingConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

        /**
         * @brief Logs the effective configuration with the API key masked.
         */
        void printConfig() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;

        void setDefaults();

        static std::vector<int> parseCodeList(const std::string &value);
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }
} // namespace core::config
