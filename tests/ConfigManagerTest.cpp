#include <gtest/gtest.h>
#include "application/config/ConfigManager.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using core::config::ConfigManager;

namespace {
    const char *MANAGED_VARIABLES[] = {
            "MEMOBIRD_AK", "MEMOBIRD_DEVICE_ID", "MEMOBIRD_TRANSPORT", "MEMOBIRD_HTTP_PORT",
            "MEMOBIRD_AUTH_FAILURE_CODES", "MEMOBIRD_TEXT_MAX_LENGTH"
    };

    std::string writeTempFile(const std::string &name, const std::string &content) {
        std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
}

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager &config = ConfigManager::getInstance();

    void SetUp() override {
        for (const char *name: MANAGED_VARIABLES) {
            unsetenv(name);
        }
        config.reset();
    }

    void TearDown() override {
        for (const char *name: MANAGED_VARIABLES) {
            unsetenv(name);
        }
        config.reset();
    }

    bool hasError(const std::string &fragment) const {
        for (const auto &error: config.validate().errors) {
            if (error.find(fragment) != std::string::npos) return true;
        }
        return false;
    }
};

TEST_F(ConfigManagerTest, DefaultsMatchBuiltInValues) {
    auto service = config.getServiceConfig();
    EXPECT_EQ(service.apiBaseUrl, "http://open.memobird.cn/home");
    EXPECT_EQ(service.requestTimeoutSeconds, 15);
    EXPECT_TRUE(service.authFailureCodes.empty());

    auto encoder = config.getEncoderConfig();
    EXPECT_EQ(encoder.maxImageWidth, 384);
    EXPECT_EQ(encoder.maxTextLength, 2000u);

    auto server = config.getServerConfig();
    EXPECT_EQ(server.transport, "stdio");
    EXPECT_EQ(server.port, 8000);
}

TEST_F(ConfigManagerTest, CredentialsAreRequired) {
    auto result = config.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(hasError("API key"));
    EXPECT_TRUE(hasError("device ID"));

    config.set("memobird.ak", "key");
    config.set("memobird.device.id", "device");
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, BlankCredentialsAreRejected) {
    config.set("memobird.ak", "   ");
    config.set("memobird.device.id", "device");
    EXPECT_TRUE(hasError("API key"));
}

TEST_F(ConfigManagerTest, ValidationReportsBadValues) {
    config.set("memobird.ak", "key");
    config.set("memobird.device.id", "device");
    config.set("server.transport", "websocket");
    config.set("server.port", "70000");
    config.set("encoder.image.max.width", "4");
    config.set("service.print.timeout", "0");
    config.set("service.auth.failure.codes", "1,abc");

    auto result = config.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 5u);
    EXPECT_TRUE(hasError("server.transport"));
    EXPECT_TRUE(hasError("server.port"));
    EXPECT_TRUE(hasError("encoder.image.max.width"));
    EXPECT_TRUE(hasError("service.print.timeout"));
    EXPECT_TRUE(hasError("service.auth.failure.codes"));
}

TEST_F(ConfigManagerTest, AuthFailureCodesAcceptListForms) {
    config.set("service.auth.failure.codes", "-3, 401");
    EXPECT_EQ(config.getServiceConfig().authFailureCodes, (std::vector<int>{-3, 401}));

    config.set("service.auth.failure.codes", "[5,6]");
    EXPECT_EQ(config.getServiceConfig().authFailureCodes, (std::vector<int>{5, 6}));

    config.set("service.auth.failure.codes", "5x");
    EXPECT_TRUE(config.getServiceConfig().authFailureCodes.empty());
}

TEST_F(ConfigManagerTest, LoadsNestedJsonFile) {
    std::string path = writeTempFile("memobird_config_test.json", R"({
        "memobird": {"ak": "file-key", "device": {"id": "file-device"}},
        "service": {"print": {"timeout": 45}, "auth": {"failure": {"codes": [7, 8]}}},
        "server": {"transport": "HTTP", "port": 9100}
    })");

    config.loadFromFile(path);

    auto credentials = config.getCredentials();
    EXPECT_EQ(credentials.apiKey, "file-key");
    EXPECT_EQ(credentials.deviceId, "file-device");
    EXPECT_EQ(config.getServiceConfig().printTimeoutSeconds, 45);
    EXPECT_EQ(config.getServiceConfig().authFailureCodes, (std::vector<int>{7, 8}));
    EXPECT_EQ(config.getServerConfig().transport, "http");
    EXPECT_EQ(config.getServerConfig().port, 9100);
    std::filesystem::remove(path);
}

TEST_F(ConfigManagerTest, MissingOrBrokenFileKeepsDefaults) {
    config.loadFromFile("/nonexistent/memobird.json");
    std::string path = writeTempFile("memobird_broken_test.json", "{ not json");
    config.loadFromFile(path);

    EXPECT_EQ(config.getServerConfig().port, 8000);
    std::filesystem::remove(path);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    std::string path = writeTempFile("memobird_env_test.json", R"({"memobird": {"ak": "file-key"}})");
    setenv("MEMOBIRD_AK", "env-key", 1);
    setenv("MEMOBIRD_HTTP_PORT", "8123", 1);

    config.loadFromFile(path);
    config.loadFromEnv();

    EXPECT_EQ(config.getCredentials().apiKey, "env-key");
    EXPECT_EQ(config.getServerConfig().port, 8123);
    std::filesystem::remove(path);
}

TEST_F(ConfigManagerTest, EmptyEnvironmentValueIsIgnored) {
    config.set("memobird.ak", "configured");
    setenv("MEMOBIRD_AK", "", 1);
    config.loadFromEnv();
    EXPECT_EQ(config.getCredentials().apiKey, "configured");
}

TEST_F(ConfigManagerTest, EnvFileDoesNotOverrideProcessEnvironment) {
    setenv("MEMOBIRD_AK", "from-shell", 1);
    std::string path = writeTempFile("memobird_test.env",
                                     "# comment\n"
                                     "MEMOBIRD_AK=from-file\n"
                                     "export MEMOBIRD_DEVICE_ID=\"quoted device\"\n"
                                     "not a pair\n");

    config.loadEnvFile(path);
    config.loadFromEnv();

    auto credentials = config.getCredentials();
    EXPECT_EQ(credentials.apiKey, "from-shell");
    EXPECT_EQ(credentials.deviceId, "quoted device");
    std::filesystem::remove(path);
}

TEST_F(ConfigManagerTest, OverridesWinOverEnvironment) {
    setenv("MEMOBIRD_TRANSPORT", "stdio", 1);
    config.loadFromEnv();
    config.applyOverrides({{"server.transport", "http"}});
    EXPECT_EQ(config.getServerConfig().transport, "http");
}

TEST_F(ConfigManagerTest, SseTransportIsServedOverHttp) {
    config.set("memobird.ak", "key");
    config.set("memobird.device.id", "device");
    config.applyOverrides(ConfigManager::parseCommandLine({"-t", "SSE"}).overrides);

    EXPECT_TRUE(config.validate().isValid);
    EXPECT_EQ(config.getServerConfig().transport, "http");
}

TEST_F(ConfigManagerTest, ParsesCommandLineAliases) {
    auto options = ConfigManager::parseCommandLine(
            {"--access_key", "key", "--did", "device", "-t", "http", "-p", "9000", "--host", "0.0.0.0"});

    EXPECT_FALSE(options.showHelp);
    EXPECT_EQ(options.configPath, "config.json");
    EXPECT_EQ(options.overrides.at("memobird.ak"), "key");
    EXPECT_EQ(options.overrides.at("memobird.device.id"), "device");
    EXPECT_EQ(options.overrides.at("server.transport"), "http");
    EXPECT_EQ(options.overrides.at("server.port"), "9000");
    EXPECT_EQ(options.overrides.at("server.host"), "0.0.0.0");
}

TEST_F(ConfigManagerTest, ParsesInlineValuesAndConfigPath) {
    auto options = ConfigManager::parseCommandLine({"--ak=a=b", "--config=/etc/memobird.json", "--help"});

    EXPECT_TRUE(options.showHelp);
    EXPECT_EQ(options.configPath, "/etc/memobird.json");
    EXPECT_EQ(options.overrides.at("memobird.ak"), "a=b");
}

TEST_F(ConfigManagerTest, RejectsUnknownOptionsAndMissingValues) {
    EXPECT_THROW(ConfigManager::parseCommandLine({"--verbose"}), std::invalid_argument);
    EXPECT_THROW(ConfigManager::parseCommandLine({"--ak"}), std::invalid_argument);
}

TEST_F(ConfigManagerTest, TypedGettersFallBackOnBadValues) {
    config.set("server.port", "eighty");
    EXPECT_EQ(config.get<int>("server.port", 42), 42);
    EXPECT_EQ(config.get<std::string>("missing.key", "fallback"), "fallback");
    config.set("feature.flag", "1");
    EXPECT_TRUE(config.get<bool>("feature.flag", false));
}

TEST_F(ConfigManagerTest, LoggingSettings) {
    auto logging = config.getLoggingConfig();
    EXPECT_EQ(logging.level, "INFO");
    EXPECT_TRUE(logging.fileEnabled);

    auto options = ConfigManager::parseCommandLine({"--log-level", "debug"});
    config.applyOverrides(options.overrides);
    config.set("logging.file.enabled", "false");
    EXPECT_EQ(config.getLoggingConfig().level, "debug");
    EXPECT_FALSE(config.getLoggingConfig().fileEnabled);

    config.set("memobird.ak", "key");
    config.set("memobird.device.id", "device");
    EXPECT_TRUE(config.validate().isValid);
    config.set("logging.level", "verbose");
    EXPECT_TRUE(hasError("logging.level"));
}
