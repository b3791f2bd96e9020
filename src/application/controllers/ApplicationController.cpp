//
// Created by Andrea on 23/08/2025.
//

#include "application/controllers/ApplicationController.hpp"
#include "connector/transport/StdioTransport.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"
#include <iostream>

ApplicationController::ApplicationController()
        : initializationComplete_(false) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize(const core::config::CommandLineOptions &options) {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] STARTING MEMOBIRD BRIDGE");
    Logger::logInfo("===============================================");

    // Step 1: Configuration
    Logger::logInfo("[ApplicationController] [1/3] Loading configuration...");
    if (!loadConfiguration(options)) {
        Logger::logError("[ApplicationController] Configuration invalid");
        return false;
    }

    auto &config = core::config::ConfigManager::getInstance();
    serverConfig_ = config.getServerConfig();
    configureLogging(config.getLoggingConfig());

    // Step 2: Printer client
    Logger::logInfo("[ApplicationController] [2/3] Creating printer client...");
    try {
        core::config::ServiceConfig serviceConfig = config.getServiceConfig();
        httpClient_ = std::make_shared<core::http::CurlHttpTransport>(
                std::chrono::seconds(serviceConfig.requestTimeoutSeconds), serviceConfig.userAgent);
        printerClient_ = std::make_shared<core::client::PrinterClient>(
                httpClient_, config.getCredentials(), serviceConfig, config.getEncoderConfig());
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Printer client initialization failed: " + std::string(e.what()));
        return false;
    }

    // Step 3: Tool endpoint
    Logger::logInfo("[ApplicationController] [3/3] Registering tools...");
    printerTools_ = std::make_unique<connector::tools::PrinterTools>(printerClient_);
    printerTools_->registerWith(registry_);
    handler_ = std::make_unique<connector::protocol::McpHandler>(registry_);

    printInitializationSummary();
    initializationComplete_ = true;
    return true;
}

void ApplicationController::run() {
    if (!initializationComplete_) {
        Logger::logError("[ApplicationController] run() called before a successful initialize()");
        return;
    }

    if (serverConfig_.transport == "http") {
        httpTransport_ = std::make_unique<connector::transport::HttpServerTransport>(
                *handler_, serverConfig_.host, serverConfig_.port);
        httpTransport_->start();
        Logger::logInfo("[ApplicationController] Press Ctrl+C to shutdown gracefully...");
        return;
    }

    connector::transport::StdioTransport stdio(*handler_);
    size_t messages = stdio.run(std::cin, std::cout);
    Logger::logInfo("[ApplicationController] stdio session ended after " + std::to_string(messages) + " message(s)");
}

void ApplicationController::shutdown() {
    if (!initializationComplete_) {
        return;
    }
    initializationComplete_ = false;

    Logger::logInfo("[ApplicationController] Shutting down...");
    if (httpTransport_) {
        httpTransport_->stop();
        httpTransport_.reset();
    }
    handler_.reset();
    printerTools_.reset();
    printerClient_.reset();
    httpClient_.reset();
    Logger::logInfo("[ApplicationController] Shutdown complete");
}

bool ApplicationController::loadConfiguration(const core::config::CommandLineOptions &options) {
    auto &config = core::config::ConfigManager::getInstance();
    config.loadFromFile(options.configPath);
    config.loadEnvFile(".env");
    config.loadFromEnv();
    config.applyOverrides(options.overrides);

    auto validation = config.validate();
    if (!validation.isValid) {
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController]   " + error);
        }
        return false;
    }

    config.printConfig();
    return true;
}

void ApplicationController::configureLogging(const core::config::LoggingConfig &logging) {
    // Validated together with the rest of the configuration
    Logger::setLevel(Logger::parseLevel(logging.level));
    if (logging.fileEnabled) {
        Logger::init(logging.folder);
    } else {
        Logger::logInfo("[ApplicationController] File logging disabled, logging to stderr only");
    }
}

void ApplicationController::printInitializationSummary() {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] INITIALIZATION SUMMARY");
    Logger::logInfo("===============================================");
    Logger::logInfo("  Device: " + printerClient_->session().credentials().deviceId);
    Logger::logInfo("  Tools: " + std::to_string(registry_.size()) + " registered");
    Logger::logInfo("  Transport: " + serverConfig_.transport);
    Logger::logInfo("===============================================");
}
