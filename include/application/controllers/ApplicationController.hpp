//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <memory>
#include <atomic>

// Core includes
#include "core/client/PrinterClient.hpp"
#include "core/http/impl/CurlHttpTransport.hpp"

// Connector includes
#include "connector/protocol/McpHandler.hpp"
#include "connector/registry/ToolRegistry.hpp"
#include "connector/tools/PrinterTools.hpp"
#include "connector/transport/HttpServerTransport.hpp"
#include "application/config/ConfigManager.hpp"


/**
 * @class ApplicationController
 * @brief Main application controller for the Memobird bridge
 *
 * Wires the configuration, the printer client and the tool endpoint together,
 * then serves tool calls over the configured transport (stdio or http).
 */
class ApplicationController {
public:
    ApplicationController();

    ~ApplicationController();

    /**
     * @brief Load configuration and build every component
     *
     * Initialization sequence:
     * 1. Configuration (defaults, file, .env, environment, command line), validation and logging
     * 2. HTTP transport and printer client
     * 3. Tool registry and protocol handler
     *
     * @return true if initialization successful, false otherwise
     */
    bool initialize(const core::config::CommandLineOptions &options);

    /**
     * @brief Serve tool calls
     *
     * stdio: blocks until the input is closed and every request has been answered.
     * http: starts the server in the background and returns.
     */
    void run();

    /**
     * @brief true while a background transport is serving
     */
    bool isServing() const { return httpTransport_ != nullptr; }

    /**
     * @brief Shutdown the application gracefully
     */
    void shutdown();

private:
    // ========== Configuration ==========
    core::config::ServerConfig serverConfig_;

    // ========== Printer Client ==========
    std::shared_ptr<core::http::CurlHttpTransport> httpClient_;
    std::shared_ptr<core::client::PrinterClient> printerClient_;

    // ========== Tool Endpoint ==========
    connector::ToolRegistry registry_;
    std::unique_ptr<connector::tools::PrinterTools> printerTools_;
    std::unique_ptr<connector::protocol::McpHandler> handler_;
    std::unique_ptr<connector::transport::HttpServerTransport> httpTransport_;

    // ========== State Management ==========
    std::atomic<bool> initializationComplete_;

    bool loadConfiguration(const core::config::CommandLineOptions &options);

    void configureLogging(const core::config::LoggingConfig &logging);

    void printInitializationSummary();
};
