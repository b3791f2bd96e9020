#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
    volatile std::sig_atomic_t stopSignal = 0;

    void onStopSignal(int signal) {
        stopSignal = signal;
    }

    // Only the http transport runs in the background; stdio sessions end with their input
    void serveUntilStopped() {
        std::signal(SIGINT, onStopSignal);
        std::signal(SIGTERM, onStopSignal);
        while (stopSignal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        Logger::logInfo("Received shutdown signal: " + std::to_string(stopSignal));
    }

    int runBridge(const core::config::CommandLineOptions &options) {
        ApplicationController app;
        if (!app.initialize(options)) {
            Logger::logError("Application initialization failed");
            return 1;
        }

        app.run();
        if (app.isServing()) {
            serveUntilStopped();
        }
        app.shutdown();
        return 0;
    }
}

int main(int argc, char **argv) {
    core::config::CommandLineOptions options;
    try {
        options = core::config::ConfigManager::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << "\n" << core::config::ConfigManager::usage(argv[0]);
        return 1;
    }
    if (options.showHelp) {
        std::cerr << core::config::ConfigManager::usage(argv[0]);
        return 0;
    }

    int exitCode = 0;
    try {
        exitCode = runBridge(options);
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
