//
// Created by redeg on 26/04/2025.
//

#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Process-wide logger.
 *
 * Every level goes to stderr: stdout is owned by the stdio tool transport.
 * After init() lines are mirrored to a rotating file under the logs folder.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    /**
     * @brief Opens the file sink and starts the retention cleanup thread.
     */
    static void init(const std::string &logsFolder = "logs");

    static void shutdown();

    static void setLevel(Level level);

    static Level level();

    /**
     * @throws std::invalid_argument unless @p name is DEBUG, INFO, WARNING or ERROR (any case).
     */
    static Level parseLevel(const std::string &name);

    static std::string levelName(Level level);

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::mutex logMutex_;
    static std::ofstream logFile_;
    static std::string logsFolder_;
    static size_t fileBytes_;
    static std::atomic<Level> minLevel_;
    static std::thread cleanupThread_;
    static std::atomic<bool> stopCleanup_;

    static void write(Level level, const std::string &message);

    static void openNextFile();

    static void pruneLogs(const std::string &folder);

    static std::string formatTime(const char *pattern);
};
