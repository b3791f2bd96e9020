//
// Created by redeg on 26/04/2025.
//

#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

std::mutex Logger::logMutex_;
std::ofstream Logger::logFile_;
std::string Logger::logsFolder_ = "logs";
size_t Logger::fileBytes_ = 0;
std::atomic<Logger::Level> Logger::minLevel_{Logger::Level::Info};
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::stopCleanup_{false};

namespace {
    constexpr size_t ROTATE_AT_BYTES = 50 * 1024 * 1024;
    constexpr size_t KEEP_FILES = 10;
    constexpr std::chrono::hours KEEP_FOR{24 * 7};
    constexpr std::chrono::hours PRUNE_EVERY{1};
    constexpr const char *FILE_PREFIX = "memobird_bridge_";

    std::mutex pruneMutex;
    std::condition_variable pruneWakeup;

    std::chrono::system_clock::time_point toSystemTime(fs::file_time_type stamp) {
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                stamp - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    }
}

void Logger::init(const std::string &logsFolder) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        logsFolder_ = logsFolder;
        openNextFile();
    }

    stopCleanup_ = false;
    if (!cleanupThread_.joinable()) {
        cleanupThread_ = std::thread([folder = logsFolder]() {
            std::unique_lock<std::mutex> lock(pruneMutex);
            do {
                lock.unlock();
                pruneLogs(folder);
                lock.lock();
            } while (!pruneWakeup.wait_for(lock, PRUNE_EVERY, [] { return stopCleanup_.load(); }));
        });
    }

    logInfo("[Logger] Writing to " + logsFolder + " (rotation at " +
            std::to_string(ROTATE_AT_BYTES / 1024 / 1024) + "MB, level " + levelName(level()) + ")");
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pruneMutex);
        stopCleanup_ = true;
    }
    pruneWakeup.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }

    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setLevel(Level level) {
    minLevel_ = level;
}

Logger::Level Logger::level() {
    return minLevel_;
}

Logger::Level Logger::parseLevel(const std::string &name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return Level::Debug;
    if (upper == "INFO") return Level::Info;
    if (upper == "WARNING" || upper == "WARN") return Level::Warning;
    if (upper == "ERROR") return Level::Error;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

std::string Logger::levelName(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARNING";
        case Level::Error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

void Logger::logDebug(const std::string &message) {
    write(Level::Debug, message);
}

void Logger::logInfo(const std::string &message) {
    write(Level::Info, message);
}

void Logger::logWarning(const std::string &message) {
    write(Level::Warning, message);
}

void Logger::logError(const std::string &message) {
    write(Level::Error, message);
}

void Logger::write(Level level, const std::string &message) {
    if (level < minLevel_ || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string line = "[" + levelName(level) + "] [" + formatTime("%Y-%m-%d %H:%M:%S") + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    std::cerr << line << std::endl;

    if (!logFile_.is_open()) {
        return;
    }
    if (fileBytes_ > ROTATE_AT_BYTES) {
        openNextFile();
        if (!logFile_.is_open()) return;
    }
    logFile_ << line << '\n';
    logFile_.flush();
    fileBytes_ += line.size() + 1;
}

void Logger::openNextFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
    fileBytes_ = 0;

    std::string path;
    try {
        fs::create_directories(logsFolder_);
        path = (fs::path(logsFolder_) / (FILE_PREFIX + formatTime("%Y%m%d_%H%M%S") + ".log")).string();
    } catch (const fs::filesystem_error &e) {
        std::cerr << "[Logger] Cannot create logs folder " << logsFolder_ << ": " << e.what() << std::endl;
        return;
    }

    // Two rotations within one second would reuse the name
    logFile_.open(path, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Cannot open log file " << path << std::endl;
    }
}

void Logger::pruneLogs(const std::string &folder) {
    try {
        if (!fs::is_directory(folder)) return;

        auto oldest = std::chrono::system_clock::now() - KEEP_FOR;
        std::vector<std::pair<fs::file_time_type, fs::path>> kept;

        for (const auto &entry: fs::directory_iterator(folder)) {
            const fs::path &path = entry.path();
            if (path.extension() != ".log" || path.filename().string().rfind(FILE_PREFIX, 0) != 0) {
                continue;
            }
            fs::file_time_type written = fs::last_write_time(path);
            if (toSystemTime(written) < oldest) {
                fs::remove(path);
            } else {
                kept.emplace_back(written, path);
            }
        }

        if (kept.size() > KEEP_FILES) {
            std::sort(kept.begin(), kept.end());
            for (size_t i = 0; i + KEEP_FILES < kept.size(); ++i) {
                fs::remove(kept[i].second);
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "[Logger] Log cleanup failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTime(const char *pattern) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream out;
    out << std::put_time(&local, pattern);
    return out.str();
}
