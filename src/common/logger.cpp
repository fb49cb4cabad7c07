#include "common/logger.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <filesystem>
#include <cstring>  // for strerror
#include <cerrno>   // for errno

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
std::string Logger::logPath_;

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        std::cerr << "Logger already initialized" << std::endl;
        return false;
    }

    if (!logPath.empty()) {
        try {
            std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
            if (!logDir.empty() && !std::filesystem::exists(logDir)) {
                std::filesystem::create_directories(logDir);
            }
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Failed to create log directory: " << e.what() << std::endl;
            return false;
        }

        // Make sure the file is writable before accepting it
        FILE* testFile = fopen(logPath.c_str(), "a");
        if (!testFile) {
            std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
            return false;
        }
        fclose(testFile);
    }

    logPath_ = logPath;
    currentLevel_ = level;
    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
    logPath_.clear();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < currentLevel_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");

    std::string logMessage = ss.str() + " [" + levelToString(level) + "] " + message + "\n";

    if (level >= LogLevel::ERROR) {
        std::cerr << logMessage;
        std::cerr.flush();
    } else {
        std::cout << logMessage;
        std::cout.flush();
    }

    if (logPath_.empty()) {
        return;
    }

    FILE* logFile = fopen(logPath_.c_str(), "a");
    if (logFile) {
        fprintf(logFile, "%s", logMessage.c_str());
        fflush(logFile);
        fclose(logFile);
    } else {
        std::cerr << "Failed to open log file: " << strerror(errno) << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}
