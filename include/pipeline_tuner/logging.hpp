#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace pipeline_tuner::logging {

    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    inline std::atomic<int>& minimumLevel() {
        static std::atomic<int> level{static_cast<int>(LogLevel::INFO)};
        return level;
    }

    inline void setLogLevel(LogLevel level) {
        minimumLevel().store(static_cast<int>(level));
    }

    inline LogLevel getLogLevel() {
        return static_cast<LogLevel>(minimumLevel().load());
    }

    inline LogLevel logLevelFromString(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (str == "debug") return LogLevel::DEBUG;
        if (str == "warning" || str == "warn") return LogLevel::WARNING;
        if (str == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    inline const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            default: return "LOG";
        }
    }

    inline std::string currentTimestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    inline void log(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) < minimumLevel().load()) {
            return;
        }
        std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
        out << "[" << currentTimestamp() << "] [" << levelTag(level) << "] " << message << std::endl;
    }

} // namespace pipeline_tuner::logging

#define LOG_DEBUG(msg) ::pipeline_tuner::logging::log(::pipeline_tuner::logging::LogLevel::DEBUG, (msg))
#define LOG_INFO(msg) ::pipeline_tuner::logging::log(::pipeline_tuner::logging::LogLevel::INFO, (msg))
#define LOG_WARNING(msg) ::pipeline_tuner::logging::log(::pipeline_tuner::logging::LogLevel::WARNING, (msg))
#define LOG_ERROR(msg) ::pipeline_tuner::logging::log(::pipeline_tuner::logging::LogLevel::ERROR, (msg))
