#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace target_finder::logging {

    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    /**
     * @brief Process-wide minimum level; messages below it are dropped
     */
    inline LogLevel& currentLevel() {
        static LogLevel level = LogLevel::INFO;
        return level;
    }

    inline void setLevel(LogLevel level) {
        currentLevel() = level;
    }

    inline std::string toString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARNING: return "warning";
            case LogLevel::ERROR: return "error";
            default: return "unknown";
        }
    }

    /**
     * @brief Parse a level name ("debug", "info", "warning", "error")
     * @throws std::invalid_argument if the name is not recognized
     */
    inline LogLevel levelFromString(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "info") return LogLevel::INFO;
        if (name == "warning" || name == "warn") return LogLevel::WARNING;
        if (name == "error") return LogLevel::ERROR;
        throw std::invalid_argument("Unknown log level: " + name);
    }

    inline void log(LogLevel level, const std::string& message) {
        if (level < currentLevel()) {
            return;
        }
        switch (level) {
            case LogLevel::DEBUG:
                std::cout << "[DEBUG] " << message << std::endl;
                break;
            case LogLevel::INFO:
                std::cout << "[INFO] " << message << std::endl;
                break;
            case LogLevel::WARNING:
                std::cerr << "[WARNING] " << message << std::endl;
                break;
            case LogLevel::ERROR:
                std::cerr << "[ERROR] " << message << std::endl;
                break;
        }
    }

} // namespace target_finder::logging

#define LOG_DEBUG(msg) ::target_finder::logging::log(::target_finder::logging::LogLevel::DEBUG, (msg))
#define LOG_INFO(msg) ::target_finder::logging::log(::target_finder::logging::LogLevel::INFO, (msg))
#define LOG_WARNING(msg) ::target_finder::logging::log(::target_finder::logging::LogLevel::WARNING, (msg))
#define LOG_ERROR(msg) ::target_finder::logging::log(::target_finder::logging::LogLevel::ERROR, (msg))
