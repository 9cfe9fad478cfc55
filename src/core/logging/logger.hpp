#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace mcplink::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // One logger for the whole process. Records go to stderr so stdout
    // stays free for command output.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_scope(const std::string& scope) {
            std::lock_guard<std::mutex> lock(mutex_);
            scope_ = scope;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            std::cerr << "[" << level_to_string(level) << "] "
                      << (scope_.empty() ? "" : "[" + scope_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string scope_;
        LogLevel min_level_ = LogLevel::INFO;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) mcplink::core::logging::Logger::get().log(mcplink::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  mcplink::core::logging::Logger::get().log(mcplink::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  mcplink::core::logging::Logger::get().log(mcplink::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) mcplink::core::logging::Logger::get().log(mcplink::core::logging::LogLevel::ERROR, msg)

} // namespace mcplink::core::logging
