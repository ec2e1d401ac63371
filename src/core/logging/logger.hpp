#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace toolmux::core::logging {

    // 1. Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Stdout is reserved for command output, so logs default to stderr.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Reader threads log concurrently
            if (level < min_level_) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cerr;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) toolmux::core::logging::Logger::get().log(toolmux::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  toolmux::core::logging::Logger::get().log(toolmux::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  toolmux::core::logging::Logger::get().log(toolmux::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) toolmux::core::logging::Logger::get().log(toolmux::core::logging::LogLevel::ERROR, msg)

} // namespace toolmux::core::logging
