#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace maestro::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every orchestrator in the process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Tests redirect output to a string stream; the stream must outlive its use.
        void set_output(std::ostream* out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = out != nullptr ? out : &std::cout;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cout;

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
    #define LOG_DEBUG(msg) maestro::core::logging::Logger::get().log(maestro::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  maestro::core::logging::Logger::get().log(maestro::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  maestro::core::logging::Logger::get().log(maestro::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) maestro::core::logging::Logger::get().log(maestro::core::logging::LogLevel::ERROR, msg)

} // namespace maestro::core::logging
