#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace cuid::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr; stdout is reserved for identifiers.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (tag_.empty() ? "" : "[" + tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string tag_;
        LogLevel min_level_ = LogLevel::INFO;

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

    #define LOG_DEBUG(msg) cuid::core::logging::Logger::get().log(cuid::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  cuid::core::logging::Logger::get().log(cuid::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  cuid::core::logging::Logger::get().log(cuid::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) cuid::core::logging::Logger::get().log(cuid::core::logging::LogLevel::ERROR, msg)

} // namespace cuid::core::logging
