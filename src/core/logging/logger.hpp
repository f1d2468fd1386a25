#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace callplan::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to std::clog so stdout stays free for plan output.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_batch_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            batch_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (batch_id_.empty() ? "" : "[" + batch_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string batch_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define CALLPLAN_LOG_DEBUG(msg) callplan::core::logging::Logger::get().log(callplan::core::logging::LogLevel::DEBUG, msg)
    #define CALLPLAN_LOG_INFO(msg)  callplan::core::logging::Logger::get().log(callplan::core::logging::LogLevel::INFO, msg)
    #define CALLPLAN_LOG_WARN(msg)  callplan::core::logging::Logger::get().log(callplan::core::logging::LogLevel::WARN, msg)
    #define CALLPLAN_LOG_ERROR(msg) callplan::core::logging::Logger::get().log(callplan::core::logging::LogLevel::ERROR, msg)

} // namespace callplan::core::logging
