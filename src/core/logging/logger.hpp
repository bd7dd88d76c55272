#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace taskpilot::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Shared by every orchestration in the process. A line carries the calling
    // thread's scoped request id, or the process id when no scope is open.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_request_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            request_id_ = id;
        }

        std::string current_request_id() {
            if (!scoped_id().empty()) {
                return scoped_id();
            }
            std::lock_guard<std::mutex> lock(mutex_);
            return request_id_;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            const std::string& id = scoped_id().empty() ? request_id_ : scoped_id();
            std::ostream& out = level == LogLevel::ERROR ? std::cerr : std::clog;
            out << "[" << level_to_string(level) << "] "
                << (id.empty() ? "" : "[" + id + "] ")
                << message << std::endl;
        }

    private:
        friend class RequestScope;

        Logger() = default;

        static std::string& scoped_id() {
            thread_local std::string id;
            return id;
        }

        std::mutex mutex_;
        std::string request_id_;
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

    // Tags this thread's log lines with `id` until the scope closes.
    class RequestScope {
    public:
        explicit RequestScope(const std::string& id) : previous_(Logger::scoped_id()) {
            Logger::scoped_id() = id;
        }
        ~RequestScope() { Logger::scoped_id() = previous_; }

        RequestScope(const RequestScope&) = delete;
        RequestScope& operator=(const RequestScope&) = delete;

    private:
        std::string previous_;
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) taskpilot::core::logging::Logger::get().log(taskpilot::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  taskpilot::core::logging::Logger::get().log(taskpilot::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  taskpilot::core::logging::Logger::get().log(taskpilot::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) taskpilot::core::logging::Logger::get().log(taskpilot::core::logging::LogLevel::ERROR, msg)

} // namespace taskpilot::core::logging
