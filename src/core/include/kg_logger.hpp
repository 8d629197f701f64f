#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace kg {

/**
 * @brief Logging levels for knockgate
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe logger shared by listeners, tracker and gate
 *
 * Every line carries a timestamp, level and component tag:
 *   2024-01-01 12:00:00.123 [INFO ] [tracker] Knock 1/3 from 10.0.0.5 on 1234
 * Listener threads and firewall workers log concurrently, so all sinks
 * are written under one mutex.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level >= level_;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_enabled_ = false;
        if (path.empty()) return true;
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    void log(LogLevel level, const std::string& component, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_) return;

        std::string formatted = formatMessage(level, component, msg);

        if (console_enabled_) {
            if (level >= LogLevel::WARN) {
                std::cerr << formatted << std::endl;
            } else {
                std::cout << formatted << std::endl;
            }
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << formatted << '\n';
            file_.flush();
        }
    }

    /// Parses "trace".."none"; returns false on an unknown name.
    static bool levelFromString(const std::string& s, LogLevel& out) {
        if (s == "trace") { out = LogLevel::TRACE; return true; }
        if (s == "debug") { out = LogLevel::DEBUG; return true; }
        if (s == "info")  { out = LogLevel::INFO;  return true; }
        if (s == "warn" || s == "warning") { out = LogLevel::WARN; return true; }
        if (s == "error") { out = LogLevel::ERROR; return true; }
        if (s == "fatal") { out = LogLevel::FATAL; return true; }
        if (s == "none")  { out = LogLevel::NONE;  return true; }
        return false;
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

private:
    Logger()
        : level_(LogLevel::INFO)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    static std::string formatMessage(LogLevel level, const std::string& component,
                                     const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] [" << component << "] " << msg;
        return oss.str();
    }

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

// Convenience macros
#define KG_LOG_TRACE(component, msg) ::kg::Logger::instance().log(::kg::LogLevel::TRACE, component, msg)
#define KG_LOG_DEBUG(component, msg) ::kg::Logger::instance().log(::kg::LogLevel::DEBUG, component, msg)
#define KG_LOG_INFO(component, msg)  ::kg::Logger::instance().log(::kg::LogLevel::INFO,  component, msg)
#define KG_LOG_WARN(component, msg)  ::kg::Logger::instance().log(::kg::LogLevel::WARN,  component, msg)
#define KG_LOG_ERROR(component, msg) ::kg::Logger::instance().log(::kg::LogLevel::ERROR, component, msg)
#define KG_LOG_FATAL(component, msg) ::kg::Logger::instance().log(::kg::LogLevel::FATAL, component, msg)

} // namespace kg
