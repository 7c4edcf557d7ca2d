#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace clawchat {

/**
 * @brief Logging levels for clawchat
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
 * @brief Thread-safe process-wide logger
 *
 * Console output goes to stderr only: stdout belongs to the chat
 * transcript printed by the CLI. An append-mode log file can be added.
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

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        if (path.empty()) {
            file_enabled_ = false;
            return true;
        }
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level >= level_ && level_ != LogLevel::NONE;
    }

    void trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, msg); }

    void log(LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_ || level_ == LogLevel::NONE) return;

        std::string formatted = formatMessage(level, msg);

        if (console_enabled_) {
            std::cerr << formatted << std::endl;
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << formatted << std::endl;
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none" || s == "off") return LogLevel::NONE;
        return LogLevel::WARN;
    }

private:
    Logger()
        : level_(LogLevel::WARN)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    static std::string formatMessage(LogLevel level, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&t, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] " << msg;
        return oss.str();
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

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

// Convenience macros
#define CLAWCHAT_LOG_TRACE(msg) clawchat::Logger::instance().trace(msg)
#define CLAWCHAT_LOG_DEBUG(msg) clawchat::Logger::instance().debug(msg)
#define CLAWCHAT_LOG_INFO(msg)  clawchat::Logger::instance().info(msg)
#define CLAWCHAT_LOG_WARN(msg)  clawchat::Logger::instance().warn(msg)
#define CLAWCHAT_LOG_ERROR(msg) clawchat::Logger::instance().error(msg)
#define CLAWCHAT_LOG_FATAL(msg) clawchat::Logger::instance().fatal(msg)

} // namespace clawchat
