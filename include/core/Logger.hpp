#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe console logger shared by the service threads.
 *
 * DEBUG/INFO go to stdout, WARN/ERROR to stderr. Messages below the
 * configured level return before formatting, so DEBUG calls on the
 * tick path cost one atomic load when running at INFO.
 * ERROR is never filtered.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        out << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  out << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  out << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: out << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        out << message << std::endl;
    }

    static void setLevel(LogLevel level) { level_ = level; }
    static LogLevel getLevel() { return level_; }
    static bool enabled(LogLevel level) { return level == LogLevel::ERROR || level >= level_.load(); }

    /**
     * Parse "debug" / "info" / "warn" / "error".
     * Returns false and leaves `out` untouched for anything else.
     */
    static bool parseLevel(const std::string& name, LogLevel& out) {
        if (name == "debug") { out = LogLevel::DEBUG; return true; }
        if (name == "info")  { out = LogLevel::INFO;  return true; }
        if (name == "warn")  { out = LogLevel::WARN;  return true; }
        if (name == "error") { out = LogLevel::ERROR; return true; }
        return false;
    }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO:  return "info";
            case LogLevel::WARN:  return "warn";
            case LogLevel::ERROR: return "error";
        }
        return "info";
    }

    template<typename... Args>
    static void debug(Args... args) { write(LogLevel::DEBUG, args...); }

    template<typename... Args>
    static void info(Args... args) { write(LogLevel::INFO, args...); }

    template<typename... Args>
    static void warn(Args... args) { write(LogLevel::WARN, args...); }

    template<typename... Args>
    static void error(Args... args) { write(LogLevel::ERROR, args...); }

private:
    template<typename... Args>
    static void write(LogLevel level, const Args&... args) {
        if (!enabled(level)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

    inline static std::mutex mutex_;
    inline static std::atomic<LogLevel> level_{LogLevel::INFO};
};

} // namespace core
