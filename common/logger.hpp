#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
//
// Lines carry the calling thread's tag (see LogTag), so output
// from a transfer's worker threads names the owner it serves.
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

// Parse "debug" / "info" / "warn" / "error"; returns fallback on anything else
inline LogLevel parse_log_level(const std::string& s, LogLevel fallback) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info")  return LogLevel::INFO;
    if (s == "warn")  return LogLevel::WARN;
    if (s == "error") return LogLevel::ERR;
    return fallback;
}

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    // Tag prefixed to lines logged from the current thread
    static std::string& thread_tag() {
        thread_local std::string tag;
        return tag;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return level_;
    }

    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
    }

    // Where transfer_error() appends; "" disables it. Opened on first failure.
    void set_transfer_error_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (transfer_err_file_.is_open()) transfer_err_file_.close();
        transfer_err_path_ = path;
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
        (lvl >= LogLevel::WARN ? std::cerr : std::cout) << line << "\n";
        append(file_, line);
    }

    // A failed transfer: logged as an error and kept in the transfer error log
    void transfer_error(OwnerId owner, const std::string& msg) {
        std::string line = format_line(LogLevel::ERR,
                                       "[TRANSFER] owner " + std::to_string(owner) + ": " + msg);
        std::lock_guard<std::mutex> lk(mutex_);
        std::cerr << line << "\n";
        append(file_, line);
        if (transfer_err_path_.empty()) return;
        if (!transfer_err_file_.is_open()) {
            transfer_err_file_.open(transfer_err_path_, std::ios::app);
        }
        append(transfer_err_file_, line);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO), transfer_err_path_("transfer_errors.log") {}

    static void append(std::ofstream& out, const std::string& line) {
        if (!out.is_open()) return;
        out << line << "\n";
        out.flush();
    }

    static std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] ";
        const std::string& tag = thread_tag();
        if (!tag.empty()) ss << "[" << tag << "] ";
        ss << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    mutable std::mutex mutex_;
    LogLevel      level_;
    std::ofstream file_;
    std::string   transfer_err_path_;
    std::ofstream transfer_err_file_;
};

// Sets the current thread's log tag for a scope
class LogTag {
public:
    explicit LogTag(std::string tag) : saved_(std::move(Logger::thread_tag())) {
        Logger::thread_tag() = std::move(tag);
    }
    ~LogTag() { Logger::thread_tag() = std::move(saved_); }

    LogTag(const LogTag&) = delete;
    LogTag& operator=(const LogTag&) = delete;

private:
    std::string saved_;
};

#define LOG_DEBUG(msg) Logger::get().log(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  Logger::get().log(LogLevel::INFO,  msg)
#define LOG_WARN(msg)  Logger::get().log(LogLevel::WARN,  msg)
#define LOG_ERROR(msg) Logger::get().log(LogLevel::ERR,   msg)
