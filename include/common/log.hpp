/*
 * File: include/common/log.hpp
 * Project: Battle Relay
 * Purpose: Leveled logging to stderr
 * Notes:
 *  - Threshold comes from LOG_LEVEL (trace|debug|info|warn|error)
 *  - One line per call, serialized across threads
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel
{
    trace = 0,
    debug,
    info,
    warn,
    error
};

inline std::atomic<int> &log_threshold()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::info)};
    return level;
}

inline std::mutex &log_mutex()
{
    static std::mutex m;
    return m;
}

inline void set_log_level(LogLevel level) { log_threshold().store(static_cast<int>(level)); }

inline bool log_enabled(LogLevel level) { return static_cast<int>(level) >= log_threshold().load(); }

// Unknown names fall back to info.
inline LogLevel parse_log_level(const std::string &s)
{
    if (s == "trace")
        return LogLevel::trace;
    if (s == "debug")
        return LogLevel::debug;
    if (s == "warn" || s == "warning")
        return LogLevel::warn;
    if (s == "error")
        return LogLevel::error;
    return LogLevel::info;
}

inline const char *log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::trace:
        return "TRACE";
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO ";
    case LogLevel::warn:
        return "WARN ";
    case LogLevel::error:
        return "ERROR";
    }
    return "INFO ";
}

// 2026-10-18T14:59:01.234Z
inline std::string log_timestamp()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

template <typename... Args>
void log_write(LogLevel level, const char *tag, const Args &...args)
{
    if (!log_enabled(level))
        return;
    std::ostringstream line;
    line << log_timestamp() << ' ' << log_level_name(level) << ' ' << tag << ": ";
    (line << ... << args);
    line << '\n';
    std::scoped_lock lk(log_mutex());
    std::cerr << line.str();
}

template <typename... Args>
void log_trace(const char *tag, const Args &...args) { log_write(LogLevel::trace, tag, args...); }
template <typename... Args>
void log_debug(const char *tag, const Args &...args) { log_write(LogLevel::debug, tag, args...); }
template <typename... Args>
void log_info(const char *tag, const Args &...args) { log_write(LogLevel::info, tag, args...); }
template <typename... Args>
void log_warn(const char *tag, const Args &...args) { log_write(LogLevel::warn, tag, args...); }
template <typename... Args>
void log_error(const char *tag, const Args &...args) { log_write(LogLevel::error, tag, args...); }
