#pragma once

#include <cstdio>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "tensordict/config.hpp"

namespace tensordict {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
// Minimal leveled logger writing to stderr. The threshold is read once from
// TENSORDICT_LOG_LEVEL (debug, info, warn, error or off) and can be changed
// at runtime with set_log_level(). Messages use the {fmt} format syntax.
// ---------------------------------------------------------------------------

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

inline LogLevel parse_log_level(const std::string& s) {
    if (s == "debug")
        return LogLevel::Debug;
    if (s == "info")
        return LogLevel::Info;
    if (s == "warn" || s == "warning")
        return LogLevel::Warn;
    if (s == "error")
        return LogLevel::Error;
    if (s == "off" || s == "none")
        return LogLevel::Off;
    return LogLevel::Warn;
}

inline LogLevel& log_threshold() {
    static LogLevel level = parse_log_level(log_level_setting());
    return level;
}

inline void set_log_level(LogLevel level) { log_threshold() = level; }

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(log_threshold());
}

namespace detail {
inline const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Off:
    default:
        return "off";
    }
}
} // namespace detail

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!log_enabled(level))
        return;
    fmt::print(stderr, "[tensordict:{}] {}\n", detail::level_tag(level),
               fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args> void log_debug(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args> void log_info(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Info, format, std::forward<Args>(args)...);
}

template <typename... Args> void log_warn(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args> void log_error(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Error, format, std::forward<Args>(args)...);
}

} // namespace tensordict
