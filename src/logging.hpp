#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace logging {

// Logging verbosity levels
enum class LogLevel {
  TRACE,
  DEBUG,
  INFO,
  WARN,
  ERROR,
  CRITICAL,
  OFF,
  QUIET,
  NORMAL,
  VERBOSE
};

// Global verbosity level
static LogLevel loggingLevel = LogLevel::INFO;
static bool spdlogInitialized = false;

inline spdlog::level::level_enum toSpdlogLevel(LogLevel customLevel) {
    switch (customLevel) {
        case LogLevel::TRACE:   return spdlog::level::trace;
        case LogLevel::DEBUG:   return spdlog::level::debug;
        case LogLevel::INFO:    return spdlog::level::info;
        case LogLevel::WARN:    return spdlog::level::warn;
        case LogLevel::ERROR:   return spdlog::level::err;
        case LogLevel::CRITICAL:return spdlog::level::critical;
        case LogLevel::OFF:     return spdlog::level::off;
        case LogLevel::QUIET:   return spdlog::level::err;
        case LogLevel::NORMAL:  return spdlog::level::info;
        case LogLevel::VERBOSE: return spdlog::level::debug;
        default:                return spdlog::level::info;
    }
}

// Initialize spdlog
inline void initSpdlog() {
    if (!spdlogInitialized) {
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");

        if (!spdlog::default_logger()) {
            auto logger = spdlog::stdout_color_mt("console");
            spdlog::set_default_logger(logger);
        }

        spdlog::set_level(toSpdlogLevel(loggingLevel));
        spdlogInitialized = true;
    }
}

inline void setLoggingLevel(LogLevel level) {
    loggingLevel = level;
    spdlog::set_level(toSpdlogLevel(level));
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::debug(fmt, std::forward<Args>(args)...);
}

inline void debug(const std::string& msg) {
  spdlog::debug(msg);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::info(fmt, std::forward<Args>(args)...);
}

inline void info(const std::string& msg) {
  spdlog::info(msg);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void err(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::error(fmt, std::forward<Args>(args)...);
}

inline void err(const std::string& msg) {
  spdlog::error(msg);
}

// Regular messages (normal level)
template <typename... Args>
inline void msg(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::info(fmt, std::forward<Args>(args)...);
}

inline void msg(const std::string& message) {
  spdlog::info(message);
}

} // namespace logging
