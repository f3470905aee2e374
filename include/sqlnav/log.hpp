/**
 * sqlnav/log.hpp - Logging seam
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Library components never write to the terminal (it belongs to the
 * renderer). They report through a caller-installed callback instead:
 *
 *   orchestrator.set_log_func([](sqlnav::LogLevel lvl, const std::string& msg) {
 *       my_logger.log(lvl, msg);
 *   });
 *
 * With no callback installed, nothing is logged.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>

namespace sqlnav {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

using log_func_t = std::function<void(LogLevel, const std::string&)>;

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "info";
}

inline std::optional<LogLevel> parse_log_level(const std::string& name) {
    for (LogLevel l : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (name == log_level_name(l)) return l;
    }
    return std::nullopt;
}

} // namespace sqlnav
