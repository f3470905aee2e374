#include "logging.hpp"

#include <sqlnav/errors.hpp>

#include <spdlog/sinks/basic_file_sink.h>

#include <filesystem>
#include <system_error>

namespace sqlnav::tool {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_file_logger(const std::string& path, LogLevel level) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw ConfigError("cannot create log directory " + p.parent_path().string() + ": " + ec.message());
        }
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        logger = std::make_shared<spdlog::logger>("sqlnav", sink);
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigError("cannot open log file " + path + ": " + e.what());
    }
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [%t] %v");
    logger->set_level(to_spdlog(level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

log_func_t forward_to(std::shared_ptr<spdlog::logger> logger) {
    return [logger](LogLevel level, const std::string& msg) {
        logger->log(to_spdlog(level), "{}", msg);
    };
}

} // namespace sqlnav::tool
