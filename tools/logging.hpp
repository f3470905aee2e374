#pragma once
/*
 * Logging
 *
 * The library reports through log_func_t; the program sends it to a
 * file through spdlog, since the terminal itself is taken by ncurses.
 */
#include <sqlnav/log.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace sqlnav::tool {

spdlog::level::level_enum to_spdlog(LogLevel level);

/**
 * File logger at `path` (parent directories are created).
 * @throws ConfigError when the file cannot be opened
 */
std::shared_ptr<spdlog::logger> make_file_logger(const std::string& path, LogLevel level);

log_func_t forward_to(std::shared_ptr<spdlog::logger> logger);

} // namespace sqlnav::tool
