/**
 * sqlnav/errors.hpp - Error taxonomy
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Adapters fold their native error codes into two kinds:
 *   - ConnectivityError: the handle is unusable (network drop, auth
 *     failure, unreadable file). The active pool must be reopened.
 *   - QueryError: one statement failed, the handle is still good.
 * ConfigError is raised before the interactive loop starts.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sqlnav {

enum class ErrorKind {
    None,
    Connectivity,
    Query
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

class ConnectivityError : public Error {
public:
    explicit ConnectivityError(const std::string& msg) : Error(msg) {}
};

class QueryError : public Error {
public:
    explicit QueryError(const std::string& msg) : Error(msg) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

} // namespace sqlnav
