/**
 * sqlnav/backends/connect.hpp - Open a Pool for a configured Connection
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * MySQL support is optional at build time. Enable with the
 * SQLNAV_WITH_MYSQL CMake option (defines SQLNAV_HAS_MYSQL when the
 * client library is found).
 */

#pragma once

#include "../pool.hpp"
#include "postgres_pool.hpp"
#include "sqlite_pool.hpp"

#ifdef SQLNAV_HAS_MYSQL
#include "mysql_pool.hpp"
#endif

#include <memory>

namespace sqlnav {

/**
 * Blocking: performs the engine handshake. Call from a worker.
 * @throws ConnectivityError when the target cannot be opened
 */
inline std::shared_ptr<Pool> open_pool(const Connection& conn) {
    switch (conn.kind) {
        case EngineKind::Sqlite:
            return std::make_shared<SqlitePool>(conn.path);
        case EngineKind::Postgres:
            return std::make_shared<PostgresPool>(conn);
        case EngineKind::MySql:
#ifdef SQLNAV_HAS_MYSQL
            return std::make_shared<MySqlPool>(conn);
#else
            throw ConnectivityError("MySQL support not built. Build with SQLNAV_WITH_MYSQL=ON");
#endif
    }
    throw ConnectivityError("unknown engine");
}

} // namespace sqlnav
