/**
 * sqlnav/sqlnav.hpp - Master include for the sqlnav library
 *
 * sqlnav - a terminal browser for MySQL, PostgreSQL and SQLite
 *
 * Include this single header to get:
 *   - Pool and the engine adapters (open_pool)
 *   - Orchestrator - off-thread requests with token supersession
 *   - ui::App - panes, table state engine, key routing
 *   - Config / cli - configuration file and command line
 *
 * Example:
 *
 *   #include <sqlnav/sqlnav.hpp>
 *
 *   sqlnav::Orchestrator orch(sqlnav::open_pool);
 *   sqlnav::ui::App app(cfg.connections, cfg.keys, orch, clipboard, cfg.table);
 *   app.connect(0);
 *   while (app.running()) {
 *       app.poll();
 *       draw(app);
 *       if (auto key = read_key()) app.route(*key);
 *   }
 */

#pragma once

#include "cell.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "pool.hpp"
#include "sql.hpp"
#include "backends/connect.hpp"
#include "orchestrator.hpp"
#include "config.hpp"
#include "cli.hpp"
#include "ui/app.hpp"
