#include "logging.hpp"
#include "renderer.hpp"
#include "terminal.hpp"

#include <sqlnav/sqlnav.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>

namespace {

constexpr std::chrono::milliseconds poll_interval{50};

int run(int argc, char** argv) {
    sqlnav::cli::arg_parser parser("sqlnav", std::cout);
    auto args = parser.parse(argc, argv);
    if (!args) {
        return 0;
    }

    const bool explicit_config = !args->config_path.empty();
    const std::string config_path = explicit_config ? args->config_path : sqlnav::default_config_path();
    sqlnav::Config cfg = sqlnav::load_config(config_path, explicit_config);

    if (!args->sqlite_path.empty()) {
        sqlnav::Connection c;
        c.kind = sqlnav::EngineKind::Sqlite;
        c.path = args->sqlite_path;
        cfg.connections.push_back(c);
    }

    std::string log_path = args->log_path;
    if (log_path.empty()) log_path = cfg.log_file;
    if (log_path.empty()) log_path = sqlnav::default_log_path();
    auto logger = sqlnav::tool::make_file_logger(log_path, cfg.log_level);
    auto log = sqlnav::tool::forward_to(logger);
    logger->info("sqlnav {} starting, config {}, {} connection(s)",
                 sqlnav::cli::version, config_path, cfg.connections.size());

    sqlnav::Orchestrator orchestrator(sqlnav::open_pool);
    orchestrator.set_log_func(log);

    auto clipboard = std::make_shared<sqlnav::ui::CommandClipboard>(cfg.clipboard_command);
    const size_t connection_count = cfg.connections.size();
    sqlnav::ui::App app(std::move(cfg.connections), cfg.keys, orchestrator, clipboard, cfg.table);
    app.set_log_func(log);

    sqlnav::tool::Terminal term;
    sqlnav::tool::Renderer renderer;

    const auto grid = sqlnav::tool::compute_layout(term.size(), connection_count).grid;
    app.set_viewport(static_cast<size_t>(std::max(1, grid.rows - 1)), static_cast<size_t>(grid.cols));
    if (!args->sqlite_path.empty()) {
        app.connect(connection_count - 1);
    }

    while (app.running()) {
        const auto layout = sqlnav::tool::compute_layout(term.size(), connection_count);
        app.set_viewport(static_cast<size_t>(std::max(1, layout.grid.rows - 1)),
                         static_cast<size_t>(layout.grid.cols));
        app.poll();
        renderer.render(term, app);
        if (auto key = term.read_key(poll_interval)) {
            logger->trace("key {}", sqlnav::ui::format_key(*key));
            app.route(*key);
        }
    }

    orchestrator.stop();
    logger->info("sqlnav exiting");
    logger->flush();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "sqlnav: error: " << e.what() << "\n";
        return 1;
    }
}
