/**
 * sqlnav/ui/app.hpp - Top-level controller and key router
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Owns the active pool, the three panes and the overlays. Every key goes
 * through route(), which hands it to exactly one tier, highest first:
 *
 *   1. error overlay   (consumes everything, may only dismiss itself)
 *   2. help overlay    (consumes everything, may only dismiss itself)
 *   3. command prompt  (while a ":" statement is being typed)
 *   4. focused pane    (may decline a key)
 *   5. app bindings    (focus switching, tabs, help, prompt, quit)
 *
 * A key no tier claims is reported as Ignored. poll() drains the
 * orchestrator once per main-loop iteration and applies the deliveries.
 * The renderer reads the const accessors and never mutates anything.
 */

#pragma once

#include "../errors.hpp"
#include "../log.hpp"
#include "../orchestrator.hpp"
#include "../types.hpp"
#include "clipboard.hpp"
#include "connection_list.hpp"
#include "key_config.hpp"
#include "line_editor.hpp"
#include "schema_tree.hpp"
#include "table_view.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlnav::ui {

enum class Focus {
    ConnectionList,
    SchemaTree,
    TableView
};

inline const char* focus_name(Focus f) {
    switch (f) {
        case Focus::ConnectionList: return "connections";
        case Focus::SchemaTree:     return "schema";
        case Focus::TableView:      return "table";
    }
    return "?";
}

/**
 * Which tier took a key.
 */
enum class RouteResult {
    ErrorOverlay,
    HelpOverlay,
    Prompt,
    Component,
    App,
    Ignored
};

struct ErrorOverlay {
    ErrorKind kind = ErrorKind::Query;
    std::string message;
    Focus return_focus = Focus::ConnectionList;
};

class App {
public:
    App(std::vector<Connection> connections, KeyConfig keys, Orchestrator& orchestrator,
        std::shared_ptr<Clipboard> clipboard, TableOptions options = {})
        : keys_(std::move(keys)),
          orchestrator_(orchestrator),
          clipboard_(std::move(clipboard)),
          connections_(std::move(connections)),
          table_view_(
              [this](const RecordsQuery& q) {
                  return orchestrator_.submit(pool_, request::FetchRows{q});
              },
              [this](const RecordsQuery& q, bool estimate) {
                  return orchestrator_.submit(pool_, request::CountRows{q, estimate});
              },
              options) {}

    // The panes capture `this`.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    void set_log_func(log_func_t func) { log_func_ = std::move(func); }

    // ========================================================================
    // Input
    // ========================================================================

    RouteResult route(const Key& key) {
        if (error_) {
            if (keys_.matches(Action::ExitPopup, key) || keys_.matches(Action::Enter, key)) {
                dismiss_error();
            }
            return RouteResult::ErrorOverlay;
        }

        if (help_visible_) {
            if (keys_.matches(Action::ExitPopup, key) || keys_.matches(Action::OpenHelp, key) ||
                keys_.matches(Action::Quit, key)) {
                help_visible_ = false;
            }
            return RouteResult::HelpOverlay;
        }

        if (prompting_) {
            LineResult r = prompt_.handle(key);
            if (r != LineResult::Editing) {
                prompting_ = false;
                if (r == LineResult::Commit && !prompt_.empty()) {
                    run_statement(prompt_.text());
                }
            }
            return RouteResult::Prompt;
        }

        if (route_to_component(key)) {
            after_component();
            return RouteResult::Component;
        }

        if (route_to_app(key)) {
            return RouteResult::App;
        }
        return RouteResult::Ignored;
    }

    // ========================================================================
    // Commands
    // ========================================================================

    /**
     * Retire the current pool and open the given connection on a worker.
     */
    void connect(size_t index) {
        if (index >= connections_.connections().size()) return;
        disconnect();
        const Connection& conn = connections_.connections()[index];
        connecting_index_ = index;
        connect_token_ = orchestrator_.submit(nullptr, request::Connect{conn});
        status_ = "connecting to " + conn.label() + "...";
        log(LogLevel::Info, "connecting to " + conn.label());
    }

    /**
     * Drop the active pool. In-flight work keeps its own reference; every
     * slot is superseded so none of it lands.
     */
    void disconnect() {
        orchestrator_.supersede_all();
        if (pool_) {
            log(LogLevel::Info, "disconnected");
        }
        pool_.reset();
        connections_.set_active(std::nullopt);
        connect_token_ = Token{};
        schema_token_ = Token{};
        statement_token_ = Token{};
        schema_.clear();
        table_view_.clear();
    }

    void reload_schema() {
        if (!pool_) return;
        schema_token_ = orchestrator_.submit(pool_, request::LoadSchema{});
    }

    void open_table(const Table& table) {
        if (!pool_) return;
        table_view_.set_tab(Tab::Records);
        table_view_.open(table);
        log(LogLevel::Info, "open " + table.database + "." + table.name);
    }

    /**
     * Run one non-query statement against the active pool.
     */
    void run_statement(const std::string& statement) {
        if (!pool_) {
            show_error(ErrorKind::Query, "not connected");
            return;
        }
        statement_token_ = orchestrator_.submit(pool_, request::Execute{statement});
        status_ = "running...";
    }

    void set_tab(Tab tab) {
        table_view_.set_tab(tab);
        fetch_properties_if_needed();
    }

    /**
     * Grid and tree heights in rows, grid width in characters.
     */
    void set_viewport(size_t rows, size_t width) {
        table_view_.set_viewport(rows, width);
        schema_.set_page(rows);
    }

    void show_error(ErrorKind kind, const std::string& message) {
        // Most recent wins; the focus to return to is kept from the first.
        Focus back = error_ ? error_->return_focus : focus_;
        if (error_ && error_->kind == ErrorKind::Connectivity) kind = ErrorKind::Connectivity;
        error_ = ErrorOverlay{kind, message, back};
    }

    // ========================================================================
    // Deliveries
    // ========================================================================

    /**
     * Apply every relevant delivery. Returns true when anything changed.
     */
    bool poll() {
        std::vector<Delivery> deliveries = orchestrator_.drain();
        for (auto& d : deliveries) {
            apply(d);
        }
        return !deliveries.empty();
    }

    // ========================================================================
    // View
    // ========================================================================

    bool running() const { return running_; }
    void quit() { running_ = false; }

    Focus focus() const { return focus_; }
    const std::optional<ErrorOverlay>& error() const { return error_; }
    bool help_visible() const { return help_visible_; }
    bool prompting() const { return prompting_; }
    const LineEditor& prompt() const { return prompt_; }
    const std::string& status() const { return status_; }
    bool connected() const { return pool_ != nullptr; }
    bool busy() const { return connect_token_.valid() || schema_token_.valid() || table_view_.records().loading(); }

    const KeyConfig& keys() const { return keys_; }
    const ConnectionList& connections() const { return connections_; }
    const SchemaTree& schema() const { return schema_; }
    const TableView& table_view() const { return table_view_; }

private:
    KeyConfig keys_;
    Orchestrator& orchestrator_;
    std::shared_ptr<Clipboard> clipboard_;
    log_func_t log_func_;

    std::shared_ptr<Pool> pool_;
    ConnectionList connections_;
    SchemaTree schema_;
    TableView table_view_;

    Focus focus_ = Focus::ConnectionList;
    std::optional<ErrorOverlay> error_;
    bool help_visible_ = false;
    bool prompting_ = false;
    LineEditor prompt_;
    std::string status_;
    bool running_ = true;

    std::optional<size_t> connecting_index_;
    Token connect_token_;
    Token schema_token_;
    Token statement_token_;

    void log(LogLevel level, const std::string& msg) const {
        if (log_func_) log_func_(level, msg);
    }

    // ========================================================================
    // Routing
    // ========================================================================

    bool route_to_component(const Key& key) {
        switch (focus_) {
            case Focus::ConnectionList:
                switch (connections_.handle(key, keys_)) {
                    case ConnectionListEvent::Unhandled:
                        return false;
                    case ConnectionListEvent::Connect:
                        connect(connections_.selected());
                        return true;
                    case ConnectionListEvent::Handled:
                        return true;
                }
                return false;

            case Focus::SchemaTree:
                switch (schema_.handle(key, keys_)) {
                    case SchemaTreeEvent::Unhandled:
                        return false;
                    case SchemaTreeEvent::OpenTable:
                        if (auto t = schema_.selected_table()) {
                            open_table(*t);
                            focus_ = Focus::TableView;
                        }
                        return true;
                    case SchemaTreeEvent::Reload:
                        reload_schema();
                        return true;
                    case SchemaTreeEvent::Handled:
                        return true;
                }
                return false;

            case Focus::TableView:
                switch (table_view_.handle(key, keys_)) {
                    case TableViewEvent::Unhandled:
                        return false;
                    case TableViewEvent::Copy:
                        copy_selection();
                        return true;
                    case TableViewEvent::Handled:
                        return true;
                }
                return false;
        }
        return false;
    }

    void after_component() {
        fetch_properties_if_needed();
    }

    bool route_to_app(const Key& key) {
        if (keys_.matches(Action::Exit, key) || keys_.matches(Action::Quit, key)) {
            running_ = false;
        } else if (keys_.matches(Action::OpenHelp, key)) {
            help_visible_ = true;
        } else if (keys_.matches(Action::FocusConnections, key)) {
            focus_ = Focus::ConnectionList;
        } else if (keys_.matches(Action::FocusRight, key)) {
            focus_ = focus_ == Focus::ConnectionList ? Focus::SchemaTree : Focus::TableView;
        } else if (keys_.matches(Action::FocusLeft, key)) {
            focus_ = focus_ == Focus::TableView ? Focus::SchemaTree : Focus::ConnectionList;
        } else if (keys_.matches(Action::Command, key)) {
            prompting_ = true;
            prompt_.reset();
        } else if (keys_.matches(Action::TabRecords, key)) {
            set_tab(Tab::Records);
        } else if (keys_.matches(Action::TabColumns, key)) {
            set_tab(Tab::Columns);
        } else if (keys_.matches(Action::TabConstraints, key)) {
            set_tab(Tab::Constraints);
        } else if (keys_.matches(Action::TabForeignKeys, key)) {
            set_tab(Tab::ForeignKeys);
        } else if (keys_.matches(Action::TabIndexes, key)) {
            set_tab(Tab::Indexes);
        } else {
            return false;
        }
        return true;
    }

    void dismiss_error() {
        focus_ = error_->kind == ErrorKind::Connectivity ? Focus::ConnectionList : error_->return_focus;
        error_.reset();
    }

    void fetch_properties_if_needed() {
        if (!pool_ || !table_view_.needs_properties()) return;
        request::FetchProperties req{*table_view_.table(), property_kind(table_view_.tab())};
        table_view_.await_properties(orchestrator_.submit(pool_, req));
    }

    void copy_selection() {
        const std::string payload = table_view_.current().copy_payload();
        if (!clipboard_) {
            status_ = "no clipboard";
            return;
        }
        try {
            clipboard_->copy(payload);
            auto rect = table_view_.current().selected_rect();
            size_t cells = rect ? (rect->bottom - rect->top + 1) * (rect->right - rect->left + 1) : 0;
            status_ = "copied " + std::to_string(cells) + (cells == 1 ? " cell" : " cells");
        } catch (const std::exception& e) {
            status_ = e.what();
            log(LogLevel::Warn, std::string("copy failed: ") + e.what());
        }
    }

    // ========================================================================
    // Delivery handling
    // ========================================================================

    void apply(Delivery& d) {
        if (!d.ok()) {
            fail(d);
            return;
        }
        switch (d.token.slot) {
            case Slot::Connect:
                if (d.token != connect_token_) return;
                connect_token_ = Token{};
                if (auto* pool = d.get<std::shared_ptr<Pool>>()) {
                    pool_ = *pool;
                    connections_.set_active(connecting_index_);
                    status_ = "connected to " + connections_.connections()[*connecting_index_].label();
                    log(LogLevel::Info, status_);
                    reload_schema();
                    focus_ = Focus::SchemaTree;
                }
                return;

            case Slot::Schema:
                if (d.token != schema_token_) return;
                schema_token_ = Token{};
                if (auto* dbs = d.get<std::vector<Database>>()) {
                    schema_.set_databases(std::move(*dbs));
                }
                return;

            case Slot::Records:
                if (auto* rows = d.get<RecordSet>()) {
                    table_view_.records().ingest(d.token, *rows);
                }
                return;

            case Slot::RowCount:
                if (auto* count = d.get<RowCount>()) {
                    table_view_.records().ingest_count(d.token, *count);
                }
                return;

            case Slot::Properties:
                if (auto* rows = d.get<RecordSet>()) {
                    table_view_.ingest_properties(d.token, *rows);
                }
                return;

            case Slot::Statement:
                if (d.token != statement_token_) return;
                statement_token_ = Token{};
                if (auto* outcome = d.get<ExecuteOutcome>()) {
                    status_ = std::to_string(outcome->affected_rows) +
                              (outcome->affected_rows == 1 ? " row affected" : " rows affected");
                    if (table_view_.table()) table_view_.records().reload();
                }
                return;
        }
    }

    void fail(const Delivery& d) {
        switch (d.token.slot) {
            case Slot::Connect:
                connect_token_ = Token{};
                status_.clear();
                break;
            case Slot::Schema:
                schema_token_ = Token{};
                break;
            case Slot::Records:
            case Slot::RowCount:
                table_view_.records().fail(d.token);
                break;
            case Slot::Properties:
                table_view_.fail_properties(d.token);
                break;
            case Slot::Statement:
                statement_token_ = Token{};
                status_.clear();
                break;
        }

        if (d.error_kind == ErrorKind::Connectivity && d.token.slot != Slot::Connect) {
            log(LogLevel::Error, "connection lost: " + d.error);
            disconnect();
            status_ = "disconnected";
        }
        show_error(d.error_kind, d.error);
    }
};

} // namespace sqlnav::ui
