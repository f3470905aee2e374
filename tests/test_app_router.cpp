/**
 * test_app_router.cpp - Tests for key routing, overlays and the
 * connect / browse flow of ui::App
 */

#include <gtest/gtest.h>
#include <sqlnav/ui/app.hpp>

#include "fake_pool.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace sqlnav;
using namespace sqlnav::ui;
using sqlnav::testing::FakePool;
using sqlnav::testing::make_rows;

namespace {

class RecordingClipboard : public Clipboard {
public:
    std::vector<std::string> copies;
    bool broken = false;

    void copy(const std::string& payload) override {
        if (broken) throw Error("clipboard command exited with status 1");
        copies.push_back(payload);
    }
};

Connection sqlite_connection(const std::string& path) {
    Connection c;
    c.kind = EngineKind::Sqlite;
    c.path = path;
    return c;
}

} // namespace

class AppRouterTest : public ::testing::Test {
protected:
    std::shared_ptr<FakePool> pool_ = std::make_shared<FakePool>();
    std::string connect_error_;
    Orchestrator orch_{[this](const Connection&) -> std::shared_ptr<Pool> {
        if (!connect_error_.empty()) throw ConnectivityError(connect_error_);
        return pool_;
    }};
    std::shared_ptr<RecordingClipboard> clipboard_ = std::make_shared<RecordingClipboard>();
    std::unique_ptr<App> app_;

    void SetUp() override {
        pool_->schema = {Database{"main", {Table{"users", "main"}, Table{"orders", "main"}}}};
        pool_->results[""] = make_rows(3, 2);
        RecordSet meta;
        meta.columns = column_metadata_headers();
        meta.rows.push_back(Row{{Cell::from_text("c0"), Cell::from_text("TEXT"),
                                 Cell::from_text("YES"), Cell::null(), Cell::from_text("")}});
        pool_->metadata = meta;
        app_ = make_app({sqlite_connection("/data/app.db")});
    }

    void TearDown() override {
        app_.reset();
        orch_.stop();
    }

    std::unique_ptr<App> make_app(std::vector<Connection> connections) {
        auto app = std::make_unique<App>(std::move(connections), KeyConfig{}, orch_, clipboard_);
        app->set_viewport(10, 80);
        return app;
    }

    RouteResult press(const Key& k) { return app_->route(k); }

    void type(const std::string& text) {
        for (char c : text) press(Key::chr(static_cast<uint32_t>(c)));
    }

    // Poll deliveries until `done` holds.
    bool settle(const std::function<bool()>& done) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!done()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            orch_.wait(std::chrono::milliseconds(20));
            app_->poll();
        }
        return true;
    }

    void connect_and_load_schema() {
        ASSERT_EQ(press(Key::of(KeyCode::Enter)), RouteResult::Component);
        ASSERT_TRUE(settle([&] { return !app_->schema().items().empty(); }));
    }

    void open_users() {
        connect_and_load_schema();
        ASSERT_EQ(app_->focus(), Focus::SchemaTree);
        press(Key::of(KeyCode::Enter));   // expand main
        press(Key::chr('j'));
        ASSERT_EQ(press(Key::of(KeyCode::Enter)), RouteResult::Component);
        ASSERT_EQ(app_->focus(), Focus::TableView);
        ASSERT_TRUE(settle([&] { return app_->table_view().records().selection().has_value(); }));
    }
};

TEST_F(AppRouterTest, StartsOnConnectionList) {
    EXPECT_EQ(app_->focus(), Focus::ConnectionList);
    EXPECT_TRUE(app_->running());
    EXPECT_FALSE(app_->connected());
}

TEST_F(AppRouterTest, EveryKeyLandsInOneTier) {
    std::vector<Key> keys;
    for (const auto& info : action_table()) keys.push_back(KeyConfig{}.key(info.action));
    keys.push_back(Key::chr('x'));
    keys.push_back(Key::of(KeyCode::Tab));
    keys.push_back(Key::function(3));
    keys.push_back(Key::meta('j'));

    const std::vector<int> rights = {0, 1, 2};
    for (int steps : rights) {
        for (const Key& k : keys) {
            app_ = make_app({});
            for (int i = 0; i < steps; ++i) press(Key::of(KeyCode::Right));
            const Focus before = app_->focus();
            ASSERT_EQ(before, static_cast<Focus>(steps));

            RouteResult r = press(k);
            EXPECT_NE(r, RouteResult::ErrorOverlay) << format_key(k);
            if (r == RouteResult::Ignored) {
                EXPECT_EQ(app_->focus(), before) << format_key(k);
                EXPECT_TRUE(app_->running());
                EXPECT_FALSE(app_->help_visible());
                EXPECT_FALSE(app_->prompting());
            }
        }
    }
}

TEST_F(AppRouterTest, FocusMovesAcrossPanes) {
    EXPECT_EQ(press(Key::of(KeyCode::Right)), RouteResult::App);
    EXPECT_EQ(app_->focus(), Focus::SchemaTree);
    press(Key::of(KeyCode::Right));
    EXPECT_EQ(app_->focus(), Focus::TableView);
    press(Key::of(KeyCode::Right));
    EXPECT_EQ(app_->focus(), Focus::TableView);
    press(Key::of(KeyCode::Left));
    EXPECT_EQ(app_->focus(), Focus::SchemaTree);
    press(Key::of(KeyCode::Right));
    press(Key::chr('c'));
    EXPECT_EQ(app_->focus(), Focus::ConnectionList);
}

TEST_F(AppRouterTest, ComponentBeforeApp) {
    EXPECT_EQ(press(Key::chr('j')), RouteResult::Component);
    EXPECT_EQ(press(Key::chr('x')), RouteResult::Ignored);
    EXPECT_EQ(press(Key::chr('q')), RouteResult::App);
    EXPECT_FALSE(app_->running());
}

TEST_F(AppRouterTest, ControlCExits) {
    EXPECT_EQ(press(Key::control('c')), RouteResult::App);
    EXPECT_FALSE(app_->running());
}

TEST_F(AppRouterTest, HelpOverlaySwallowsKeys) {
    EXPECT_EQ(press(Key::chr('?')), RouteResult::App);
    EXPECT_TRUE(app_->help_visible());
    EXPECT_EQ(press(Key::chr('j')), RouteResult::HelpOverlay);
    EXPECT_EQ(app_->connections().selected(), 0u);
    EXPECT_EQ(press(Key::chr('q')), RouteResult::HelpOverlay);
    EXPECT_FALSE(app_->help_visible());
    EXPECT_TRUE(app_->running());
}

TEST_F(AppRouterTest, ErrorOverlayOutranksHelp) {
    press(Key::chr('?'));
    app_->show_error(ErrorKind::Query, "boom");
    EXPECT_EQ(press(Key::chr('?')), RouteResult::ErrorOverlay);
    EXPECT_TRUE(app_->help_visible());
    EXPECT_EQ(press(Key::of(KeyCode::Esc)), RouteResult::ErrorOverlay);
    EXPECT_FALSE(app_->error().has_value());
    EXPECT_EQ(press(Key::of(KeyCode::Esc)), RouteResult::HelpOverlay);
    EXPECT_FALSE(app_->help_visible());
}

TEST_F(AppRouterTest, ErrorOverlayReturnsFocus) {
    press(Key::of(KeyCode::Right));
    app_->show_error(ErrorKind::Query, "syntax error");
    EXPECT_EQ(press(Key::chr('q')), RouteResult::ErrorOverlay);
    EXPECT_TRUE(app_->running());
    press(Key::of(KeyCode::Enter));
    EXPECT_FALSE(app_->error().has_value());
    EXPECT_EQ(app_->focus(), Focus::SchemaTree);
}

TEST_F(AppRouterTest, ConnectivityErrorReturnsToConnections) {
    press(Key::of(KeyCode::Right));
    app_->show_error(ErrorKind::Connectivity, "server closed the connection");
    app_->show_error(ErrorKind::Query, "later error");
    ASSERT_TRUE(app_->error().has_value());
    EXPECT_EQ(app_->error()->message, "later error");
    EXPECT_EQ(app_->error()->kind, ErrorKind::Connectivity);
    press(Key::of(KeyCode::Esc));
    EXPECT_EQ(app_->focus(), Focus::ConnectionList);
}

TEST_F(AppRouterTest, ConnectLoadsSchemaAndFocusesTree) {
    connect_and_load_schema();
    EXPECT_TRUE(app_->connected());
    EXPECT_EQ(app_->focus(), Focus::SchemaTree);
    EXPECT_EQ(app_->connections().active(), 0u);
    EXPECT_EQ(app_->status(), "connected to /data/app.db");
    ASSERT_EQ(app_->schema().databases().size(), 1u);
    EXPECT_EQ(app_->schema().databases()[0].tables.size(), 2u);
}

TEST_F(AppRouterTest, ConnectFailureShowsError) {
    connect_error_ = "unable to open database file";
    press(Key::of(KeyCode::Enter));
    ASSERT_TRUE(settle([&] { return app_->error().has_value(); }));
    EXPECT_EQ(app_->error()->kind, ErrorKind::Connectivity);
    EXPECT_EQ(app_->error()->message, "unable to open database file");
    EXPECT_FALSE(app_->connected());
    press(Key::of(KeyCode::Esc));
    EXPECT_EQ(app_->focus(), Focus::ConnectionList);
}

TEST_F(AppRouterTest, OpenTableShowsRecords) {
    open_users();
    const auto& view = app_->table_view();
    ASSERT_TRUE(view.table().has_value());
    EXPECT_EQ(view.table()->name, "users");
    EXPECT_EQ(view.records().rows().size(), 3u);
    EXPECT_EQ(position_text(view.current()), "row 1 of 3");

    EXPECT_EQ(press(Key::chr('j')), RouteResult::Component);
    EXPECT_EQ(view.records().selection()->row, 1u);
}

TEST_F(AppRouterTest, TabKeyFetchesProperties) {
    open_users();
    EXPECT_EQ(press(Key::chr('2')), RouteResult::App);
    EXPECT_EQ(app_->table_view().tab(), Tab::Columns);
    ASSERT_TRUE(settle([&] { return !app_->table_view().current().rows().empty(); }));
    EXPECT_EQ(app_->table_view().current().columns(), column_metadata_headers());

    press(Key::chr('1'));
    EXPECT_EQ(app_->table_view().tab(), Tab::Records);
    EXPECT_EQ(app_->table_view().current().rows().size(), 3u);
}

TEST_F(AppRouterTest, CopySelectionToClipboard) {
    open_users();
    press(Key::chr('J'));
    press(Key::chr('L'));
    EXPECT_EQ(press(Key::chr('y')), RouteResult::Component);
    ASSERT_EQ(clipboard_->copies.size(), 1u);
    EXPECT_EQ(clipboard_->copies[0], "r0_0\tr0_1\nr1_0\tr1_1");
    EXPECT_EQ(app_->status(), "copied 4 cells");
}

TEST_F(AppRouterTest, CopyFailureIsStatusOnly) {
    open_users();
    clipboard_->broken = true;
    press(Key::chr('y'));
    EXPECT_EQ(app_->status(), "clipboard command exited with status 1");
    EXPECT_FALSE(app_->error().has_value());
}

TEST_F(AppRouterTest, PromptRunsStatement) {
    open_users();
    EXPECT_EQ(press(Key::chr(':')), RouteResult::App);
    EXPECT_TRUE(app_->prompting());
    type("DELETE FROM users WHERE id = 1");
    EXPECT_EQ(press(Key::of(KeyCode::Enter)), RouteResult::Prompt);
    EXPECT_FALSE(app_->prompting());

    ASSERT_TRUE(settle([&] { return app_->status() == "3 rows affected"; }));
    ASSERT_EQ(pool_->statements().size(), 1u);
    EXPECT_EQ(pool_->statements()[0], "DELETE FROM users WHERE id = 1");
}

TEST_F(AppRouterTest, PromptCapturesBoundKeys) {
    press(Key::chr(':'));
    EXPECT_EQ(press(Key::chr('q')), RouteResult::Prompt);
    EXPECT_TRUE(app_->running());
    EXPECT_EQ(app_->prompt().text(), "q");
    press(Key::of(KeyCode::Esc));
    EXPECT_FALSE(app_->prompting());
    EXPECT_TRUE(pool_->statements().empty());
}

TEST_F(AppRouterTest, StatementWithoutConnection) {
    press(Key::chr(':'));
    type("DELETE FROM t");
    press(Key::of(KeyCode::Enter));
    ASSERT_TRUE(app_->error().has_value());
    EXPECT_EQ(app_->error()->kind, ErrorKind::Query);
    EXPECT_EQ(app_->error()->message, "not connected");
}

TEST_F(AppRouterTest, QueryErrorKeepsConnection) {
    open_users();
    pool_->fail_next(ErrorKind::Query, "no such column: bogus");
    press(Key::chr('/'));
    type("bogus = 1");
    press(Key::of(KeyCode::Enter));

    ASSERT_TRUE(settle([&] { return app_->error().has_value(); }));
    EXPECT_EQ(app_->error()->kind, ErrorKind::Query);
    EXPECT_TRUE(app_->connected());
    EXPECT_FALSE(app_->table_view().records().loading());
    EXPECT_EQ(app_->table_view().records().filter(), "");
    EXPECT_EQ(app_->table_view().records().rows().size(), 3u);

    press(Key::of(KeyCode::Esc));
    EXPECT_EQ(app_->focus(), Focus::TableView);
}

TEST_F(AppRouterTest, ConnectivityLossDisconnects) {
    open_users();
    pool_->fail_next(ErrorKind::Connectivity, "server has gone away");
    press(Key::chr('r'));

    ASSERT_TRUE(settle([&] { return app_->error().has_value(); }));
    EXPECT_EQ(app_->error()->kind, ErrorKind::Connectivity);
    EXPECT_FALSE(app_->connected());
    EXPECT_EQ(app_->status(), "disconnected");
    EXPECT_FALSE(app_->connections().active().has_value());
    EXPECT_TRUE(app_->schema().items().empty());
    EXPECT_FALSE(app_->table_view().table().has_value());

    press(Key::of(KeyCode::Enter));
    EXPECT_EQ(app_->focus(), Focus::ConnectionList);
}

TEST_F(AppRouterTest, ReconnectDiscardsOldWork) {
    connect_and_load_schema();
    auto first = pool_;
    pool_ = std::make_shared<FakePool>();
    pool_->schema = {Database{"other", {Table{"t", "other"}}}};

    press(Key::chr('c'));
    press(Key::of(KeyCode::Enter));
    ASSERT_TRUE(settle([&] {
        return !app_->schema().databases().empty() && app_->schema().databases()[0].name == "other";
    }));
    EXPECT_EQ(app_->focus(), Focus::SchemaTree);
    first.reset();
}
