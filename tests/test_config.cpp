/**
 * test_config.cpp - Tests for configuration file parsing
 */

#include <gtest/gtest.h>
#include <sqlnav/config.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace sqlnav;

class ConfigTest : public ::testing::Test {
protected:
    // Message of the ConfigError raised by parsing `text`.
    static std::string error_of(const std::string& text) {
        try {
            parse_config_text(text);
        } catch (const ConfigError& e) {
            return e.what();
        }
        return "(no error)";
    }
};

TEST_F(ConfigTest, EmptyObjectGivesDefaults) {
    Config cfg = parse_config_text("{}");
    EXPECT_TRUE(cfg.connections.empty());
    EXPECT_EQ(cfg.table.page_size, 0u);
    EXPECT_EQ(cfg.table.end_jump, ui::EndJumpPolicy::Count);
    EXPECT_EQ(cfg.table.max_column_width, 40u);
    EXPECT_EQ(cfg.clipboard_command, "xclip -selection clipboard");
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
    EXPECT_TRUE(cfg.keys.matches(ui::Action::ScrollDown, ui::Key::chr('j')));
}

TEST_F(ConfigTest, Connections) {
    Config cfg = parse_config_text(R"({
        "conn": [
            {"type": "postgres", "name": "local", "host": "localhost", "port": 5432,
             "user": "me", "password": "pw", "database": "app"},
            {"type": "mysql", "host": "db.internal", "user": "root"},
            {"type": "sqlite", "path": "/tmp/test.db"},
            {"type": "postgresql", "host": "h"}
        ]
    })");
    ASSERT_EQ(cfg.connections.size(), 4u);

    const Connection& pg = cfg.connections[0];
    EXPECT_EQ(pg.kind, EngineKind::Postgres);
    EXPECT_EQ(pg.port, 5432);
    EXPECT_EQ(pg.password, "pw");
    EXPECT_EQ(pg.label(), "local");

    EXPECT_EQ(cfg.connections[1].kind, EngineKind::MySql);
    EXPECT_EQ(cfg.connections[1].label(), "root@db.internal");
    EXPECT_EQ(cfg.connections[2].kind, EngineKind::Sqlite);
    EXPECT_EQ(cfg.connections[2].label(), "/tmp/test.db");
    EXPECT_EQ(cfg.connections[3].kind, EngineKind::Postgres);
}

TEST_F(ConfigTest, ConnectionErrorsNameTheEntry) {
    EXPECT_EQ(error_of(R"({"conn": [{"type": "sqlite", "path": "a"}, {"host": "x"}]})"),
              "conn[1]: missing \"type\"");
    EXPECT_EQ(error_of(R"({"conn": [{"type": "oracle", "host": "x"}]})"),
              "conn[0]: unknown type \"oracle\"");
    EXPECT_EQ(error_of(R"({"conn": [{"type": "sqlite"}]})"),
              "conn[0]: sqlite connection needs \"path\"");
    EXPECT_EQ(error_of(R"({"conn": [{"type": "mysql"}]})"),
              "conn[0]: mysql connection needs \"host\"");
    EXPECT_EQ(error_of(R"({"conn": [{"type": "mysql", "host": "h", "port": 70000}]})"),
              "conn[0]: \"port\" out of range");
    EXPECT_EQ(error_of(R"({"conn": [{"type": "mysql", "host": 5}]})"),
              "conn[0]: \"host\" must be a string");
    EXPECT_EQ(error_of(R"({"conn": {}})"), "conn: must be an array");
}

TEST_F(ConfigTest, KeyOverrides) {
    Config cfg = parse_config_text(R"({"key_config": {"scroll_down": "Down", "quit": "Ctrl-q"}})");
    EXPECT_TRUE(cfg.keys.matches(ui::Action::ScrollDown, ui::Key::of(ui::KeyCode::Down)));
    EXPECT_TRUE(cfg.keys.matches(ui::Action::Quit, ui::Key::control('q')));
    // Untouched bindings keep their defaults
    EXPECT_TRUE(cfg.keys.matches(ui::Action::ScrollUp, ui::Key::chr('k')));
}

TEST_F(ConfigTest, KeyErrors) {
    EXPECT_EQ(error_of(R"({"key_config": {"teleport": "t"}})"),
              "key_config: unknown action \"teleport\"");
    EXPECT_EQ(error_of(R"({"key_config": {"quit": "Ctrl-"}})"),
              "key_config.quit: cannot parse key \"Ctrl-\"");
    EXPECT_EQ(error_of(R"({"key_config": {"quit": 1}})"),
              "key_config.quit: must be a string");
}

TEST_F(ConfigTest, TableOptions) {
    Config cfg = parse_config_text(R"({"page_size": 200, "end_jump": "estimate", "max_column_width": 12})");
    EXPECT_EQ(cfg.table.page_size, 200u);
    EXPECT_EQ(cfg.table.end_jump, ui::EndJumpPolicy::Estimate);
    EXPECT_EQ(cfg.table.max_column_width, 12u);

    EXPECT_EQ(error_of(R"({"end_jump": "always"})"), "end_jump: must be disabled, count or estimate");
    EXPECT_EQ(error_of(R"({"page_size": -1})"), "config: \"page_size\" out of range");
    EXPECT_EQ(error_of(R"({"page_size": "big"})"), "config: \"page_size\" must be an integer");
    EXPECT_EQ(error_of(R"({"max_column_width": 0})"), "config: \"max_column_width\" out of range");
}

TEST_F(ConfigTest, LoggingAndClipboard) {
    Config cfg = parse_config_text(
        R"({"log_level": "debug", "log_file": "/var/tmp/s.log", "clipboard_command": "wl-copy"})");
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_EQ(cfg.log_file, "/var/tmp/s.log");
    EXPECT_EQ(cfg.clipboard_command, "wl-copy");

    EXPECT_EQ(error_of(R"({"log_level": "chatty"})"), "log_level: unknown level \"chatty\"");
}

TEST_F(ConfigTest, MalformedJson) {
    EXPECT_EQ(error_of("{\"conn\": [").rfind("invalid JSON: ", 0), 0u);
    EXPECT_EQ(error_of("[]"), "configuration must be a JSON object");
}

TEST_F(ConfigTest, MissingFile) {
    const std::string path = ::testing::TempDir() + "sqlnav_no_such_config.json";
    std::remove(path.c_str());
    Config cfg = load_config(path, false);
    EXPECT_TRUE(cfg.connections.empty());
    EXPECT_THROW(load_config(path, true), ConfigError);
}

TEST_F(ConfigTest, LoadFilePrefixesErrors) {
    const std::string path = ::testing::TempDir() + "sqlnav_bad_config.json";
    {
        std::ofstream out(path);
        out << R"({"conn": [{"type": "sqlite"}]})";
    }
    try {
        load_config(path, true);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(std::string(e.what()), path + ": conn[0]: sqlite connection needs \"path\"");
    }
    std::remove(path.c_str());
}

TEST_F(ConfigTest, LoadFile) {
    const std::string path = ::testing::TempDir() + "sqlnav_good_config.json";
    {
        std::ofstream out(path);
        out << R"({"conn": [{"type": "sqlite", "path": "/tmp/x.db"}], "page_size": 50})";
    }
    Config cfg = load_config(path, true);
    ASSERT_EQ(cfg.connections.size(), 1u);
    EXPECT_EQ(cfg.table.page_size, 50u);
    std::remove(path.c_str());
}

TEST_F(ConfigTest, DefaultPathsFollowXdg) {
    setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
    setenv("XDG_STATE_HOME", "/xdg/state", 1);
    EXPECT_EQ(default_config_path(), "/xdg/config/sqlnav/config.json");
    EXPECT_EQ(default_log_path(), "/xdg/state/sqlnav/sqlnav.log");

    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_STATE_HOME");
    setenv("HOME", "/home/someone", 1);
    EXPECT_EQ(default_config_path(), "/home/someone/.config/sqlnav/config.json");
    EXPECT_EQ(default_log_path(), "/home/someone/.sqlnav.log");
}
