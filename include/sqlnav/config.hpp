/**
 * sqlnav/config.hpp - Configuration file
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * The file is JSON:
 *
 *   {
 *     "conn": [
 *       {"type": "postgres", "name": "local", "host": "localhost",
 *        "port": 5432, "user": "me", "password": "", "database": "app"},
 *       {"type": "sqlite", "path": "/tmp/test.db"}
 *     ],
 *     "key_config": {"scroll_down": "Down", "quit": "Ctrl-q"},
 *     "page_size": 0,
 *     "end_jump": "count",
 *     "max_column_width": 40,
 *     "clipboard_command": "xclip -selection clipboard",
 *     "log_file": "/tmp/sqlnav.log",
 *     "log_level": "info"
 *   }
 *
 * Every key is optional. Anything malformed raises ConfigError naming
 * the entry; nothing is silently ignored.
 */

#pragma once

#include "errors.hpp"
#include "json.hpp"
#include "log.hpp"
#include "types.hpp"
#include "ui/key_config.hpp"
#include "ui/table_state.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace sqlnav {

struct Config {
    std::vector<Connection> connections;
    ui::KeyConfig keys;
    ui::TableOptions table;
    std::string clipboard_command = "xclip -selection clipboard";
    std::string log_file;       // empty = default_log_path()
    LogLevel log_level = LogLevel::Info;
};

// ============================================================================
// Locations
// ============================================================================

inline std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

/**
 * $XDG_CONFIG_HOME/sqlnav/config.json, else ~/.config/sqlnav/config.json.
 */
inline std::string default_config_path() {
    std::string base = env_or_empty("XDG_CONFIG_HOME");
    if (base.empty()) {
        std::string home = env_or_empty("HOME");
        if (home.empty()) return "config.json";
        base = home + "/.config";
    }
    return base + "/sqlnav/config.json";
}

/**
 * $XDG_STATE_HOME/sqlnav/sqlnav.log, else ~/.sqlnav.log.
 */
inline std::string default_log_path() {
    std::string state = env_or_empty("XDG_STATE_HOME");
    if (!state.empty()) return state + "/sqlnav/sqlnav.log";
    std::string home = env_or_empty("HOME");
    return home.empty() ? "sqlnav.log" : home + "/.sqlnav.log";
}

// ============================================================================
// Parsing
// ============================================================================

namespace detail {

inline std::string get_string(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw ConfigError(where + ": \"" + key + "\" must be a string");
    }
    return it->get<std::string>();
}

inline int64_t get_integer(const json& obj, const char* key, const std::string& where,
                           int64_t fallback, int64_t min, int64_t max) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) {
        throw ConfigError(where + ": \"" + key + "\" must be an integer");
    }
    int64_t v = it->get<int64_t>();
    if (v < min || v > max) {
        throw ConfigError(where + ": \"" + key + "\" out of range");
    }
    return v;
}

inline Connection parse_connection(const json& entry, size_t index) {
    const std::string where = "conn[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        throw ConfigError(where + ": must be an object");
    }

    Connection c;
    const std::string type = get_string(entry, "type", where);
    if (type == "mysql") {
        c.kind = EngineKind::MySql;
    } else if (type == "postgres" || type == "postgresql") {
        c.kind = EngineKind::Postgres;
    } else if (type == "sqlite") {
        c.kind = EngineKind::Sqlite;
    } else if (type.empty()) {
        throw ConfigError(where + ": missing \"type\"");
    } else {
        throw ConfigError(where + ": unknown type \"" + type + "\"");
    }

    c.name = get_string(entry, "name", where);
    c.host = get_string(entry, "host", where);
    c.port = static_cast<int>(get_integer(entry, "port", where, 0, 0, 65535));
    c.user = get_string(entry, "user", where);
    c.password = get_string(entry, "password", where);
    c.database = get_string(entry, "database", where);
    c.path = get_string(entry, "path", where);

    if (c.kind == EngineKind::Sqlite) {
        if (c.path.empty()) throw ConfigError(where + ": sqlite connection needs \"path\"");
    } else if (c.host.empty()) {
        throw ConfigError(where + ": " + type + " connection needs \"host\"");
    }
    return c;
}

inline void parse_keys(const json& section, ui::KeyConfig& keys) {
    if (!section.is_object()) {
        throw ConfigError("key_config: must be an object");
    }
    for (auto it = section.begin(); it != section.end(); ++it) {
        auto action = ui::parse_action(it.key());
        if (!action) {
            throw ConfigError("key_config: unknown action \"" + it.key() + "\"");
        }
        if (!it.value().is_string()) {
            throw ConfigError("key_config." + it.key() + ": must be a string");
        }
        const std::string text = it.value().get<std::string>();
        auto key = ui::parse_key(text);
        if (!key) {
            throw ConfigError("key_config." + it.key() + ": cannot parse key \"" + text + "\"");
        }
        keys.bind(*action, *key);
    }
}

} // namespace detail

/**
 * @throws ConfigError
 */
inline Config parse_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }
    Config cfg;

    if (auto it = j.find("conn"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw ConfigError("conn: must be an array");
        for (size_t i = 0; i < it->size(); ++i) {
            cfg.connections.push_back(detail::parse_connection((*it)[i], i));
        }
    }

    if (auto it = j.find("key_config"); it != j.end() && !it->is_null()) {
        detail::parse_keys(*it, cfg.keys);
    }

    cfg.table.page_size = static_cast<uint64_t>(
        detail::get_integer(j, "page_size", "config", 0, 0, 1000000));
    cfg.table.max_column_width = static_cast<size_t>(
        detail::get_integer(j, "max_column_width", "config", 40, 1, 10000));

    std::string end_jump = detail::get_string(j, "end_jump", "config");
    if (!end_jump.empty()) {
        auto policy = ui::parse_end_jump_policy(end_jump);
        if (!policy) throw ConfigError("end_jump: must be disabled, count or estimate");
        cfg.table.end_jump = *policy;
    }

    if (j.contains("clipboard_command")) {
        cfg.clipboard_command = detail::get_string(j, "clipboard_command", "config");
    }
    cfg.log_file = detail::get_string(j, "log_file", "config");

    std::string level = detail::get_string(j, "log_level", "config");
    if (!level.empty()) {
        auto parsed = parse_log_level(level);
        if (!parsed) throw ConfigError("log_level: unknown level \"" + level + "\"");
        cfg.log_level = *parsed;
    }
    return cfg;
}

/**
 * @throws ConfigError on malformed JSON or contents
 */
inline Config parse_config_text(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    return parse_config(j);
}

/**
 * Load the file at `path`. A missing file yields the defaults unless
 * `required` is set.
 * @throws ConfigError
 */
inline Config load_config(const std::string& path, bool required) {
    std::ifstream file(path);
    if (!file) {
        if (required) throw ConfigError("cannot open config file: " + path);
        return Config{};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return parse_config_text(buffer.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace sqlnav
