/**
 * sqlnav/backends/sqlite_pool.hpp - Embedded file engine adapter (SQLite)
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Example usage:
 *
 *   sqlnav::SqlitePool pool("inventory.db");
 *   for (const auto& db : pool.load_schema()) { ... }
 *
 *   sqlnav::RecordsQuery q;
 *   q.table = {"items", "main"};
 *   q.limit = 50;
 *   auto page = pool.fetch_rows(q);
 *
 * Values are translated using both the storage class SQLite reports for
 * each value and the declared column type, so a TIMESTAMP column holding
 * text or epoch seconds yields a Timestamp cell either way.
 */

#pragma once

#include "../pool.hpp"
#include "../sql.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sqlnav {

// ============================================================================
// Value Translation
// ============================================================================

enum class SqliteTypeHint {
    None,
    Boolean,
    Timestamp,
    Date,
    Time,
    Decimal
};

/**
 * Hint derived from a column's declared type; the storage class still
 * decides when there is no hint.
 */
inline SqliteTypeHint classify_sqlite_decltype(const char* decl) {
    if (!decl) return SqliteTypeHint::None;
    std::string t(decl);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto has = [&](const char* s) { return t.find(s) != std::string::npos; };
    if (has("BOOL")) return SqliteTypeHint::Boolean;
    if (has("TIMESTAMP") || has("DATETIME")) return SqliteTypeHint::Timestamp;
    if (has("DATE")) return SqliteTypeHint::Date;
    if (has("TIME")) return SqliteTypeHint::Time;
    if (has("DECIMAL") || has("NUMERIC")) return SqliteTypeHint::Decimal;
    return SqliteTypeHint::None;
}

inline Cell make_sqlite_cell(sqlite3_stmt* stmt, int col) {
    const int storage = sqlite3_column_type(stmt, col);
    if (storage == SQLITE_NULL) {
        return Cell::null();
    }

    auto column_text = [&]() -> std::string {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        return text ? std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)))
                    : std::string();
    };

    switch (classify_sqlite_decltype(sqlite3_column_decltype(stmt, col))) {
        case SqliteTypeHint::Boolean:
            if (storage == SQLITE_INTEGER) {
                return Cell::boolean(sqlite3_column_int64(stmt, col) != 0);
            }
            if (storage == SQLITE_TEXT) {
                std::string v = column_text();
                if (v == "true" || v == "TRUE") return Cell::boolean(true);
                if (v == "false" || v == "FALSE") return Cell::boolean(false);
            }
            break;
        case SqliteTypeHint::Timestamp:
            if (storage == SQLITE_TEXT) {
                return Cell::timestamp(column_text());
            }
            if (storage == SQLITE_INTEGER) {
                return Cell::timestamp(timestamp_from_epoch(sqlite3_column_int64(stmt, col)));
            }
            if (storage == SQLITE_FLOAT) {
                // Julian day number
                double jd = sqlite3_column_double(stmt, col);
                auto epoch = static_cast<int64_t>((jd - 2440587.5) * 86400.0 + 0.5);
                return Cell::timestamp(timestamp_from_epoch(epoch));
            }
            break;
        case SqliteTypeHint::Date:
            if (storage == SQLITE_TEXT) {
                return Cell::date(column_text());
            }
            if (storage == SQLITE_INTEGER) {
                return Cell::date(timestamp_from_epoch(sqlite3_column_int64(stmt, col)).substr(0, 10));
            }
            break;
        case SqliteTypeHint::Time:
            if (storage == SQLITE_TEXT) {
                return Cell::time(column_text());
            }
            break;
        case SqliteTypeHint::Decimal:
            if (storage == SQLITE_INTEGER) {
                return Cell::decimal(std::to_string(sqlite3_column_int64(stmt, col)));
            }
            if (storage == SQLITE_FLOAT) {
                return Cell::decimal(format_real(sqlite3_column_double(stmt, col)));
            }
            if (storage == SQLITE_TEXT) {
                return Cell::decimal(column_text());
            }
            break;
        case SqliteTypeHint::None:
            break;
    }

    switch (storage) {
        case SQLITE_INTEGER:
            return Cell::integer(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return Cell::real(sqlite3_column_double(stmt, col));
        case SQLITE_BLOB:
            return Cell::blob(sqlite3_column_blob(stmt, col),
                              static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
        default:
            return Cell::from_text(column_text());
    }
}

/**
 * Result codes meaning the file or handle itself is unusable.
 */
inline bool is_sqlite_connectivity_code(int rc) {
    switch (rc & 0xff) {
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
        case SQLITE_IOERR:
        case SQLITE_CORRUPT:
        case SQLITE_PERM:
        case SQLITE_MISUSE:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// SQLite Pool
// ============================================================================

class SqlitePool : public Pool {
public:
    /**
     * Opens an existing database file. ":memory:" opens a private
     * in-memory database; any other missing file is a ConnectivityError.
     */
    explicit SqlitePool(const std::string& path) { open(path); }
    ~SqlitePool() override { close(); }

    // Non-copyable
    SqlitePool(const SqlitePool&) = delete;
    SqlitePool& operator=(const SqlitePool&) = delete;

    EngineKind kind() const override { return EngineKind::Sqlite; }

    // ========================================================================
    // Open/Close
    // ========================================================================

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return db_ != nullptr;
    }

    // ========================================================================
    // Statements
    // ========================================================================

    ExecuteOutcome execute(const std::string& statement) override {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        char* err = nullptr;
        int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw_error(rc, msg);
        }
        order_keys_.clear();
        ExecuteOutcome outcome;
        outcome.affected_rows = static_cast<uint64_t>(sqlite3_changes(db_));
        return outcome;
    }

    // ========================================================================
    // Schema
    // ========================================================================

    std::vector<Database> list_databases() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Database> out;
        for (const auto& row : query("PRAGMA database_list").rows) {
            if (row[1].text == "temp") continue;
            Database db;
            db.name = row[1].text;
            out.push_back(std::move(db));
        }
        return out;
    }

    std::vector<Table> list_tables(const std::string& database) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string sql = "SELECT name, type FROM " +
                          quote_identifier(EngineKind::Sqlite, database) +
                          ".sqlite_master WHERE type IN ('table', 'view') "
                          "AND name NOT LIKE 'sqlite_%' ORDER BY name";
        std::vector<Table> out;
        for (const auto& row : query(sql).rows) {
            Table t;
            t.name = row[0].text;
            t.database = database;
            t.kind = row[1].text == "view" ? TableKind::View : TableKind::BaseTable;
            out.push_back(std::move(t));
        }
        return out;
    }

    // ========================================================================
    // Records
    // ========================================================================

    RecordSet fetch_rows(const RecordsQuery& q) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return query(select_page_sql(EngineKind::Sqlite, q, order_key(q.table)));
    }

    RowCount count_rows(const RecordsQuery& q) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(count_sql(EngineKind::Sqlite, q));
        RowCount count;
        if (!r.empty() && !r[0][0].is_null()) {
            count.rows = std::stoull(r[0][0].text);
        }
        return count;
    }

    /**
     * SQLite keeps no row statistics; the estimate is an exact count.
     */
    RowCount estimate_rows(const Table& table) override {
        RecordsQuery q;
        q.table = table;
        return count_rows(q);
    }

    // ========================================================================
    // Properties
    // ========================================================================

    RecordSet fetch_columns(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet info = query(pragma(table, "table_info"));
        RecordSet out;
        out.columns = column_metadata_headers();
        // cid, name, type, notnull, dflt_value, pk
        for (const auto& row : info.rows) {
            Row r;
            r.values.push_back(row[1]);
            r.values.push_back(Cell::from_text(row[2].text));
            r.values.push_back(Cell::from_text(row[3].text == "0" ? "YES" : "NO"));
            r.values.push_back(row[4]);
            r.values.push_back(Cell::from_text(row[5].text != "0" ? "PRI" : ""));
            out.rows.push_back(std::move(r));
        }
        return out;
    }

    RecordSet fetch_constraints(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet out;
        out.columns = constraint_headers();

        for (const auto& row : query(pragma(table, "table_info")).rows) {
            if (row[5].text != "0") {
                out.rows.push_back(Row{{Cell::from_text("PRIMARY"),
                                        Cell::from_text("PRIMARY KEY"), row[1]}});
            }
        }
        // seq, name, unique, origin, partial
        for (const auto& idx : query(pragma(table, "index_list")).rows) {
            if (idx[3].text != "u") continue;
            for (const auto& col : query(pragma_index(table, "index_info", idx[1].text)).rows) {
                out.rows.push_back(Row{{idx[1], Cell::from_text("UNIQUE"), col[2]}});
            }
        }
        // id, seq, table, from, to, on_update, on_delete, match
        for (const auto& fk : query(pragma(table, "foreign_key_list")).rows) {
            out.rows.push_back(Row{{Cell::from_text("fk_" + fk[0].text),
                                    Cell::from_text("FOREIGN KEY"), fk[3]}});
        }
        return out;
    }

    RecordSet fetch_foreign_keys(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet out;
        out.columns = foreign_key_headers();
        for (const auto& fk : query(pragma(table, "foreign_key_list")).rows) {
            out.rows.push_back(Row{{Cell::from_text("fk_" + fk[0].text), fk[3], fk[2], fk[4]}});
        }
        return out;
    }

    RecordSet fetch_indexes(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet out;
        out.columns = index_headers();
        for (const auto& idx : query(pragma(table, "index_list")).rows) {
            std::string origin = idx[3].text;
            std::string kind = origin == "pk" ? "PRIMARY" : origin == "u" ? "UNIQUE" : "BTREE";
            for (const auto& col : query(pragma_index(table, "index_info", idx[1].text)).rows) {
                out.rows.push_back(Row{{idx[1], col[2],
                                        Cell::from_text(idx[2].text != "0" ? "YES" : "NO"),
                                        Cell::from_text(kind)}});
            }
        }
        return out;
    }

    // ========================================================================
    // Direct Access
    // ========================================================================

    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::vector<std::string>> order_keys_;

    /**
     * Primary key columns, else rowid. A view has neither, so it is
     * ordered by every column. Caller holds mutex_.
     */
    const std::vector<std::string>& order_key(const Table& table) {
        const auto id = std::make_pair(table.database, table.name);
        auto it = order_keys_.find(id);
        if (it != order_keys_.end()) return it->second;

        RecordSet info = query(pragma(table, "table_info"));
        // cid, name, type, notnull, dflt_value, pk
        std::vector<std::pair<int64_t, std::string>> pk;
        std::vector<std::string> all;
        for (const auto& row : info.rows) {
            all.push_back(row[1].text);
            if (row[5].text != "0") pk.emplace_back(std::stoll(row[5].text), row[1].text);
        }
        std::sort(pk.begin(), pk.end());

        std::vector<std::string> key;
        if (!pk.empty()) {
            for (const auto& p : pk) key.push_back(quote_identifier(EngineKind::Sqlite, p.second));
        } else if (!info.empty()) {
            const std::string schema = table.database.empty() ? std::string("main") : table.database;
            RecordSet type = query("SELECT type FROM " + quote_identifier(EngineKind::Sqlite, schema) +
                                   ".sqlite_master WHERE name = " +
                                   quote_literal(EngineKind::Sqlite, table.name));
            if (!type.empty() && type[0][0].text == "view") {
                key = quoted_columns(EngineKind::Sqlite, all);
            } else {
                key.push_back("rowid");
            }
        }
        return order_keys_.emplace(id, std::move(key)).first->second;
    }

    void open(const std::string& path) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
        if (path == ":memory:") flags |= SQLITE_OPEN_CREATE;

        int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "Failed to allocate database";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw ConnectivityError("cannot open " + path + ": " + msg);
        }

        // A non-database file opens fine and only fails on first read.
        rc = sqlite3_exec(db_, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
            throw ConnectivityError("cannot read " + path + ": " + msg);
        }
    }

    void require_open() const {
        if (!db_) throw ConnectivityError("database is closed");
    }

    [[noreturn]] void throw_error(int rc, const std::string& msg) const {
        if (is_sqlite_connectivity_code(rc)) throw ConnectivityError(msg);
        throw QueryError(msg);
    }

    static std::string pragma(const Table& table, const char* name) {
        return "PRAGMA " + quote_identifier(EngineKind::Sqlite, table.database) + "." +
               name + "(" + quote_identifier(EngineKind::Sqlite, table.name) + ")";
    }

    static std::string pragma_index(const Table& table, const char* name, const std::string& index) {
        return "PRAGMA " + quote_identifier(EngineKind::Sqlite, table.database) + "." +
               name + "(" + quote_identifier(EngineKind::Sqlite, index) + ")";
    }

    /**
     * Caller holds mutex_.
     */
    RecordSet query(const std::string& sql) {
        require_open();
        RecordSet result;

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw_error(rc, sqlite3_errmsg(db_));
        }

        int col_count = sqlite3_column_count(stmt);
        result.columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            result.columns.push_back(name ? name : "");
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Row row;
            row.values.reserve(col_count);
            for (int i = 0; i < col_count; ++i) {
                row.values.push_back(make_sqlite_cell(stmt, i));
            }
            result.rows.push_back(std::move(row));
        }

        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw_error(rc, msg);
        }

        sqlite3_finalize(stmt);
        return result;
    }
};

} // namespace sqlnav
