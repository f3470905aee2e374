/**
 * sqlnav/types.hpp - Core data model shared by adapters, orchestrator and UI
 *
 * Part of sqlnav - a terminal browser for relational databases.
 */

#pragma once

#include "cell.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlnav {

// ============================================================================
// Connections
// ============================================================================

enum class EngineKind {
    MySql,
    Postgres,
    Sqlite
};

inline const char* engine_kind_name(EngineKind k) {
    switch (k) {
        case EngineKind::MySql:    return "mysql";
        case EngineKind::Postgres: return "postgres";
        case EngineKind::Sqlite:   return "sqlite";
    }
    return "sqlite";
}

/**
 * One configured backend target. Network engines use host/port/user/
 * password/database; the embedded engine uses path.
 */
struct Connection {
    EngineKind kind = EngineKind::Sqlite;
    std::string name;
    std::string host;
    int port = 0;
    std::string user;
    std::string password;
    std::string database;
    std::string path;

    /**
     * Label shown in the connection list.
     */
    std::string label() const {
        if (!name.empty()) return name;
        if (kind == EngineKind::Sqlite) return path;
        std::string s = user.empty() ? host : user + "@" + host;
        if (port > 0) s += ":" + std::to_string(port);
        if (!database.empty()) s += "/" + database;
        return s;
    }
};

// ============================================================================
// Schema
// ============================================================================

enum class TableKind {
    BaseTable,
    View
};

struct Table {
    std::string name;
    std::string database;
    TableKind kind = TableKind::BaseTable;

    bool operator==(const Table& other) const {
        return name == other.name && database == other.database;
    }
    bool operator!=(const Table& other) const { return !(*this == other); }
};

struct Database {
    std::string name;
    std::vector<Table> tables;
};

// ============================================================================
// Result Types
// ============================================================================

struct Row {
    std::vector<Cell> values;

    const Cell& operator[](size_t i) const { return values[i]; }
    Cell& operator[](size_t i) { return values[i]; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }

    bool operator==(const Row& other) const { return values == other.values; }
};

/**
 * One page of rows plus the column header for that page.
 */
struct RecordSet {
    std::vector<std::string> columns;
    std::vector<Row> rows;

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    const Row& operator[](size_t i) const { return rows[i]; }

    auto begin() { return rows.begin(); }
    auto end() { return rows.end(); }
    auto begin() const { return rows.begin(); }
    auto end() const { return rows.end(); }
};

// ============================================================================
// Queries
// ============================================================================

enum class SortDirection {
    Ascending,
    Descending
};

struct SortSpec {
    std::string column;
    SortDirection direction = SortDirection::Ascending;

    bool operator==(const SortSpec& other) const {
        return column == other.column && direction == other.direction;
    }
    bool operator!=(const SortSpec& other) const { return !(*this == other); }
};

/**
 * A paged read of one table. `filter` is a WHERE fragment pushed to the
 * engine verbatim; empty means no filter.
 */
struct RecordsQuery {
    Table table;
    uint64_t offset = 0;
    uint64_t limit = 0;
    std::string filter;
    std::optional<SortSpec> sort;
};

struct ExecuteOutcome {
    uint64_t affected_rows = 0;
};

/**
 * Total row figure for a query. `exact` is false for catalogue estimates.
 */
struct RowCount {
    std::optional<uint64_t> rows;
    bool exact = true;
};

} // namespace sqlnav
