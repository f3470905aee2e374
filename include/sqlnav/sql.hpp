/**
 * sqlnav/sql.hpp - Dialect-aware SQL text for paged reads
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 *   RecordsQuery q;
 *   q.table = {"users", "app"};
 *   q.offset = 200; q.limit = 100;
 *   q.filter = "age > 30";
 *   q.sort = SortSpec{"name", SortDirection::Descending};
 *
 *   select_page_sql(EngineKind::MySql, q, {"`id`"});
 *   // SELECT * FROM `app`.`users` WHERE (age > 30
 *   // ) ORDER BY `name` DESC, `id` LIMIT 100 OFFSET 200
 *
 * The filter is bracketed on its own line so a trailing "--" comment in
 * it cannot swallow the clauses that follow. The order key (already
 * quoted SQL expressions) follows the sort column, which keeps the row
 * order of successive pages stable.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <vector>

namespace sqlnav {

inline std::string quote_identifier(EngineKind engine, const std::string& name) {
    const char q = engine == EngineKind::MySql ? '`' : '"';
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back(q);
    for (char c : name) {
        if (c == q) out.push_back(q);
        out.push_back(c);
    }
    out.push_back(q);
    return out;
}

/**
 * String literal for metadata lookups. MySQL also treats backslash as an
 * escape character in its default SQL mode.
 */
inline std::string quote_literal(EngineKind engine, const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "''";
        } else if (c == '\\' && engine == EngineKind::MySql) {
            out += "\\\\";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

inline std::string qualified_name(EngineKind engine, const Table& table) {
    if (table.database.empty()) {
        return quote_identifier(engine, table.name);
    }
    return quote_identifier(engine, table.database) + "." +
           quote_identifier(engine, table.name);
}

namespace detail {

inline std::string where_clause(const RecordsQuery& q) {
    if (q.filter.empty()) return {};
    return " WHERE (" + q.filter + "\n)";
}

} // namespace detail

inline std::vector<std::string> quoted_columns(EngineKind engine,
                                               const std::vector<std::string>& names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& n : names) out.push_back(quote_identifier(engine, n));
    return out;
}

inline std::string select_page_sql(EngineKind engine, const RecordsQuery& q,
                                   const std::vector<std::string>& order_key = {}) {
    std::string sql = "SELECT * FROM " + qualified_name(engine, q.table);
    sql += detail::where_clause(q);

    std::vector<std::string> order;
    std::string sorted;
    if (q.sort && !q.sort->column.empty()) {
        sorted = quote_identifier(engine, q.sort->column);
        order.push_back(sorted + (q.sort->direction == SortDirection::Descending ? " DESC" : " ASC"));
    }
    for (const auto& key : order_key) {
        if (key != sorted) order.push_back(key);
    }
    for (size_t i = 0; i < order.size(); ++i) {
        sql += i == 0 ? " ORDER BY " : ", ";
        sql += order[i];
    }

    sql += " LIMIT " + std::to_string(q.limit);
    sql += " OFFSET " + std::to_string(q.offset);
    return sql;
}

inline std::string count_sql(EngineKind engine, const RecordsQuery& q) {
    return "SELECT COUNT(*) FROM " + qualified_name(engine, q.table) +
           detail::where_clause(q);
}

} // namespace sqlnav
