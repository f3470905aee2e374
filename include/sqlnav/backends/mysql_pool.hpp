/**
 * sqlnav/backends/mysql_pool.hpp - MySQL / MariaDB adapter (libmysqlclient)
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Only compiled when the client library was found (SQLNAV_HAS_MYSQL).
 */

#pragma once

#include "../pool.hpp"
#include "../sql.hpp"
#include "mysql_types.hpp"

#include <mysql.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlnav {

class MySqlPool : public Pool {
public:
    explicit MySqlPool(const Connection& conn) { open(conn); }
    ~MySqlPool() override { close(); }

    MySqlPool(const MySqlPool&) = delete;
    MySqlPool& operator=(const MySqlPool&) = delete;

    EngineKind kind() const override { return EngineKind::MySql; }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mysql_) {
            mysql_close(mysql_);
            mysql_ = nullptr;
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return mysql_ != nullptr;
    }

    ExecuteOutcome execute(const std::string& statement) override {
        std::lock_guard<std::mutex> lock(mutex_);
        run(statement);
        // Drain a result set if the statement produced one.
        ResultPtr res(mysql_store_result(mysql_), &mysql_free_result);
        order_keys_.clear();
        ExecuteOutcome outcome;
        uint64_t affected = mysql_affected_rows(mysql_);
        if (affected != static_cast<uint64_t>(-1)) {
            outcome.affected_rows = affected;
        }
        return outcome;
    }

    std::vector<Database> list_databases() override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query("SELECT SCHEMA_NAME FROM information_schema.SCHEMATA ORDER BY SCHEMA_NAME");
        std::vector<Database> out;
        for (const auto& row : r.rows) {
            Database db;
            db.name = row[0].text;
            out.push_back(std::move(db));
        }
        return out;
    }

    std::vector<Table> list_tables(const std::string& database) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT TABLE_NAME, TABLE_TYPE FROM information_schema.TABLES "
            "WHERE TABLE_SCHEMA = " + literal(database) + " ORDER BY TABLE_NAME");
        std::vector<Table> out;
        for (const auto& row : r.rows) {
            Table t;
            t.name = row[0].text;
            t.database = database;
            t.kind = row[1].text == "VIEW" ? TableKind::View : TableKind::BaseTable;
            out.push_back(std::move(t));
        }
        return out;
    }

    RecordSet fetch_rows(const RecordsQuery& q) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return query(select_page_sql(EngineKind::MySql, q, order_key(q.table)));
    }

    RowCount count_rows(const RecordsQuery& q) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(count_sql(EngineKind::MySql, q));
        RowCount count;
        if (!r.empty() && !r[0][0].is_null()) {
            count.rows = std::stoull(r[0][0].text);
        }
        return count;
    }

    RowCount estimate_rows(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT TABLE_ROWS FROM information_schema.TABLES "
            "WHERE TABLE_SCHEMA = " + literal(table.database) +
            " AND TABLE_NAME = " + literal(table.name));
        RowCount count;
        count.exact = false;
        if (!r.empty() && !r[0][0].is_null()) {
            count.rows = std::stoull(r[0][0].text);
        }
        return count;
    }

    RecordSet fetch_columns(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_DEFAULT, COLUMN_KEY "
            "FROM information_schema.COLUMNS WHERE " + table_predicate(table) +
            " ORDER BY ORDINAL_POSITION");
        r.columns = column_metadata_headers();
        return r;
    }

    RecordSet fetch_constraints(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT tc.CONSTRAINT_NAME, tc.CONSTRAINT_TYPE, kcu.COLUMN_NAME "
            "FROM information_schema.TABLE_CONSTRAINTS tc "
            "LEFT JOIN information_schema.KEY_COLUMN_USAGE kcu "
            "  ON tc.CONSTRAINT_NAME = kcu.CONSTRAINT_NAME "
            "  AND tc.TABLE_SCHEMA = kcu.TABLE_SCHEMA AND tc.TABLE_NAME = kcu.TABLE_NAME "
            "WHERE tc.TABLE_SCHEMA = " + literal(table.database) +
            " AND tc.TABLE_NAME = " + literal(table.name) +
            " ORDER BY tc.CONSTRAINT_NAME");
        r.columns = constraint_headers();
        return r;
    }

    RecordSet fetch_foreign_keys(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT CONSTRAINT_NAME, COLUMN_NAME, REFERENCED_TABLE_NAME, REFERENCED_COLUMN_NAME "
            "FROM information_schema.KEY_COLUMN_USAGE WHERE " + table_predicate(table) +
            " AND REFERENCED_TABLE_NAME IS NOT NULL ORDER BY CONSTRAINT_NAME");
        r.columns = foreign_key_headers();
        return r;
    }

    RecordSet fetch_indexes(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT INDEX_NAME, COLUMN_NAME, "
            "CASE NON_UNIQUE WHEN 0 THEN 'YES' ELSE 'NO' END, INDEX_TYPE "
            "FROM information_schema.STATISTICS WHERE " + table_predicate(table) +
            " ORDER BY INDEX_NAME, SEQ_IN_INDEX");
        r.columns = index_headers();
        return r;
    }

private:
    using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

    MYSQL* mysql_ = nullptr;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::vector<std::string>> order_keys_;

    /**
     * Primary key columns, else every column in table order. Caller holds
     * mutex_.
     */
    const std::vector<std::string>& order_key(const Table& table) {
        const auto id = std::make_pair(table.database, table.name);
        auto it = order_keys_.find(id);
        if (it != order_keys_.end()) return it->second;

        RecordSet columns = query(
            "SELECT COLUMN_NAME FROM information_schema.KEY_COLUMN_USAGE WHERE " +
            table_predicate(table) + " AND CONSTRAINT_NAME = 'PRIMARY' ORDER BY ORDINAL_POSITION");
        if (columns.empty()) {
            columns = query(
                "SELECT COLUMN_NAME FROM information_schema.COLUMNS WHERE " +
                table_predicate(table) + " ORDER BY ORDINAL_POSITION");
        }
        std::vector<std::string> key;
        for (const auto& row : columns.rows) {
            key.push_back(quote_identifier(EngineKind::MySql, row[0].text));
        }
        return order_keys_.emplace(id, std::move(key)).first->second;
    }

    void open(const Connection& c) {
        mysql_ = mysql_init(nullptr);
        if (!mysql_) {
            throw ConnectivityError("out of memory allocating MySQL connection");
        }
        unsigned int timeout = 10;
        mysql_options(mysql_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
        mysql_options(mysql_, MYSQL_SET_CHARSET_NAME, "utf8mb4");

        unsigned int port = c.port > 0 ? static_cast<unsigned int>(c.port) : 3306u;
        if (!mysql_real_connect(mysql_, c.host.c_str(), c.user.c_str(), c.password.c_str(),
                                c.database.empty() ? nullptr : c.database.c_str(),
                                port, nullptr, 0)) {
            std::string msg = mysql_error(mysql_);
            mysql_close(mysql_);
            mysql_ = nullptr;
            throw ConnectivityError(msg);
        }
    }

    std::string literal(const std::string& value) const {
        return quote_literal(EngineKind::MySql, value);
    }

    std::string table_predicate(const Table& table) const {
        return "TABLE_SCHEMA = " + literal(table.database) +
               " AND TABLE_NAME = " + literal(table.name);
    }

    [[noreturn]] void throw_error() const {
        unsigned int code = mysql_errno(mysql_);
        std::string msg = mysql_error(mysql_);
        if (is_mysql_connectivity_errno(code)) throw ConnectivityError(msg);
        throw QueryError(msg);
    }

    /**
     * Caller holds mutex_.
     */
    void run(const std::string& sql) {
        if (!mysql_) throw ConnectivityError("connection is closed");
        if (mysql_real_query(mysql_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
            throw_error();
        }
    }

    RecordSet query(const std::string& sql) {
        run(sql);
        ResultPtr res(mysql_store_result(mysql_), &mysql_free_result);
        RecordSet result;
        if (!res) {
            if (mysql_field_count(mysql_) != 0) throw_error();
            return result;
        }

        const unsigned int col_count = mysql_num_fields(res.get());
        MYSQL_FIELD* fields = mysql_fetch_fields(res.get());
        std::vector<MySqlColumn> descriptors(col_count);
        result.columns.reserve(col_count);
        for (unsigned int i = 0; i < col_count; ++i) {
            result.columns.push_back(fields[i].name ? fields[i].name : "");
            descriptors[i].type = static_cast<MySqlFieldType>(fields[i].type);
            descriptors[i].charsetnr = fields[i].charsetnr;
            descriptors[i].length = fields[i].length;
            descriptors[i].is_unsigned = (fields[i].flags & UNSIGNED_FLAG) != 0;
        }

        MYSQL_ROW native;
        while ((native = mysql_fetch_row(res.get())) != nullptr) {
            unsigned long* lengths = mysql_fetch_lengths(res.get());
            Row row;
            row.values.reserve(col_count);
            for (unsigned int i = 0; i < col_count; ++i) {
                row.values.push_back(make_mysql_cell(descriptors[i], native[i], lengths[i]));
            }
            result.rows.push_back(std::move(row));
        }
        if (mysql_errno(mysql_) != 0) throw_error();
        return result;
    }
};

} // namespace sqlnav
