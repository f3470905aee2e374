/**
 * sqlnav/backends/postgres_pool.hpp - PostgreSQL adapter (libpq)
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * A PostgreSQL connection is bound to one database, so the "databases"
 * this pool lists are the user schemas inside it, and tables are
 * addressed as "schema"."table".
 */

#pragma once

#include "../pool.hpp"
#include "../sql.hpp"
#include "postgres_types.hpp"

#include <libpq-fe.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlnav {

class PostgresPool : public Pool {
public:
    explicit PostgresPool(const Connection& conn) { open(conn); }
    ~PostgresPool() override { close(); }

    PostgresPool(const PostgresPool&) = delete;
    PostgresPool& operator=(const PostgresPool&) = delete;

    EngineKind kind() const override { return EngineKind::Postgres; }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
    }

    ExecuteOutcome execute(const std::string& statement) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ResultPtr res = exec(statement, {});
        order_keys_.clear();
        ExecuteOutcome outcome;
        const char* tuples = PQcmdTuples(res.get());
        if (tuples && *tuples) {
            outcome.affected_rows = std::strtoull(tuples, nullptr, 10);
        }
        return outcome;
    }

    std::vector<Database> list_databases() override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT schema_name FROM information_schema.schemata "
            "WHERE schema_name NOT IN ('pg_catalog', 'information_schema') "
            "AND schema_name NOT LIKE 'pg\\_toast%' "
            "AND schema_name NOT LIKE 'pg\\_temp\\_%' "
            "ORDER BY schema_name", {});
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
            "SELECT table_name, table_type FROM information_schema.tables "
            "WHERE table_schema = $1 ORDER BY table_name", {database});
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
        return query(select_page_sql(EngineKind::Postgres, q, order_key(q.table)), {});
    }

    RowCount count_rows(const RecordsQuery& q) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(count_sql(EngineKind::Postgres, q), {});
        RowCount count;
        if (!r.empty() && !r[0][0].is_null()) {
            count.rows = std::stoull(r[0][0].text);
        }
        return count;
    }

    RowCount estimate_rows(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT c.reltuples::bigint FROM pg_class c "
            "JOIN pg_namespace n ON n.oid = c.relnamespace "
            "WHERE n.nspname = $1 AND c.relname = $2",
            {table.database, table.name});
        RowCount count;
        count.exact = false;
        // reltuples is -1 for a table never vacuumed or analyzed
        if (!r.empty() && !r[0][0].is_null() && r[0][0].text[0] != '-') {
            count.rows = std::stoull(r[0][0].text);
        }
        return count;
    }

    RecordSet fetch_columns(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT c.column_name, c.data_type, c.is_nullable, c.column_default, "
            "CASE WHEN EXISTS ("
            "  SELECT 1 FROM information_schema.table_constraints tc "
            "  JOIN information_schema.key_column_usage k "
            "    ON tc.constraint_name = k.constraint_name AND tc.table_schema = k.table_schema "
            "  WHERE tc.constraint_type = 'PRIMARY KEY' AND tc.table_schema = c.table_schema "
            "    AND tc.table_name = c.table_name AND k.column_name = c.column_name"
            ") THEN 'PRI' ELSE '' END "
            "FROM information_schema.columns c "
            "WHERE c.table_schema = $1 AND c.table_name = $2 "
            "ORDER BY c.ordinal_position",
            {table.database, table.name});
        r.columns = column_metadata_headers();
        return r;
    }

    RecordSet fetch_constraints(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT tc.constraint_name, tc.constraint_type, kcu.column_name "
            "FROM information_schema.table_constraints tc "
            "LEFT JOIN information_schema.key_column_usage kcu "
            "  ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
            "WHERE tc.table_schema = $1 AND tc.table_name = $2 "
            "ORDER BY tc.constraint_name",
            {table.database, table.name});
        r.columns = constraint_headers();
        return r;
    }

    RecordSet fetch_foreign_keys(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT tc.constraint_name, kcu.column_name, ccu.table_name, ccu.column_name "
            "FROM information_schema.table_constraints tc "
            "JOIN information_schema.key_column_usage kcu "
            "  ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
            "JOIN information_schema.constraint_column_usage ccu "
            "  ON ccu.constraint_name = tc.constraint_name AND ccu.constraint_schema = tc.table_schema "
            "WHERE tc.constraint_type = 'FOREIGN KEY' AND tc.table_schema = $1 AND tc.table_name = $2 "
            "ORDER BY tc.constraint_name",
            {table.database, table.name});
        r.columns = foreign_key_headers();
        return r;
    }

    RecordSet fetch_indexes(const Table& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordSet r = query(
            "SELECT i.relname, a.attname, "
            "CASE WHEN ix.indisunique THEN 'YES' ELSE 'NO' END, upper(am.amname) "
            "FROM pg_class t "
            "JOIN pg_index ix ON t.oid = ix.indrelid "
            "JOIN pg_class i ON i.oid = ix.indexrelid "
            "JOIN pg_am am ON i.relam = am.oid "
            "JOIN pg_namespace n ON n.oid = t.relnamespace "
            "JOIN pg_attribute a ON a.attrelid = t.oid AND a.attnum = ANY(ix.indkey) "
            "WHERE n.nspname = $1 AND t.relname = $2 "
            "ORDER BY i.relname, a.attnum",
            {table.database, table.name});
        r.columns = index_headers();
        return r;
    }

private:
    using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

    PGconn* conn_ = nullptr;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::vector<std::string>> order_keys_;

    /**
     * Primary key columns, else the physical row address. Views have
     * neither and are left unordered. Caller holds mutex_.
     */
    const std::vector<std::string>& order_key(const Table& table) {
        const auto id = std::make_pair(table.database, table.name);
        auto it = order_keys_.find(id);
        if (it != order_keys_.end()) return it->second;

        RecordSet pk = query(
            "SELECT a.attname FROM pg_index ix "
            "JOIN pg_class t ON t.oid = ix.indrelid "
            "JOIN pg_namespace n ON n.oid = t.relnamespace "
            "JOIN pg_attribute a ON a.attrelid = t.oid AND a.attnum = ANY(ix.indkey) "
            "WHERE ix.indisprimary AND n.nspname = $1 AND t.relname = $2 "
            "ORDER BY array_position(ix.indkey::int2[], a.attnum)",
            {table.database, table.name});

        std::vector<std::string> key;
        for (const auto& row : pk.rows) {
            key.push_back(quote_identifier(EngineKind::Postgres, row[0].text));
        }
        if (key.empty()) {
            RecordSet kind = query(
                "SELECT c.relkind FROM pg_class c "
                "JOIN pg_namespace n ON n.oid = c.relnamespace "
                "WHERE n.nspname = $1 AND c.relname = $2",
                {table.database, table.name});
            const std::string relkind = kind.empty() ? std::string() : kind[0][0].text;
            if (relkind == "r" || relkind == "m") {
                key.push_back("ctid");
            } else if (relkind == "p") {
                // ctid is only unique within one partition
                key.push_back("tableoid");
                key.push_back("ctid");
            }
        }
        return order_keys_.emplace(id, std::move(key)).first->second;
    }

    void open(const Connection& c) {
        std::string port = c.port > 0 ? std::to_string(c.port) : std::string("5432");
        std::string dbname = c.database.empty() ? std::string("postgres") : c.database;
        const char* keywords[] = {"host", "port", "user", "password", "dbname",
                                  "connect_timeout", "application_name", nullptr};
        const char* values[] = {c.host.c_str(), port.c_str(), c.user.c_str(),
                                c.password.c_str(), dbname.c_str(), "10", "sqlnav", nullptr};

        conn_ = PQconnectdbParams(keywords, values, 0);
        if (!conn_) {
            throw ConnectivityError("out of memory allocating PostgreSQL connection");
        }
        if (PQstatus(conn_) != CONNECTION_OK) {
            std::string msg = PQerrorMessage(conn_);
            PQfinish(conn_);
            conn_ = nullptr;
            throw ConnectivityError(trim(msg));
        }
        PQsetClientEncoding(conn_, "UTF8");
    }

    static std::string trim(std::string s) {
        while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) s.pop_back();
        return s;
    }

    /**
     * Caller holds mutex_.
     */
    ResultPtr exec(const std::string& sql, const std::vector<std::string>& params) {
        if (!conn_) throw ConnectivityError("connection is closed");

        std::vector<const char*> values;
        values.reserve(params.size());
        for (const auto& p : params) values.push_back(p.c_str());

        ResultPtr res(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                   nullptr, values.empty() ? nullptr : values.data(),
                                   nullptr, nullptr, 0),
                      &PQclear);

        ExecStatusType status = res ? PQresultStatus(res.get()) : PGRES_FATAL_ERROR;
        if (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK) {
            return res;
        }

        std::string msg = res ? PQresultErrorMessage(res.get()) : PQerrorMessage(conn_);
        if (PQstatus(conn_) == CONNECTION_BAD) {
            throw ConnectivityError(trim(msg));
        }
        throw QueryError(trim(msg));
    }

    RecordSet query(const std::string& sql, const std::vector<std::string>& params) {
        ResultPtr res = exec(sql, params);
        RecordSet result;

        const int col_count = PQnfields(res.get());
        const int row_count = PQntuples(res.get());
        result.columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            const char* name = PQfname(res.get(), i);
            result.columns.push_back(name ? name : "");
        }

        result.rows.reserve(row_count);
        for (int r = 0; r < row_count; ++r) {
            Row row;
            row.values.reserve(col_count);
            for (int i = 0; i < col_count; ++i) {
                row.values.push_back(make_postgres_cell(
                    PQftype(res.get(), i),
                    PQgetvalue(res.get(), r, i),
                    PQgetlength(res.get(), r, i),
                    PQgetisnull(res.get(), r, i) != 0));
            }
            result.rows.push_back(std::move(row));
        }
        return result;
    }
};

} // namespace sqlnav
