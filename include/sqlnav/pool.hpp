/**
 * sqlnav/pool.hpp - Database abstraction layer
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * A Pool is the open handle to one configured backend. Each engine
 * adapter implements this contract; the orchestrator and the UI are
 * written once against it and never branch on engine identity.
 *
 * Failure contract for every method:
 *   - throws ConnectivityError when the handle is unusable
 *   - throws QueryError when one request failed
 *
 * An adapter owns exactly one native handle and serializes calls on it,
 * so a Pool may be handed to several worker threads.
 */

#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sqlnav {

class Pool {
public:
    virtual ~Pool() = default;

    virtual EngineKind kind() const = 0;

    /**
     * Run a non-query statement and report the affected-row count.
     */
    virtual ExecuteOutcome execute(const std::string& statement) = 0;

    /**
     * Databases (or schemas) visible to the credential. Tables are not
     * filled in; use list_tables.
     */
    virtual std::vector<Database> list_databases() = 0;

    virtual std::vector<Table> list_tables(const std::string& database) = 0;

    /**
     * At most query.limit rows starting at query.offset. Column order is
     * stable across pages of the same query shape.
     */
    virtual RecordSet fetch_rows(const RecordsQuery& query) = 0;

    /**
     * Column metadata as rows: name, type, nullable, default, key.
     */
    virtual RecordSet fetch_columns(const Table& table) = 0;

    /**
     * Constraint metadata as rows: name, kind, column.
     */
    virtual RecordSet fetch_constraints(const Table& table) = 0;

    /**
     * Foreign keys as rows: name, column, ref_table, ref_column.
     */
    virtual RecordSet fetch_foreign_keys(const Table& table) = 0;

    /**
     * Indexes as rows: name, column, unique, kind.
     */
    virtual RecordSet fetch_indexes(const Table& table) = 0;

    /**
     * Exact COUNT(*) honouring the query's filter.
     */
    virtual RowCount count_rows(const RecordsQuery& query) = 0;

    /**
     * Catalogue estimate of a table's size. May be unknown.
     */
    virtual RowCount estimate_rows(const Table& table) = 0;

    /**
     * Release every backend resource. Idempotent.
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /**
     * Every database with its tables, the shape the schema tree shows.
     */
    std::vector<Database> load_schema() {
        std::vector<Database> databases = list_databases();
        for (auto& db : databases) {
            db.tables = list_tables(db.name);
        }
        return databases;
    }
};

using PoolFactory = std::function<std::shared_ptr<Pool>(const Connection&)>;

// Column headers shared by every adapter's metadata queries.
inline std::vector<std::string> column_metadata_headers() {
    return {"name", "type", "nullable", "default", "key"};
}

inline std::vector<std::string> constraint_headers() {
    return {"name", "kind", "column"};
}

inline std::vector<std::string> foreign_key_headers() {
    return {"name", "column", "ref_table", "ref_column"};
}

inline std::vector<std::string> index_headers() {
    return {"name", "column", "unique", "kind"};
}

} // namespace sqlnav
