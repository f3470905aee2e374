/**
 * sqlnav/orchestrator.hpp - Off-thread query execution with supersession
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * The main loop submits requests and gets a Token back immediately.
 * Worker threads run the request against the Pool and push a Delivery
 * into an inbox that the main loop drains once per iteration.
 *
 *   sqlnav::Orchestrator orch(sqlnav::open_pool);
 *   auto token = orch.submit(pool, sqlnav::request::FetchRows{q});
 *   ...
 *   for (auto& d : orch.drain()) {
 *       if (!d.ok()) show(d.error);
 *       else if (auto* rows = d.get<sqlnav::RecordSet>()) ingest(d.token, *rows);
 *   }
 *
 * Each request belongs to a logical slot (the current table page, the
 * schema tree, ...). Submitting to a slot supersedes whatever was there:
 * the older job is skipped if it has not started and its result is
 * discarded if it has. Tokens, not arrival order, decide relevance, so
 * deliveries may arrive in completion order.
 */

#pragma once

#include "errors.hpp"
#include "log.hpp"
#include "pool.hpp"
#include "types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

namespace sqlnav {

// ============================================================================
// Slots and Tokens
// ============================================================================

enum class Slot {
    Connect,
    Schema,
    Records,
    RowCount,
    Properties,
    Statement
};

constexpr size_t slot_count = 6;

inline const char* slot_name(Slot s) {
    switch (s) {
        case Slot::Connect:    return "connect";
        case Slot::Schema:     return "schema";
        case Slot::Records:    return "records";
        case Slot::RowCount:   return "row-count";
        case Slot::Properties: return "properties";
        case Slot::Statement:  return "statement";
    }
    return "?";
}

/**
 * Opaque identifier of one submission. id 0 never names a submission.
 */
struct Token {
    uint64_t id = 0;
    Slot slot = Slot::Records;

    bool valid() const { return id != 0; }
    bool operator==(const Token& other) const { return id == other.id && slot == other.slot; }
    bool operator!=(const Token& other) const { return !(*this == other); }
};

// ============================================================================
// Requests and Outcomes
// ============================================================================

enum class PropertyKind {
    Columns,
    Constraints,
    ForeignKeys,
    Indexes
};

namespace request {

struct Connect {
    Connection connection;
};

struct LoadSchema {};

struct FetchRows {
    RecordsQuery query;
};

struct CountRows {
    RecordsQuery query;
    bool estimate = false;
};

struct FetchProperties {
    Table table;
    PropertyKind kind = PropertyKind::Columns;
};

struct Execute {
    std::string statement;
};

} // namespace request

using Request = std::variant<request::Connect,
                             request::LoadSchema,
                             request::FetchRows,
                             request::CountRows,
                             request::FetchProperties,
                             request::Execute>;

using Outcome = std::variant<std::monostate,
                             std::shared_ptr<Pool>,
                             std::vector<Database>,
                             RecordSet,
                             RowCount,
                             ExecuteOutcome>;

inline Slot slot_for(const Request& r) {
    switch (r.index()) {
        case 0: return Slot::Connect;
        case 1: return Slot::Schema;
        case 2: return Slot::Records;
        case 3: return Slot::RowCount;
        case 4: return Slot::Properties;
        default: return Slot::Statement;
    }
}

inline std::string describe(const Request& r) {
    struct Describe {
        std::string operator()(const request::Connect& c) const {
            return std::string("connect ") + engine_kind_name(c.connection.kind) + " " + c.connection.label();
        }
        std::string operator()(const request::LoadSchema&) const { return "load schema"; }
        std::string operator()(const request::FetchRows& f) const {
            return "rows " + f.query.table.database + "." + f.query.table.name +
                   " offset=" + std::to_string(f.query.offset) +
                   " limit=" + std::to_string(f.query.limit) +
                   (f.query.filter.empty() ? "" : " filter=" + f.query.filter);
        }
        std::string operator()(const request::CountRows& c) const {
            return std::string(c.estimate ? "estimate " : "count ") +
                   c.query.table.database + "." + c.query.table.name;
        }
        std::string operator()(const request::FetchProperties& p) const {
            return "properties " + p.table.database + "." + p.table.name;
        }
        std::string operator()(const request::Execute& e) const { return "execute " + e.statement; }
    };
    return std::visit(Describe{}, r);
}

/**
 * Result of one submission, tagged with its token.
 */
struct Delivery {
    Token token;
    Request request;
    Outcome outcome;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    bool ok() const { return error_kind == ErrorKind::None; }

    template<typename T>
    const T* get() const { return std::get_if<T>(&outcome); }

    template<typename T>
    T* get() { return std::get_if<T>(&outcome); }
};

// ============================================================================
// Orchestrator
// ============================================================================

class Orchestrator {
public:
    explicit Orchestrator(PoolFactory factory, size_t workers = 2)
        : factory_(std::move(factory)) {
        if (workers == 0) workers = 1;
        for (size_t i = 0; i < workers; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~Orchestrator() {
        stop();
    }

    // Non-copyable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void set_log_func(log_func_t func) { log_func_ = std::move(func); }

    /**
     * Enqueue a request and return at once. `pool` may be null only for
     * request::Connect. Supersedes any earlier submission to the same slot.
     */
    Token submit(std::shared_ptr<Pool> pool, Request request) {
        Job job;
        job.token.id = next_id_++;
        job.token.slot = slot_for(request);
        job.pool = std::move(pool);
        job.request = std::move(request);

        log(LogLevel::Debug, "submit #" + std::to_string(job.token.id) + " [" +
                             slot_name(job.token.slot) + "] " + describe(job.request));

        Token token = job.token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_[index(token.slot)] = token.id;
            queue_.push_back(std::move(job));
        }
        queue_cv_.notify_one();
        return token;
    }

    /**
     * Non-blocking. Returns every delivery that is still relevant, in
     * completion order; superseded ones are dropped unexamined.
     */
    std::vector<Delivery> drain() {
        std::deque<Delivery> arrived;
        std::vector<Delivery> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            arrived.swap(inbox_);
            for (auto& d : arrived) {
                if (current_[index(d.token.slot)] != d.token.id) {
                    discarded_.push_back(d.token);
                    continue;
                }
                current_[index(d.token.slot)] = 0;
                out.push_back(std::move(d));
            }
        }
        for (const auto& t : discarded_) {
            log(LogLevel::Debug, "discard stale #" + std::to_string(t.id) + " [" + slot_name(t.slot) + "]");
        }
        discarded_.clear();
        return out;
    }

    /**
     * Block until something lands in the inbox or the timeout passes.
     */
    bool wait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return inbox_cv_.wait_for(lock, timeout, [this] { return !inbox_.empty(); });
    }

    /**
     * Forget the slot's outstanding submission; its result will be dropped.
     */
    void supersede(Slot slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_[index(slot)] = 0;
    }

    void supersede_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.fill(0);
    }

    bool is_current(const Token& token) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return token.valid() && current_[index(token.slot)] == token.id;
    }

    /**
     * True while a submission to the slot is queued or running.
     */
    bool pending(Slot slot) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_[index(slot)] != 0;
    }

    /**
     * Stop workers. Jobs not yet started are dropped.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
            stopping_ = true;
            queue_.clear();
        }
        queue_cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

private:
    struct Job {
        Token token;
        std::shared_ptr<Pool> pool;
        Request request;
    };

    struct Executor {
        Pool* pool;
        const PoolFactory& factory;

        Pool& require_pool() const {
            if (!pool) throw ConnectivityError("not connected");
            return *pool;
        }

        Outcome operator()(const request::Connect& c) const {
            return factory(c.connection);
        }
        Outcome operator()(const request::LoadSchema&) const {
            return require_pool().load_schema();
        }
        Outcome operator()(const request::FetchRows& f) const {
            return require_pool().fetch_rows(f.query);
        }
        Outcome operator()(const request::CountRows& c) const {
            if (c.estimate) return require_pool().estimate_rows(c.query.table);
            return require_pool().count_rows(c.query);
        }
        Outcome operator()(const request::FetchProperties& p) const {
            switch (p.kind) {
                case PropertyKind::Columns:     return require_pool().fetch_columns(p.table);
                case PropertyKind::Constraints: return require_pool().fetch_constraints(p.table);
                case PropertyKind::ForeignKeys: return require_pool().fetch_foreign_keys(p.table);
                case PropertyKind::Indexes:     return require_pool().fetch_indexes(p.table);
            }
            return std::monostate{};
        }
        Outcome operator()(const request::Execute& e) const {
            return require_pool().execute(e.statement);
        }
    };

    PoolFactory factory_;
    log_func_t log_func_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable inbox_cv_;
    std::deque<Job> queue_;
    std::deque<Delivery> inbox_;
    std::array<uint64_t, slot_count> current_{};
    std::vector<Token> discarded_;
    bool stopping_ = false;
    std::atomic<uint64_t> next_id_{1};

    static size_t index(Slot s) { return static_cast<size_t>(s); }

    void log(LogLevel level, const std::string& msg) const {
        if (log_func_) log_func_(level, msg);
    }

    void worker_loop() {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (stopping_) return;
                job = std::move(queue_.front());
                queue_.pop_front();
                if (current_[index(job.token.slot)] != job.token.id) {
                    continue;  // superseded before it started
                }
            }

            Delivery d = run(job);
            // Release the pool before handing over, so a retired pool
            // closes on this thread rather than the main loop.
            job.pool.reset();

            if (d.ok()) {
                log(LogLevel::Debug, "done #" + std::to_string(d.token.id));
            } else {
                log(d.error_kind == ErrorKind::Connectivity ? LogLevel::Error : LogLevel::Warn,
                    "failed #" + std::to_string(d.token.id) + ": " + d.error);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                inbox_.push_back(std::move(d));
            }
            inbox_cv_.notify_all();
        }
    }

    Delivery run(Job& job) {
        Delivery d;
        d.token = job.token;
        d.request = job.request;
        try {
            d.outcome = std::visit(Executor{job.pool.get(), factory_}, job.request);
        } catch (const ConnectivityError& e) {
            d.error_kind = ErrorKind::Connectivity;
            d.error = e.what();
        } catch (const std::exception& e) {
            d.error_kind = ErrorKind::Query;
            d.error = e.what();
        }
        return d;
    }
};

} // namespace sqlnav
