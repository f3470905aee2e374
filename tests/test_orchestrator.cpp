/**
 * test_orchestrator.cpp - Tests for off-thread requests and supersession
 */

#include <gtest/gtest.h>
#include <sqlnav/orchestrator.hpp>

#include "fake_pool.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sqlnav;
using sqlnav::testing::FakePool;
using sqlnav::testing::make_rows;

namespace {

RecordsQuery records(const std::string& filter) {
    RecordsQuery q;
    q.table = Table{"t", "main"};
    q.limit = 100;
    q.filter = filter;
    return q;
}

std::shared_ptr<Pool> no_factory(const Connection&) {
    throw ConnectivityError("no factory in this test");
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakePool> pool_ = std::make_shared<FakePool>();
    std::mutex log_mutex_;
    std::vector<std::string> log_;

    void SetUp() override {
        pool_->results["a"] = make_rows(3, 2, "a");
        pool_->results["b"] = make_rows(5, 2, "b");
    }

    void capture(Orchestrator& orch) {
        orch.set_log_func([this](LogLevel, const std::string& msg) {
            std::lock_guard<std::mutex> lock(log_mutex_);
            log_.push_back(msg);
        });
    }

    bool logged(const std::string& needle) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        for (const auto& line : log_) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    // Drain until `token` is delivered or the timeout expires.
    std::vector<Delivery> drain_until(Orchestrator& orch, const Token& token,
                                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::vector<Delivery> out;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            orch.wait(std::chrono::milliseconds(20));
            for (auto& d : orch.drain()) {
                bool done = d.token == token;
                out.push_back(std::move(d));
                if (done) return out;
            }
        }
        return out;
    }
};

TEST_F(OrchestratorTest, SlotForEachRequest) {
    EXPECT_EQ(slot_for(request::Connect{}), Slot::Connect);
    EXPECT_EQ(slot_for(request::LoadSchema{}), Slot::Schema);
    EXPECT_EQ(slot_for(request::FetchRows{}), Slot::Records);
    EXPECT_EQ(slot_for(request::CountRows{}), Slot::RowCount);
    EXPECT_EQ(slot_for(request::FetchProperties{}), Slot::Properties);
    EXPECT_EQ(slot_for(request::Execute{}), Slot::Statement);
}

TEST_F(OrchestratorTest, TokensAreUnique) {
    Orchestrator orch(no_factory);
    Token a = orch.submit(pool_, request::FetchRows{records("a")});
    Token b = orch.submit(pool_, request::FetchRows{records("a")});
    EXPECT_TRUE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_NE(a, b);
    EXPECT_FALSE(Token{}.valid());
}

TEST_F(OrchestratorTest, DeliversRows) {
    Orchestrator orch(no_factory);
    Token t = orch.submit(pool_, request::FetchRows{records("a")});
    EXPECT_TRUE(orch.is_current(t));
    EXPECT_TRUE(orch.pending(Slot::Records));

    auto got = drain_until(orch, t);
    ASSERT_EQ(got.size(), 1u);
    ASSERT_TRUE(got[0].ok());
    const RecordSet* rs = got[0].get<RecordSet>();
    ASSERT_NE(rs, nullptr);
    EXPECT_EQ(rs->size(), 3u);
    EXPECT_EQ((*rs)[0][0].text, "a0_0");

    // Delivered token is retired
    EXPECT_FALSE(orch.is_current(t));
    EXPECT_FALSE(orch.pending(Slot::Records));
}

TEST_F(OrchestratorTest, StaleResultIsDiscarded) {
    Orchestrator orch(no_factory);
    capture(orch);
    pool_->block("a");

    Token first = orch.submit(pool_, request::FetchRows{records("a")});
    ASSERT_TRUE(pool_->wait_started("a"));
    Token second = orch.submit(pool_, request::FetchRows{records("b")});
    EXPECT_FALSE(orch.is_current(first));
    EXPECT_TRUE(orch.is_current(second));

    auto got = drain_until(orch, second);
    ASSERT_FALSE(got.empty());
    EXPECT_EQ(got.back().token, second);
    EXPECT_EQ(got.back().get<RecordSet>()->size(), 5u);

    // The superseded fetch finishes late and never surfaces.
    pool_->release("a");
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!logged("discard stale #" + std::to_string(first.id)) &&
           std::chrono::steady_clock::now() < deadline) {
        orch.wait(std::chrono::milliseconds(20));
        for (const auto& d : orch.drain()) {
            EXPECT_NE(d.token, first);
        }
    }
    EXPECT_TRUE(logged("discard stale #" + std::to_string(first.id)));
}

TEST_F(OrchestratorTest, SupersededJobNeverRuns) {
    Orchestrator orch(no_factory, 1);
    pool_->block("a");
    Token blocker = orch.submit(pool_, request::FetchRows{records("a")});
    ASSERT_TRUE(pool_->wait_started("a"));

    // Queued behind the blocker, then replaced before a worker picks it up.
    orch.submit(pool_, request::FetchRows{records("skipped")});
    Token last = orch.submit(pool_, request::FetchRows{records("b")});
    pool_->release("a");

    auto got = drain_until(orch, last);
    ASSERT_FALSE(got.empty());
    EXPECT_EQ(got.back().token, last);
    for (const auto& d : got) EXPECT_NE(d.token, blocker);

    for (const auto& q : pool_->fetches()) {
        EXPECT_NE(q.filter, "skipped");
    }
}

TEST_F(OrchestratorTest, SlotsAreIndependent) {
    Orchestrator orch(no_factory);
    Token rows = orch.submit(pool_, request::FetchRows{records("a")});
    Token count = orch.submit(pool_, request::CountRows{records("b"), false});
    EXPECT_TRUE(orch.is_current(rows));
    EXPECT_TRUE(orch.is_current(count));

    auto got = drain_until(orch, count);
    bool saw_count = false;
    for (const auto& d : got) {
        if (d.token == count) {
            ASSERT_NE(d.get<RowCount>(), nullptr);
            EXPECT_EQ(*d.get<RowCount>()->rows, 5u);
            saw_count = true;
        }
    }
    EXPECT_TRUE(saw_count);
}

TEST_F(OrchestratorTest, EstimateUsesPoolEstimate) {
    Orchestrator orch(no_factory);
    pool_->estimate = 1000;
    Token t = orch.submit(pool_, request::CountRows{records(""), true});
    auto got = drain_until(orch, t);
    ASSERT_FALSE(got.empty());
    const RowCount* c = got.back().get<RowCount>();
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(*c->rows, 1000u);
    EXPECT_FALSE(c->exact);
}

TEST_F(OrchestratorTest, SupersedeSlotDropsResult) {
    Orchestrator orch(no_factory);
    pool_->block("a");
    Token t = orch.submit(pool_, request::FetchRows{records("a")});
    ASSERT_TRUE(pool_->wait_started("a"));
    orch.supersede(Slot::Records);
    EXPECT_FALSE(orch.is_current(t));
    EXPECT_FALSE(orch.pending(Slot::Records));
    pool_->release("a");

    auto got = drain_until(orch, t, std::chrono::milliseconds(300));
    EXPECT_TRUE(got.empty());
}

TEST_F(OrchestratorTest, QueryErrorIsTagged) {
    Orchestrator orch(no_factory);
    pool_->fail_next(ErrorKind::Query, "syntax error near WHERE");
    Token t = orch.submit(pool_, request::FetchRows{records("a")});
    auto got = drain_until(orch, t);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_FALSE(got[0].ok());
    EXPECT_EQ(got[0].error_kind, ErrorKind::Query);
    EXPECT_EQ(got[0].error, "syntax error near WHERE");
}

TEST_F(OrchestratorTest, ConnectivityErrorIsTagged) {
    Orchestrator orch(no_factory);
    pool_->fail_next(ErrorKind::Connectivity, "server closed the connection");
    Token t = orch.submit(pool_, request::LoadSchema{});
    auto got = drain_until(orch, t);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].error_kind, ErrorKind::Connectivity);
}

TEST_F(OrchestratorTest, MissingPoolIsConnectivityError) {
    Orchestrator orch(no_factory);
    Token t = orch.submit(nullptr, request::FetchRows{records("a")});
    auto got = drain_until(orch, t);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].error_kind, ErrorKind::Connectivity);
    EXPECT_EQ(got[0].error, "not connected");
}

TEST_F(OrchestratorTest, ConnectUsesFactory) {
    Connection seen;
    Orchestrator orch([&](const Connection& c) -> std::shared_ptr<Pool> {
        seen = c;
        return pool_;
    });
    Connection c;
    c.kind = EngineKind::Sqlite;
    c.path = "/tmp/x.db";
    Token t = orch.submit(nullptr, request::Connect{c});
    auto got = drain_until(orch, t);
    ASSERT_EQ(got.size(), 1u);
    ASSERT_TRUE(got[0].ok());
    auto* pool = got[0].get<std::shared_ptr<Pool>>();
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->get(), pool_.get());
    EXPECT_EQ(seen.path, "/tmp/x.db");
}

TEST_F(OrchestratorTest, ConnectFailureIsConnectivity) {
    Orchestrator orch(no_factory);
    Token t = orch.submit(nullptr, request::Connect{Connection{}});
    auto got = drain_until(orch, t);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].error_kind, ErrorKind::Connectivity);
    EXPECT_EQ(got[0].error, "no factory in this test");
}

TEST_F(OrchestratorTest, WorkerReleasesPool) {
    Orchestrator orch(no_factory);
    Token t = orch.submit(pool_, request::Execute{"UPDATE t SET x = 1"});
    auto got = drain_until(orch, t);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].get<ExecuteOutcome>()->affected_rows, 3u);
    EXPECT_EQ(pool_.use_count(), 1);
    ASSERT_EQ(pool_->statements().size(), 1u);
}

TEST_F(OrchestratorTest, RetiredPoolClosesWhenLastJobEnds) {
    Orchestrator orch(no_factory);
    auto retired = std::make_shared<FakePool>();
    retired->results["a"] = make_rows(1, 1);
    retired->block("a");
    orch.submit(retired, request::FetchRows{records("a")});
    ASSERT_TRUE(retired->wait_started("a"));

    std::weak_ptr<FakePool> weak = retired;
    FakePool* raw = retired.get();
    orch.supersede_all();
    retired.reset();
    EXPECT_FALSE(weak.expired());
    raw->release("a");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!weak.expired() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(weak.expired());
}

TEST_F(OrchestratorTest, DescribeNamesRequest) {
    EXPECT_EQ(describe(request::LoadSchema{}), "load schema");
    EXPECT_EQ(describe(request::Execute{"DELETE FROM t"}), "execute DELETE FROM t");
}

TEST_F(OrchestratorTest, StopDropsQueuedJobs) {
    Orchestrator orch(no_factory, 1);
    pool_->block("a");
    orch.submit(pool_, request::FetchRows{records("a")});
    ASSERT_TRUE(pool_->wait_started("a"));
    orch.submit(pool_, request::FetchRows{records("b")});
    std::thread releaser([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pool_->release("a");
    });
    orch.stop();
    releaser.join();
    EXPECT_EQ(pool_->fetches().size(), 1u);
}
