#include "EngineFixture.hpp"
#include <atomic>
#include <sstream>
#include <thread>
#include "AdminConsole.hpp"

using namespace std;

namespace {
const RateTable kRates = {{"cpu", 1}, {"gpu", 10}};
}

class ConcurrentAccountingTest : public EngineTest {};

TEST_F(ConcurrentAccountingTest, ParallelAddsLoseNoUpdates) {
    set_balance("alice", 0);

    const int kThreads = 8;
    const int kPerThread = 50;
    atomic<int> failures{0};

    vector<thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                string err;
                int64_t after = 0;
                if (!ledger().add_balance("alice", 1, "worker", "", after, err)) ++failures;
            }
        });
    }
    for (auto &w : workers) w.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(balance("alice"), kThreads * kPerThread);
    EXPECT_EQ(count_type("alice", TxType::Add), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(ConcurrentAccountingTest, EndRacingReclaimHasOneWinner) {
    for (int round = 0; round < 20; ++round) {
        string user = "racer" + to_string(round);
        set_balance(user, 1000);
        int64_t id = backdated_session(user, "gpu", 600);

        int64_t duration = 0, consumed = 0;
        vector<ReclaimedSession> reclaimed;
        bool end_ok = false, reclaim_ok = false;

        thread ender([&] {
            string err;
            end_ok = engine->sessions().end_session(id, kRates, duration, consumed, err);
        });
        thread reclaimer([&] {
            string err;
            reclaim_ok = engine->reclaimer().reclaim(480, reclaimed, err);
        });
        ender.join();
        reclaimer.join();

        ASSERT_TRUE(end_ok);
        ASSERT_TRUE(reclaim_ok);

        UsageSession s = session(id);
        bool ended = consumed > 0;
        bool cleaned = false;
        for (const auto &r : reclaimed) {
            if (r.session_id == id) cleaned = true;
        }
        EXPECT_NE(ended, cleaned) << "round " << round;

        if (ended) {
            EXPECT_EQ(s.status, SessionStatus::Completed);
            EXPECT_EQ(balance(user), 1000 - min<int64_t>(consumed, 1000));
        } else {
            EXPECT_EQ(s.status, SessionStatus::CleanedUp);
            EXPECT_EQ(balance(user), 1000);
        }
    }
}

TEST_F(ConcurrentAccountingTest, ConcurrentEndsChargeOnce) {
    set_balance("bob", 10000);
    int64_t id = backdated_session("bob", "cpu", 15);

    const int kThreads = 6;
    atomic<int> charged{0};
    vector<thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&] {
            string err;
            int64_t duration = 0, consumed = 0;
            if (engine->sessions().end_session(id, kRates, duration, consumed, err) &&
                consumed > 0) {
                ++charged;
            }
        });
    }
    for (auto &w : workers) w.join();

    EXPECT_EQ(charged.load(), 1);
    EXPECT_EQ(count_type("bob", TxType::Usage), 1u);
    EXPECT_EQ(balance("bob"), 10000 - 15);
}

TEST_F(ConcurrentAccountingTest, RefreshAlongsideUsageKeepsAuditConsistent) {
    for (int i = 0; i < 10; ++i) set_balance("user" + to_string(i), 5);

    thread refresher([&] {
        RefreshRequest req;
        req.amount = 10;
        req.targets.has_balance_below = true;
        req.targets.balance_below = 100;
        for (int i = 0; i < 5; ++i) {
            RefreshResult r;
            string err;
            EXPECT_TRUE(engine->refresher().refresh(req, r, err)) << err;
            EXPECT_EQ(r.failed, 0);
        }
    });
    thread consumer([&] {
        for (int round = 0; round < 5; ++round) {
            for (int i = 0; i < 10; ++i) {
                string err;
                int64_t after = 0;
                EXPECT_TRUE(ledger().deduct_for_usage("user" + to_string(i), 3, "cpu",
                                                      after, err)) << err;
            }
        }
    });
    refresher.join();
    consumer.join();

    for (int i = 0; i < 10; ++i) {
        string user = "user" + to_string(i);
        auto txs = history(user);
        int64_t running = 0;
        for (auto it = txs.rbegin(); it != txs.rend(); ++it) {
            EXPECT_EQ(it->balance_before, running) << user;
            running = it->balance_after;
        }
        EXPECT_EQ(running, balance(user));
        EXPECT_GE(running, 0);
    }
}

TEST_F(ConcurrentAccountingTest, ConcurrentDeductsNeverOverdraw) {
    for (int round = 0; round < 100; ++round) {
        string user = "u" + to_string(round);
        set_balance(user, 10);

        atomic<int> succeeded{0};
        atomic<int> refused{0};
        vector<thread> workers;
        for (int t = 0; t < 2; ++t) {
            workers.emplace_back([&] {
                istringstream in;
                ostringstream out;
                AdminConsole console(*engine, in, out);
                console.handle_command("DEDUCT " + user + " 10");
                string reply = out.str();
                if (reply.rfind("OK 200", 0) == 0) ++succeeded;
                if (reply.rfind("ERR 400 Insufficient balance", 0) == 0) ++refused;
            });
        }
        for (auto &w : workers) w.join();

        EXPECT_EQ(succeeded.load(), 1) << "round " << round;
        EXPECT_EQ(refused.load(), 1) << "round " << round;
        EXPECT_EQ(balance(user), 0) << "round " << round;
        EXPECT_EQ(count_type(user, TxType::Deduct), 1u);
    }
}

TEST_F(ConcurrentAccountingTest, ParallelLedgerDeductsStopAtZero) {
    set_balance("carol", 100);

    const int kThreads = 8;
    atomic<int> succeeded{0};
    vector<thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 10; ++i) {
                string err;
                int64_t after = 0;
                bool insufficient = false;
                if (ledger().deduct_balance("carol", 3, "worker", "", after, insufficient, err) &&
                    !insufficient) {
                    ++succeeded;
                }
            }
        });
    }
    for (auto &w : workers) w.join();

    EXPECT_EQ(succeeded.load(), 33);
    EXPECT_EQ(balance("carol"), 1);
}
