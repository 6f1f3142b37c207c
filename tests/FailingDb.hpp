#pragma once
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "engine/Db.hpp"
#include "engine/DbSqlite.hpp"
#include "engine/Ledger.hpp"
#include "engine/Logger.hpp"
#include "engine/SessionTracker.hpp"
#include "engine/BatchRefresh.hpp"

enum class FailOp {
    GetAccount,
    UpdateBalance,
    InsertTransaction,
    ListTransactions,
};

// Forwards to a real store, failing the chosen calls for one username
// with a storage error.
class FailingDb : public Db {
public:
    explicit FailingDb(Db &inner) : inner_(inner) {}

    void fail(FailOp op, const std::string &username) { failures_.insert({op, username}); }
    void heal() { failures_.clear(); }

    bool init_schema(std::string &err) override { return inner_.init_schema(err); }
    bool begin(std::string &err) override { return inner_.begin(err); }
    bool commit(std::string &err) override { return inner_.commit(err); }
    void rollback() override { inner_.rollback(); }

    bool get_account(const std::string &username, Account &out, std::string &err) override {
        if (should_fail(FailOp::GetAccount, username, err)) return false;
        return inner_.get_account(username, out, err);
    }
    bool insert_account(const std::string &username, int64_t balance, bool unlimited,
                        std::string &err) override {
        return inner_.insert_account(username, balance, unlimited, err);
    }
    bool update_balance(const std::string &username, int64_t balance,
                        std::string &err) override {
        if (should_fail(FailOp::UpdateBalance, username, err)) return false;
        return inner_.update_balance(username, balance, err);
    }
    bool update_unlimited(const std::string &username, bool unlimited,
                          std::string &err) override {
        return inner_.update_unlimited(username, unlimited, err);
    }
    bool list_accounts(std::vector<Account> &out, std::string &err) override {
        return inner_.list_accounts(out, err);
    }

    bool insert_transaction(const TransactionRecord &tx, std::string &err) override {
        if (should_fail(FailOp::InsertTransaction, tx.username, err)) return false;
        return inner_.insert_transaction(tx, err);
    }
    bool list_transactions(const std::string &username, int limit,
                           std::vector<TransactionRecord> &out, std::string &err) override {
        if (should_fail(FailOp::ListTransactions, username, err)) return false;
        return inner_.list_transactions(username, limit, out, err);
    }

    bool insert_session(const std::string &username, const std::string &resource_type,
                        const std::string &start_time, int64_t &session_id,
                        std::string &err) override {
        return inner_.insert_session(username, resource_type, start_time, session_id, err);
    }
    bool get_session(int64_t session_id, UsageSession &out, std::string &err) override {
        return inner_.get_session(session_id, out, err);
    }
    bool find_active_session(const std::string &username, UsageSession &out,
                             std::string &err) override {
        return inner_.find_active_session(username, out, err);
    }
    bool list_active_sessions_before(const std::string &cutoff, std::vector<UsageSession> &out,
                                     std::string &err) override {
        return inner_.list_active_sessions_before(cutoff, out, err);
    }
    bool count_active_sessions(int64_t &count, std::string &err) override {
        return inner_.count_active_sessions(count, err);
    }
    bool complete_session(int64_t session_id, const std::string &end_time,
                          int64_t duration_minutes, int64_t quota_consumed,
                          std::string &err) override {
        return inner_.complete_session(session_id, end_time, duration_minutes,
                                       quota_consumed, err);
    }
    bool cleanup_session(int64_t session_id, const std::string &end_time,
                         int64_t duration_minutes, std::string &err) override {
        return inner_.cleanup_session(session_id, end_time, duration_minutes, err);
    }

private:
    bool should_fail(FailOp op, const std::string &username, std::string &err) const {
        if (failures_.count({op, username}) == 0) return false;
        err = "disk I/O error";
        return true;
    }

    Db &inner_;
    std::set<std::pair<FailOp, std::string>> failures_;
};

// Components wired over a FailingDb; `store` gives unfailing reads.
class FailingStoreTest : public ::testing::Test {
protected:
    std::unique_ptr<DbSqlite> store;
    std::unique_ptr<FailingDb> db;
    Logger logger;
    std::unique_ptr<Ledger> ledger;
    std::unique_ptr<SessionTracker> sessions;
    std::unique_ptr<BatchRefresh> refresher;

    void SetUp() override {
        logger.set_quiet(true);
        store = std::make_unique<DbSqlite>(":memory:");
        db = std::make_unique<FailingDb>(*store);
        std::string err;
        ASSERT_TRUE(db->init_schema(err)) << err;
        ledger = std::make_unique<Ledger>(*db, logger);
        sessions = std::make_unique<SessionTracker>(*db, *ledger, logger);
        refresher = std::make_unique<BatchRefresh>(*db, *ledger, logger);
    }

    void set_balance(const std::string &user, int64_t amount) {
        std::string err;
        int64_t after = 0;
        ASSERT_TRUE(ledger->set_balance(user, amount, "test", after, err)) << err;
    }

    int64_t stored_balance(const std::string &user) {
        std::string err;
        Account acc;
        if (!store->get_account(user, acc, err)) return -1;
        return acc.balance;
    }

    size_t stored_tx_count(const std::string &user) {
        std::string err;
        std::vector<TransactionRecord> txs;
        EXPECT_TRUE(store->list_transactions(user, 0, txs, err)) << err;
        return txs.size();
    }
};
