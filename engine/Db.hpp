#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "Types.hpp"

using namespace std;

// Storage for the three quota tables. Usernames passed in are already
// normalized to lowercase.
//
// Conventions:
//  - every call returns false and fills err on storage failure;
//  - lookups return false with an EMPTY err when the row does not exist;
//  - begin() opens a write unit of work owned by the calling thread; other
//    threads block on the connection until commit() or rollback().
class Db {
public:
    virtual ~Db() = default;

    virtual bool init_schema(string &err) = 0;

    // Unit of work
    virtual bool begin(string &err) = 0;
    virtual bool commit(string &err) = 0;
    virtual void rollback() = 0;

    // Accounts
    virtual bool get_account(const string &username,
                             Account &out,
                             string &err) = 0;

    virtual bool insert_account(const string &username,
                                int64_t balance,
                                bool unlimited,
                                string &err) = 0;

    virtual bool update_balance(const string &username,
                                int64_t balance,
                                string &err) = 0;

    virtual bool update_unlimited(const string &username,
                                  bool unlimited,
                                  string &err) = 0;

    virtual bool list_accounts(vector<Account> &out, string &err) = 0;

    // Transaction log (append only)
    virtual bool insert_transaction(const TransactionRecord &tx, string &err) = 0;
    virtual bool list_transactions(const string &username,
                                   int limit,
                                   vector<TransactionRecord> &out,
                                   string &err) = 0;

    // Usage sessions
    virtual bool insert_session(const string &username,
                                const string &resource_type,
                                const string &start_time,
                                int64_t &session_id,
                                string &err) = 0;
    virtual bool get_session(int64_t session_id, UsageSession &out, string &err) = 0;
    virtual bool find_active_session(const string &username, UsageSession &out, string &err) = 0;
    virtual bool list_active_sessions_before(const string &cutoff,
                                             vector<UsageSession> &out,
                                             string &err) = 0;
    virtual bool count_active_sessions(int64_t &count, string &err) = 0;

    // active -> completed / cleaned_up. Only succeeds while the row is
    // still active: false with an empty err means another closer won.
    virtual bool complete_session(int64_t session_id,
                                  const string &end_time,
                                  int64_t duration_minutes,
                                  int64_t quota_consumed,
                                  string &err) = 0;
    virtual bool cleanup_session(int64_t session_id,
                                 const string &end_time,
                                 int64_t duration_minutes,
                                 string &err) = 0;
};

// Rolls the unit of work back unless commit() succeeded.
class DbTx {
public:
    explicit DbTx(Db &db) : db_(db) {}
    ~DbTx() {
        if (open_) db_.rollback();
    }

    DbTx(const DbTx &) = delete;
    DbTx &operator=(const DbTx &) = delete;

    bool begin(string &err) {
        open_ = db_.begin(err);
        return open_;
    }

    bool commit(string &err) {
        if (!open_) {
            err = "No open unit of work";
            return false;
        }
        open_ = false;
        return db_.commit(err);
    }

private:
    Db &db_;
    bool open_ = false;
};
