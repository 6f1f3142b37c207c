#pragma once
#include "Db.hpp"
#include <sqlite3.h>
#include <mutex>

using namespace std;

class DbSqlite : public Db {
public:
    // busy_timeout_ms bounds how long a writer waits on another process.
    explicit DbSqlite(const string &db_path, int busy_timeout_ms = 5000);
    ~DbSqlite() override;

    DbSqlite(const DbSqlite &) = delete;
    DbSqlite &operator=(const DbSqlite &) = delete;

    bool is_open() const { return db_ != nullptr; }
    const string &open_error() const { return open_error_; }

    bool init_schema(string &err) override;

    bool begin(string &err) override;
    bool commit(string &err) override;
    void rollback() override;

    bool get_account(const string &username,
                     Account &out,
                     string &err) override;

    bool insert_account(const string &username,
                        int64_t balance,
                        bool unlimited,
                        string &err) override;

    bool update_balance(const string &username,
                        int64_t balance,
                        string &err) override;

    bool update_unlimited(const string &username,
                          bool unlimited,
                          string &err) override;

    bool list_accounts(vector<Account> &out, string &err) override;

    bool insert_transaction(const TransactionRecord &tx, string &err) override;
    bool list_transactions(const string &username,
                           int limit,
                           vector<TransactionRecord> &out,
                           string &err) override;

    bool insert_session(const string &username,
                        const string &resource_type,
                        const string &start_time,
                        int64_t &session_id,
                        string &err) override;
    bool get_session(int64_t session_id, UsageSession &out, string &err) override;
    bool find_active_session(const string &username, UsageSession &out, string &err) override;
    bool list_active_sessions_before(const string &cutoff,
                                     vector<UsageSession> &out,
                                     string &err) override;
    bool count_active_sessions(int64_t &count, string &err) override;

    bool complete_session(int64_t session_id,
                          const string &end_time,
                          int64_t duration_minutes,
                          int64_t quota_consumed,
                          string &err) override;
    bool cleanup_session(int64_t session_id,
                         const string &end_time,
                         int64_t duration_minutes,
                         string &err) override;

private:
    bool exec(const char *sql, string &err);
    bool ensure_open(string &err) const;

    string db_path_;
    string open_error_;
    sqlite3 *db_ = nullptr;

    // One connection shared by all threads. Held for the whole of a unit
    // of work, re-entered by the statements issued inside it.
    recursive_mutex mtx_;
};
