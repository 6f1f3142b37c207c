#include "DbSqlite.hpp"
#include <iostream>

namespace {

string column_text(sqlite3_stmt *stmt, int col) {
    const unsigned char *p = sqlite3_column_text(stmt, col);
    return p ? string(reinterpret_cast<const char*>(p)) : string();
}

// SELECT id, username, balance, unlimited, created_at, updated_at
void read_account(sqlite3_stmt *stmt, Account &out) {
    out.id         = sqlite3_column_int64(stmt, 0);
    out.username   = column_text(stmt, 1);
    out.balance    = sqlite3_column_int64(stmt, 2);
    out.unlimited  = sqlite3_column_int(stmt, 3) != 0;
    out.created_at = column_text(stmt, 4);
    out.updated_at = column_text(stmt, 5);
}

// SELECT id, username, amount, transaction_type, resource_type, description,
//        balance_before, balance_after, created_at, created_by
bool read_transaction(sqlite3_stmt *stmt, TransactionRecord &out, string &err) {
    out.id             = sqlite3_column_int64(stmt, 0);
    out.username       = column_text(stmt, 1);
    out.amount         = sqlite3_column_int64(stmt, 2);
    string type        = column_text(stmt, 3);
    out.resource_type  = column_text(stmt, 4);
    out.description    = column_text(stmt, 5);
    out.balance_before = sqlite3_column_int64(stmt, 6);
    out.balance_after  = sqlite3_column_int64(stmt, 7);
    out.created_at     = column_text(stmt, 8);
    out.created_by     = column_text(stmt, 9);
    if (!parse_tx_type(type, out.type)) {
        err = "Unknown transaction type '" + type + "' in row " + to_string(out.id);
        return false;
    }
    return true;
}

// SELECT id, username, resource_type, start_time, end_time,
//        duration_minutes, quota_consumed, status
bool read_session(sqlite3_stmt *stmt, UsageSession &out, string &err) {
    out.id               = sqlite3_column_int64(stmt, 0);
    out.username         = column_text(stmt, 1);
    out.resource_type    = column_text(stmt, 2);
    out.start_time       = column_text(stmt, 3);
    out.end_time         = column_text(stmt, 4);
    out.duration_minutes = sqlite3_column_int64(stmt, 5);
    out.quota_consumed   = sqlite3_column_int64(stmt, 6);
    string status        = column_text(stmt, 7);
    if (!parse_session_status(status, out.status)) {
        err = "Unknown session status '" + status + "' in row " + to_string(out.id);
        return false;
    }
    return true;
}

const char *kSessionColumns =
    "SELECT id, username, resource_type, start_time, end_time, "
    "duration_minutes, quota_consumed, status FROM usage_session ";

} // namespace

DbSqlite::DbSqlite(const string &db_path, int busy_timeout_ms) : db_path_(db_path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        open_error_ = db_ ? sqlite3_errmsg(db_) : "out of memory";
        cerr << "Cannot open SQLite: " << open_error_ << "\n";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);

    // WAL lets other processes read while one of them writes.
    if (db_path_ != ":memory:" && !db_path_.empty()) {
        string err;
        if (!exec("PRAGMA journal_mode = WAL;", err)) {
            cerr << "SQLite WAL not enabled: " << err << "\n";
        }
    }
}

DbSqlite::~DbSqlite() {
    if (db_) sqlite3_close(db_);
}

bool DbSqlite::ensure_open(string &err) const {
    if (db_) return true;
    err = "Database not open: " + open_error_;
    return false;
}

bool DbSqlite::exec(const char *sql, string &err) {
    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    char *errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        err = errmsg ? errmsg : "Unknown SQLite error";
        if (errmsg) sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool DbSqlite::init_schema(string &err) {
    const char *sql_tables = R"SQL(
CREATE TABLE IF NOT EXISTS quota_account (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    username    TEXT UNIQUE NOT NULL,
    balance     INTEGER NOT NULL DEFAULT 0,
    unlimited   INTEGER NOT NULL DEFAULT 0,
    created_at  DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at  DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS quota_transaction (
    id               INTEGER PRIMARY KEY AUTOINCREMENT,
    username         TEXT NOT NULL,
    amount           INTEGER NOT NULL,
    transaction_type TEXT NOT NULL,
    resource_type    TEXT,
    description      TEXT,
    balance_before   INTEGER NOT NULL,
    balance_after    INTEGER NOT NULL,
    created_at       DATETIME DEFAULT CURRENT_TIMESTAMP,
    created_by       TEXT
);

CREATE TABLE IF NOT EXISTS usage_session (
    id               INTEGER PRIMARY KEY AUTOINCREMENT,
    username         TEXT NOT NULL,
    resource_type    TEXT NOT NULL,
    start_time       DATETIME NOT NULL,
    end_time         DATETIME,
    duration_minutes INTEGER,
    quota_consumed   INTEGER,
    status           TEXT NOT NULL DEFAULT 'active',
    created_at       DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE INDEX IF NOT EXISTS idx_quota_transaction_username
    ON quota_transaction(username);
CREATE INDEX IF NOT EXISTS idx_quota_transaction_created_at
    ON quota_transaction(created_at);
CREATE INDEX IF NOT EXISTS idx_usage_session_username
    ON usage_session(username);
CREATE INDEX IF NOT EXISTS idx_usage_session_status
    ON usage_session(status);
CREATE INDEX IF NOT EXISTS idx_usage_session_username_status
    ON usage_session(username, status);
)SQL";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!exec(sql_tables, err)) return false;

    // ===== Minimal migrations for old DBs =====
    auto has_column = [this](const string &table, const string &col) -> bool {
        string sql = "PRAGMA table_info(" + table + ");";
        sqlite3_stmt *stmt = nullptr;
        bool found = false;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
            while (sqlite3_step(stmt) == SQLITE_ROW) {
                const unsigned char *name = sqlite3_column_text(stmt, 1);
                if (name && col == reinterpret_cast<const char*>(name)) {
                    found = true;
                    break;
                }
            }
        }
        if (stmt) sqlite3_finalize(stmt);
        return found;
    };

    auto add_column_if_missing = [this, &err, &has_column](const string &table,
                                                          const string &col,
                                                          const string &def) -> bool {
        if (has_column(table, col)) return true;
        string sql = "ALTER TABLE " + table + " ADD COLUMN " + col + " " + def + ";";
        string local_err;
        if (!exec(sql.c_str(), local_err)) {
            // Another process may have migrated first
            if (local_err.find("duplicate column") == string::npos) {
                err = local_err;
                return false;
            }
        }
        return true;
    };

    // Columns added after the first release
    if (!add_column_if_missing("quota_account", "unlimited", "INTEGER NOT NULL DEFAULT 0")) return false;
    if (!add_column_if_missing("quota_account", "updated_at", "DATETIME")) return false;
    if (!add_column_if_missing("quota_transaction", "created_by", "TEXT")) return false;

    return true;
}

bool DbSqlite::begin(string &err) {
    mtx_.lock();
    if (!exec("BEGIN IMMEDIATE;", err)) {
        mtx_.unlock();
        return false;
    }
    return true;
}

bool DbSqlite::commit(string &err) {
    bool ok = exec("COMMIT;", err);
    if (!ok && db_ && !sqlite3_get_autocommit(db_)) {
        string rb_err;
        if (!exec("ROLLBACK;", rb_err)) {
            cerr << "SQLite rollback after failed commit: " << rb_err << "\n";
        }
    }
    mtx_.unlock();
    return ok;
}

void DbSqlite::rollback() {
    if (db_ && !sqlite3_get_autocommit(db_)) {
        string err;
        if (!exec("ROLLBACK;", err)) {
            cerr << "SQLite rollback failed: " << err << "\n";
        }
    }
    mtx_.unlock();
}

bool DbSqlite::get_account(const string &username,
                           Account &out,
                           string &err) {
    const char *sql =
        "SELECT id, username, balance, unlimited, created_at, updated_at "
        "FROM quota_account WHERE username = ?;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_account(stmt, out);
        sqlite3_finalize(stmt);
        return true;
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return false;
    } else {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
}

bool DbSqlite::insert_account(const string &username,
                              int64_t balance,
                              bool unlimited,
                              string &err) {
    const char *sql =
        "INSERT INTO quota_account (username, balance, unlimited) "
        "VALUES (?, ?, ?);";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, (sqlite3_int64)balance);
    sqlite3_bind_int(stmt, 3, unlimited ? 1 : 0);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::update_balance(const string &username,
                              int64_t balance,
                              string &err) {
    const char *sql =
        "UPDATE quota_account SET balance = ?, updated_at = CURRENT_TIMESTAMP "
        "WHERE username = ?;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_int64(stmt, 1, (sqlite3_int64)balance);
    sqlite3_bind_text(stmt, 2, username.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    if (sqlite3_changes(db_) != 1) {
        err = "No account row for " + username;
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::update_unlimited(const string &username,
                                bool unlimited,
                                string &err) {
    const char *sql =
        "UPDATE quota_account SET unlimited = ?, updated_at = CURRENT_TIMESTAMP "
        "WHERE username = ?;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_int(stmt, 1, unlimited ? 1 : 0);
    sqlite3_bind_text(stmt, 2, username.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    if (sqlite3_changes(db_) != 1) {
        err = "No account row for " + username;
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::list_accounts(vector<Account> &out, string &err) {
    out.clear();

    const char *sql =
        "SELECT id, username, balance, unlimited, created_at, updated_at "
        "FROM quota_account ORDER BY username;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Account acc;
        read_account(stmt, acc);
        out.push_back(acc);
    }

    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }

    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::insert_transaction(const TransactionRecord &tx, string &err) {
    const char *sql =
        "INSERT INTO quota_transaction (username, amount, transaction_type, "
        "resource_type, description, balance_before, balance_after, created_by) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, tx.username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, (sqlite3_int64)tx.amount);
    sqlite3_bind_text(stmt, 3, tx_type_name(tx.type), -1, SQLITE_STATIC);
    if (!tx.resource_type.empty())
        sqlite3_bind_text(stmt, 4, tx.resource_type.c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, 4);
    sqlite3_bind_text(stmt, 5, tx.description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, (sqlite3_int64)tx.balance_before);
    sqlite3_bind_int64(stmt, 7, (sqlite3_int64)tx.balance_after);
    if (!tx.created_by.empty())
        sqlite3_bind_text(stmt, 8, tx.created_by.c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, 8);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::list_transactions(const string &username,
                                 int limit,
                                 vector<TransactionRecord> &out,
                                 string &err) {
    out.clear();

    const char *sql =
        "SELECT id, username, amount, transaction_type, resource_type, "
        "description, balance_before, balance_after, created_at, created_by "
        "FROM quota_transaction WHERE username = ? "
        "ORDER BY created_at DESC, id DESC LIMIT ?;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : -1);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        TransactionRecord tx;
        if (!read_transaction(stmt, tx, err)) {
            sqlite3_finalize(stmt);
            return false;
        }
        out.push_back(tx);
    }

    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }

    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::insert_session(const string &username,
                              const string &resource_type,
                              const string &start_time,
                              int64_t &session_id,
                              string &err) {
    const char *sql =
        "INSERT INTO usage_session (username, resource_type, start_time, status) "
        "VALUES (?, ?, ?, 'active');";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, resource_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, start_time.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }

    session_id = (int64_t)sqlite3_last_insert_rowid(db_);
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::get_session(int64_t session_id, UsageSession &out, string &err) {
    string sql = string(kSessionColumns) + "WHERE id = ?;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_int64(stmt, 1, (sqlite3_int64)session_id);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        bool ok = read_session(stmt, out, err);
        sqlite3_finalize(stmt);
        return ok;
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return false;
    } else {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
}

bool DbSqlite::find_active_session(const string &username, UsageSession &out, string &err) {
    string sql = string(kSessionColumns) +
        "WHERE username = ? AND status = 'active' "
        "ORDER BY start_time DESC, id DESC LIMIT 1;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        bool ok = read_session(stmt, out, err);
        sqlite3_finalize(stmt);
        return ok;
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return false;
    } else {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
}

bool DbSqlite::list_active_sessions_before(const string &cutoff,
                                           vector<UsageSession> &out,
                                           string &err) {
    out.clear();
    string sql = string(kSessionColumns) +
        "WHERE status = 'active' AND start_time < ? ORDER BY start_time, id;";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, cutoff.c_str(), -1, SQLITE_TRANSIENT);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        UsageSession s;
        if (!read_session(stmt, s, err)) {
            sqlite3_finalize(stmt);
            return false;
        }
        out.push_back(s);
    }
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::count_active_sessions(int64_t &count, string &err) {
    const char *sql = "SELECT COUNT(*) FROM usage_session WHERE status = 'active';";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    count = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::complete_session(int64_t session_id,
                                const string &end_time,
                                int64_t duration_minutes,
                                int64_t quota_consumed,
                                string &err) {
    const char *sql =
        "UPDATE usage_session SET status = 'completed', end_time = ?, "
        "duration_minutes = ?, quota_consumed = ? "
        "WHERE id = ? AND status = 'active';";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, end_time.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, (sqlite3_int64)duration_minutes);
    sqlite3_bind_int64(stmt, 3, (sqlite3_int64)quota_consumed);
    sqlite3_bind_int64(stmt, 4, (sqlite3_int64)session_id);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }

    bool transitioned = sqlite3_changes(db_) == 1;
    sqlite3_finalize(stmt);
    return transitioned;
}

bool DbSqlite::cleanup_session(int64_t session_id,
                               const string &end_time,
                               int64_t duration_minutes,
                               string &err) {
    const char *sql =
        "UPDATE usage_session SET status = 'cleaned_up', end_time = ?, "
        "duration_minutes = ? "
        "WHERE id = ? AND status = 'active';";

    lock_guard<recursive_mutex> lock(mtx_);
    if (!ensure_open(err)) return false;

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, end_time.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, (sqlite3_int64)duration_minutes);
    sqlite3_bind_int64(stmt, 3, (sqlite3_int64)session_id);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }

    bool transitioned = sqlite3_changes(db_) == 1;
    sqlite3_finalize(stmt);
    return transitioned;
}
