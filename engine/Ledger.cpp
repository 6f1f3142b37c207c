#include "Ledger.hpp"
#include "../common/Utils.hpp"
#include <cstdlib>

namespace {
const char *kTag = "ledger";
}

bool normalize_username(const string &raw, string &out, string &err) {
    out = utils::to_lower(utils::trim(raw));
    if (out.empty()) {
        err = "Username required";
        return false;
    }
    return true;
}

Ledger::Ledger(Db &db, Logger &logger) : db_(db), logger_(logger) {}

bool Ledger::get_balance(const string &username, int64_t &balance, string &err) {
    Account acc;
    if (!get_account(username, acc, err)) {
        if (!err.empty()) return false;
        balance = 0;
        return true;
    }
    balance = acc.balance;
    return true;
}

bool Ledger::get_account(const string &username, Account &out, string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;
    return db_.get_account(user, out, err);
}

bool Ledger::is_unlimited(const string &username, bool &unlimited, string &err) {
    Account acc;
    if (!get_account(username, acc, err)) {
        if (!err.empty()) return false;
        unlimited = false;
        return true;
    }
    unlimited = acc.unlimited;
    return true;
}

bool Ledger::ensure_account(const string &username,
                            int64_t default_grant,
                            int64_t &balance,
                            string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;

    // Fast path without taking the write lock
    Account acc;
    if (db_.get_account(user, acc, err)) {
        balance = acc.balance;
        return true;
    }
    if (!err.empty()) return false;

    DbTx tx(db_);
    if (!tx.begin(err)) return false;

    // Another writer may have created it in between
    if (db_.get_account(user, acc, err)) {
        balance = acc.balance;
        return tx.commit(err);
    }
    if (!err.empty()) return false;

    int64_t grant = default_grant > 0 ? default_grant : 0;
    if (!db_.insert_account(user, grant, false, err)) return false;

    if (grant > 0) {
        TransactionRecord rec;
        rec.username       = user;
        rec.amount         = grant;
        rec.type           = TxType::InitialGrant;
        rec.description    = "Default quota for new user";
        rec.balance_before = 0;
        rec.balance_after  = grant;
        if (!db_.insert_transaction(rec, err)) return false;
    }

    if (!tx.commit(err)) return false;

    logger_.info(kTag, "Created account " + user + " with " + to_string(grant));
    balance = grant;
    return true;
}

bool Ledger::load_or_create_locked(const string &username, Account &acc, string &err) {
    if (db_.get_account(username, acc, err)) return true;
    if (!err.empty()) return false;

    if (!db_.insert_account(username, 0, false, err)) return false;
    if (!db_.get_account(username, acc, err)) {
        if (err.empty()) err = "Account " + username + " vanished after insert";
        return false;
    }
    return true;
}

bool Ledger::write_balance_locked(const Account &acc,
                                  int64_t new_balance,
                                  TxType type,
                                  const string &resource_type,
                                  const string &description,
                                  const string &actor,
                                  string &err) {
    if (new_balance != acc.balance) {
        if (!db_.update_balance(acc.username, new_balance, err)) return false;
    }

    TransactionRecord rec;
    rec.username       = acc.username;
    rec.amount         = new_balance - acc.balance;
    rec.type           = type;
    rec.resource_type  = resource_type;
    rec.description    = description;
    rec.balance_before = acc.balance;
    rec.balance_after  = new_balance;
    rec.created_by     = actor;
    return db_.insert_transaction(rec, err);
}

bool Ledger::set_balance(const string &username,
                         int64_t new_balance,
                         const string &actor,
                         int64_t &balance_after,
                         string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;

    DbTx tx(db_);
    if (!tx.begin(err)) return false;

    Account acc;
    if (!load_or_create_locked(user, acc, err)) return false;

    string desc = "Balance set to " + to_string(new_balance);
    if (!write_balance_locked(acc, new_balance, TxType::Set, "", desc, actor, err)) return false;
    if (!tx.commit(err)) return false;

    logger_.info(kTag, user + ": set " + to_string(acc.balance) + " -> " +
                 to_string(new_balance) + (actor.empty() ? "" : " by " + actor));
    balance_after = new_balance;
    return true;
}

bool Ledger::add_balance(const string &username,
                         int64_t delta,
                         const string &actor,
                         const string &description,
                         int64_t &balance_after,
                         string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;

    DbTx tx(db_);
    if (!tx.begin(err)) return false;

    Account acc;
    if (!load_or_create_locked(user, acc, err)) return false;

    TxType type = delta >= 0 ? TxType::Add : TxType::Deduct;
    string desc = description;
    if (desc.empty()) {
        desc = string(delta >= 0 ? "Added " : "Deducted ") + to_string(llabs(delta)) + " quota";
    }

    int64_t new_balance = 0;
    if (!utils::checked_add(acc.balance, delta, new_balance)) {
        err = "Balance out of range";
        return false;
    }
    if (!write_balance_locked(acc, new_balance, type, "", desc, actor, err)) return false;
    if (!tx.commit(err)) return false;

    logger_.info(kTag, user + ": " + tx_type_name(type) + " " + to_string(delta) +
                 " -> " + to_string(new_balance) + (actor.empty() ? "" : " by " + actor));
    balance_after = new_balance;
    return true;
}

bool Ledger::deduct_balance(const string &username,
                            int64_t amount,
                            const string &actor,
                            const string &description,
                            int64_t &balance_after,
                            bool &insufficient,
                            string &err) {
    insufficient = false;
    string user;
    if (!normalize_username(username, user, err)) return false;
    if (amount < 0) {
        err = "Deduct amount must not be negative";
        return false;
    }

    DbTx tx(db_);
    if (!tx.begin(err)) return false;

    Account acc;
    if (!load_or_create_locked(user, acc, err)) return false;

    // Checked under the write lock; a concurrent deduct sees our result.
    // Refusing rolls back, so an unknown user is not created here.
    if (acc.balance < amount) {
        insufficient = true;
        balance_after = acc.balance;
        return true;
    }

    string desc = description.empty() ? "Deducted " + to_string(amount) + " quota" : description;
    int64_t new_balance = acc.balance - amount;
    if (!write_balance_locked(acc, new_balance, TxType::Deduct, "", desc, actor, err)) return false;
    if (!tx.commit(err)) return false;

    logger_.info(kTag, user + ": deduct " + to_string(amount) + " -> " + to_string(new_balance) +
                 (actor.empty() ? "" : " by " + actor));
    balance_after = new_balance;
    return true;
}

bool Ledger::charge_usage_locked(const string &username,
                                 int64_t amount,
                                 const string &resource_type,
                                 const string &description,
                                 int64_t &balance_after,
                                 string &err) {
    Account acc;
    if (!db_.get_account(username, acc, err)) {
        if (!err.empty()) return false;
        balance_after = 0;
        return true;
    }

    if (acc.unlimited || amount <= 0) {
        balance_after = acc.balance;
        return true;
    }

    // Work already happened: overruns are forgiven, never carried as debt
    int64_t new_balance = acc.balance - amount;
    if (new_balance < 0) new_balance = 0;

    string desc = description;
    if (desc.empty()) {
        desc = resource_type.empty() ? "Usage deduction" : "Usage: " + resource_type;
    }
    if (!write_balance_locked(acc, new_balance, TxType::Usage, resource_type, desc, "", err)) {
        return false;
    }
    balance_after = new_balance;
    return true;
}

bool Ledger::deduct_for_usage(const string &username,
                              int64_t amount,
                              const string &resource_type,
                              int64_t &balance_after,
                              string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;
    if (amount < 0) {
        err = "Usage amount must not be negative";
        return false;
    }

    DbTx tx(db_);
    if (!tx.begin(err)) return false;
    if (!charge_usage_locked(user, amount, resource_type, "", balance_after, err)) return false;
    return tx.commit(err);
}

bool Ledger::set_unlimited(const string &username,
                           bool unlimited,
                           const string &actor,
                           string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;

    DbTx tx(db_);
    if (!tx.begin(err)) return false;

    Account acc;
    if (!load_or_create_locked(user, acc, err)) return false;
    if (!db_.update_unlimited(user, unlimited, err)) return false;

    TransactionRecord rec;
    rec.username       = user;
    rec.amount         = 0;
    rec.type           = unlimited ? TxType::SetUnlimited : TxType::UnsetUnlimited;
    rec.description    = string("Unlimited ") + (unlimited ? "enabled" : "disabled");
    rec.balance_before = acc.balance;
    rec.balance_after  = acc.balance;
    rec.created_by     = actor;
    if (!db_.insert_transaction(rec, err)) return false;

    if (!tx.commit(err)) return false;

    logger_.info(kTag, user + ": " + rec.description + (actor.empty() ? "" : " by " + actor));
    return true;
}

bool Ledger::get_all_balances(vector<Account> &out, string &err) {
    return db_.list_accounts(out, err);
}

bool Ledger::get_transactions(const string &username,
                              int limit,
                              vector<TransactionRecord> &out,
                              string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;
    return db_.list_transactions(user, limit, out, err);
}
