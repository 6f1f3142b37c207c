#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "Db.hpp"
#include "Logger.hpp"
#include "Types.hpp"

using namespace std;

// Per-user balances plus the transaction log. Every mutation writes its
// balance change and exactly one transaction row in a single unit of work.
//
// Usernames are case-insensitive; they are lowercased on the way in.
// All calls return false with err set on storage failure or bad input.
class Ledger {
public:
    Ledger(Db &db, Logger &logger);

    // 0 for an unknown user; never creates the account.
    bool get_balance(const string &username, int64_t &balance, string &err);

    // false with an empty err if the account does not exist.
    bool get_account(const string &username, Account &out, string &err);

    // false (the flag, not the call) for an unknown user.
    bool is_unlimited(const string &username, bool &unlimited, string &err);

    // Creates the account with default_grant if it is missing
    // (initial_grant transaction when default_grant > 0).
    bool ensure_account(const string &username,
                        int64_t default_grant,
                        int64_t &balance,
                        string &err);

    // Overwrite; the "set" transaction carries new - old.
    bool set_balance(const string &username,
                     int64_t new_balance,
                     const string &actor,
                     int64_t &balance_after,
                     string &err);

    // delta may be negative ("deduct"). Empty description gets a default.
    bool add_balance(const string &username,
                     int64_t delta,
                     const string &actor,
                     const string &description,
                     int64_t &balance_after,
                     string &err);

    // Admin deduct that refuses to go below zero. Not enough balance is a
    // successful call with insufficient == true and nothing written.
    bool deduct_balance(const string &username,
                        int64_t amount,
                        const string &actor,
                        const string &description,
                        int64_t &balance_after,
                        bool &insufficient,
                        string &err);

    // Usage charge, clamped at zero. Unlimited and unknown accounts are
    // left alone and no transaction is written.
    bool deduct_for_usage(const string &username,
                          int64_t amount,
                          const string &resource_type,
                          int64_t &balance_after,
                          string &err);

    // Always logs set_unlimited / unset_unlimited, even when unchanged.
    bool set_unlimited(const string &username,
                       bool unlimited,
                       const string &actor,
                       string &err);

    bool get_all_balances(vector<Account> &out, string &err);

    // Newest first. limit <= 0 means all.
    bool get_transactions(const string &username,
                          int limit,
                          vector<TransactionRecord> &out,
                          string &err);

    // Same as deduct_for_usage but for a caller that already holds an open
    // unit of work; username must already be lowercase.
    bool charge_usage_locked(const string &username,
                             int64_t amount,
                             const string &resource_type,
                             const string &description,
                             int64_t &balance_after,
                             string &err);

private:
    // Loads the row, inserting a zero-balance account when missing.
    bool load_or_create_locked(const string &username, Account &acc, string &err);

    bool write_balance_locked(const Account &acc,
                              int64_t new_balance,
                              TxType type,
                              const string &resource_type,
                              const string &description,
                              const string &actor,
                              string &err);

    Db &db_;
    Logger &logger_;
};

// Lowercase key; false (err set) for an empty name.
bool normalize_username(const string &raw, string &out, string &err);
