#include "BatchRefresh.hpp"
#include "../common/Utils.hpp"
#include <algorithm>

namespace {
const char *kTag = "refresh";

bool contains(const vector<string> &list, const string &name) {
    return find(list.begin(), list.end(), name) != list.end();
}

string signed_str(int64_t v) {
    return (v >= 0 ? "+" : "") + to_string(v);
}
} // namespace

const char *refresh_action_name(RefreshAction a) {
    switch (a) {
    case RefreshAction::Add: return "add";
    case RefreshAction::Set: return "set";
    }
    return "unknown";
}

bool parse_refresh_action(const string &name, RefreshAction &out) {
    string v = utils::to_lower(name);
    if (v == "add") { out = RefreshAction::Add; return true; }
    if (v == "set") { out = RefreshAction::Set; return true; }
    return false;
}

TargetMatcher::TargetMatcher(const RefreshTargets &targets) : targets_(targets) {
    for (string &u : targets_.include_users) u = utils::to_lower(u);
    for (string &u : targets_.exclude_users) u = utils::to_lower(u);

    if (!targets_.username_pattern.empty()) {
        has_pattern_ = true;
        try {
            pattern_ = regex(targets_.username_pattern,
                             regex_constants::ECMAScript | regex_constants::icase);
        } catch (const regex_error &e) {
            pattern_ok_ = false;
            pattern_error_ = e.what();
        }
    }
}

bool TargetMatcher::matches(const Account &acc) const {
    if (acc.unlimited && !targets_.include_unlimited) return false;

    if (targets_.has_balance_below && acc.balance >= targets_.balance_below) return false;
    if (targets_.has_balance_above && acc.balance <= targets_.balance_above) return false;

    string user = utils::to_lower(acc.username);
    if (!targets_.include_users.empty() && !contains(targets_.include_users, user)) return false;
    if (contains(targets_.exclude_users, user)) return false;

    if (has_pattern_) {
        if (!pattern_ok_) return false;
        try {
            if (!regex_search(user, pattern_, regex_constants::match_continuous)) return false;
        } catch (const regex_error &) {
            // error_complexity / error_stack at match time
            return false;
        }
    }
    return true;
}

int64_t refreshed_balance(const RefreshRequest &req, int64_t current) {
    if (req.action == RefreshAction::Set) return req.amount;

    int64_t next = 0;
    if (!utils::checked_add(current, req.amount, next)) {
        next = req.amount > 0 ? INT64_MAX : INT64_MIN;
    }
    if (req.amount > 0 && req.has_max_balance) {
        next = min(next, req.max_balance);
    } else if (req.amount < 0) {
        int64_t floor_balance = req.has_min_balance ? req.min_balance : 0;
        next = max(next, floor_balance);
    }
    return next;
}

BatchRefresh::BatchRefresh(Db &db, Ledger &ledger, Logger &logger)
    : db_(db), ledger_(ledger), logger_(logger) {}

bool BatchRefresh::refresh_one_locked(const RefreshRequest &req,
                                      const TargetMatcher &matcher,
                                      const string &username,
                                      bool &changed,
                                      int64_t &change,
                                      string &err) {
    changed = false;
    change = 0;

    DbTx tx(db_);
    if (!tx.begin(err)) return false;

    // Re-read under the write lock; the snapshot may be stale by now
    Account acc;
    if (!db_.get_account(username, acc, err)) {
        if (err.empty()) err = "Account disappeared";
        return false;
    }
    if (!matcher.matches(acc)) return true;

    int64_t next = refreshed_balance(req, acc.balance);
    if (next == acc.balance) return true;

    if (!db_.update_balance(username, next, err)) return false;

    TransactionRecord rec;
    rec.username       = username;
    rec.amount         = next - acc.balance;
    rec.type           = TxType::AutoRefresh;
    rec.description    = string("Auto ") + refresh_action_name(req.action) + ": " + req.rule_name;
    rec.balance_before = acc.balance;
    rec.balance_after  = next;
    if (!db_.insert_transaction(rec, err)) return false;

    if (!tx.commit(err)) return false;

    changed = true;
    change = rec.amount;
    return true;
}

bool BatchRefresh::refresh(const RefreshRequest &req, RefreshResult &out, string &err) {
    out = RefreshResult();

    lock_guard<mutex> sweep(sweep_mtx_);

    // Read phase runs without the write lock so quota checks keep flowing
    vector<Account> accounts;
    if (!db_.list_accounts(accounts, err)) return false;

    TargetMatcher matcher(req.targets);
    if (!matcher.pattern_ok()) {
        logger_.warn(kTag, "Rule '" + req.rule_name + "': invalid username pattern '" +
                     req.targets.username_pattern + "' (" + matcher.pattern_error() +
                     "), no users match");
    }

    for (const Account &acc : accounts) {
        if (!matcher.matches(acc) || refreshed_balance(req, acc.balance) == acc.balance) {
            ++out.skipped;
            continue;
        }

        bool changed = false;
        int64_t change = 0;
        string row_err;
        if (!refresh_one_locked(req, matcher, acc.username, changed, change, row_err)) {
            ++out.failed;
            logger_.error(kTag, "Rule '" + req.rule_name + "': " + acc.username + ": " + row_err);
            continue;
        }
        if (!changed) {
            ++out.skipped;
            continue;
        }
        ++out.users_updated;
        out.total_change += change;
    }

    string summary = "Refresh '" + req.rule_name + "' (" + refresh_action_name(req.action) +
                     "): " + to_string(out.users_updated) + " users updated, " +
                     to_string(out.skipped) + " skipped, change=" + signed_str(out.total_change);
    if (out.failed > 0) {
        logger_.warn(kTag, summary + ", " + to_string(out.failed) + " failed");
    } else {
        logger_.info(kTag, summary);
    }
    return true;
}

bool BatchRefresh::batch_set(const vector<pair<string, int64_t>> &entries,
                             const string &actor,
                             BatchSetResult &out,
                             string &err) {
    out = BatchSetResult();
    if (entries.empty()) {
        err = "No users given";
        return false;
    }

    for (const auto &e : entries) {
        BatchSetEntry detail;
        detail.username = e.first;

        string row_err;
        int64_t after = 0;
        if (ledger_.set_balance(e.first, e.second, actor, after, row_err)) {
            detail.ok = true;
            detail.balance = after;
            ++out.success;
        } else {
            detail.error = row_err;
            ++out.failed;
            logger_.error(kTag, "Batch set failed for " + e.first + ": " + row_err);
        }
        out.details.push_back(detail);
    }
    return true;
}
