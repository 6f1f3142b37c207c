#pragma once
#include <string>
#include <vector>
#include <regex>
#include <mutex>
#include <utility>
#include <cstdint>
#include "Db.hpp"
#include "Ledger.hpp"
#include "Logger.hpp"
#include "Types.hpp"

using namespace std;

// Which accounts a refresh touches. Every set clause must hold.
struct RefreshTargets {
    bool include_unlimited = false;

    bool has_balance_below = false;   // keep only balance <  balance_below
    int64_t balance_below = 0;

    bool has_balance_above = false;   // keep only balance >  balance_above
    int64_t balance_above = 0;

    vector<string> include_users;     // empty = everyone
    vector<string> exclude_users;
    string username_pattern;          // regex anchored at the start, ignores case
};

enum class RefreshAction {
    Add,
    Set,
};

const char *refresh_action_name(RefreshAction a);
bool parse_refresh_action(const string &name, RefreshAction &out);

struct RefreshRequest {
    int64_t amount = 0;
    RefreshAction action = RefreshAction::Add;

    bool has_max_balance = false;     // cap for positive adds
    int64_t max_balance = 0;
    bool has_min_balance = false;     // floor for negative adds, 0 if unset
    int64_t min_balance = 0;

    RefreshTargets targets;
    string rule_name = "manual";
};

struct RefreshResult {
    int64_t users_updated = 0;
    int64_t total_change = 0;
    int64_t skipped = 0;
    int64_t failed = 0;
};

struct BatchSetEntry {
    string username;
    bool ok = false;
    int64_t balance = 0;
    string error;
};

struct BatchSetResult {
    int64_t success = 0;
    int64_t failed = 0;
    vector<BatchSetEntry> details;
};

// Compiled form of RefreshTargets. A pattern that does not compile
// matches nobody.
class TargetMatcher {
public:
    explicit TargetMatcher(const RefreshTargets &targets);

    bool matches(const Account &acc) const;
    bool pattern_ok() const { return pattern_ok_; }
    const string &pattern_error() const { return pattern_error_; }

private:
    RefreshTargets targets_;
    bool has_pattern_ = false;
    bool pattern_ok_ = true;
    string pattern_error_;
    regex pattern_;
};

// New balance for one account under req (before the unchanged check).
int64_t refreshed_balance(const RefreshRequest &req, int64_t current);

class BatchRefresh {
public:
    BatchRefresh(Db &db, Ledger &ledger, Logger &logger);

    // Bulk add/set over every matching account, one auto_refresh
    // transaction per changed account. A failure on one account is logged
    // and counted in out.failed; the sweep carries on. Returns false only
    // when the account list itself cannot be read.
    bool refresh(const RefreshRequest &req, RefreshResult &out, string &err);

    // set_balance per entry, each isolated from the others.
    bool batch_set(const vector<pair<string, int64_t>> &entries,
                   const string &actor,
                   BatchSetResult &out,
                   string &err);

private:
    bool refresh_one_locked(const RefreshRequest &req,
                            const TargetMatcher &matcher,
                            const string &username,
                            bool &changed,
                            int64_t &change,
                            string &err);

    Db &db_;
    Ledger &ledger_;
    Logger &logger_;
    mutex sweep_mtx_;
};
