#include "QuotaGate.hpp"
#include "../common/Utils.hpp"

QuotaGate::QuotaGate(Ledger &ledger) : ledger_(ledger) {}

bool QuotaGate::can_start(const string &username,
                          const string &resource_type,
                          int64_t minutes,
                          const RateTable &rates,
                          int64_t default_grant,
                          GateDecision &out,
                          string &err) {
    if (minutes < 0) {
        err = "Requested minutes must not be negative";
        return false;
    }

    int64_t balance = 0;
    if (!ledger_.ensure_account(username, default_grant, balance, err)) return false;

    Account acc;
    if (!ledger_.get_account(username, acc, err)) {
        if (err.empty()) err = "Account missing after creation";
        return false;
    }
    balance = acc.balance;

    if (acc.unlimited) {
        out.allowed = true;
        out.message = "Unlimited quota";
        out.estimated_cost = 0;
        return true;
    }

    int64_t rate = rate_for(rates, resource_type);
    if (!utils::checked_mul(minutes, rate, out.estimated_cost)) {
        out.allowed = false;
        out.estimated_cost = INT64_MAX;
        out.message = "Requested duration too long (" + to_string(minutes) + " min, balance: " +
                      to_string(balance) + ", max: " + to_string(balance > 0 ? balance / rate : 0) +
                      " min)";
        return true;
    }

    if (balance <= 0) {
        out.allowed = false;
        out.message = "Insufficient quota (balance: " + to_string(balance) + ")";
        return true;
    }

    if (balance < out.estimated_cost) {
        int64_t max_minutes = rate > 0 ? balance / rate : 0;
        out.allowed = false;
        out.message = "Insufficient quota for " + to_string(minutes) + " min (balance: " +
                      to_string(balance) + ", need: " + to_string(out.estimated_cost) +
                      ", max: " + to_string(max_minutes) + " min)";
        return true;
    }

    out.allowed = true;
    out.message = "OK (balance: " + to_string(balance) + ", cost: " +
                  to_string(out.estimated_cost) + ")";
    return true;
}
