#pragma once
#include <string>
#include <cstdint>
#include "Ledger.hpp"
#include "Types.hpp"

using namespace std;

struct GateDecision {
    bool allowed = false;
    string message;             // shown to the end user as-is
    int64_t estimated_cost = 0;
};

// Admission check before metered work starts. Read-only apart from lazily
// creating the account; the real charge happens when the session closes.
class QuotaGate {
public:
    explicit QuotaGate(Ledger &ledger);

    // Returns false only on storage failure or bad input. A denial is a
    // successful call with out.allowed == false.
    bool can_start(const string &username,
                   const string &resource_type,
                   int64_t minutes,
                   const RateTable &rates,
                   int64_t default_grant,
                   GateDecision &out,
                   string &err);

private:
    Ledger &ledger_;
};
