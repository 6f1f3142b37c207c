#pragma once
#include <string>
#include <cstdint>
#include "Types.hpp"

using namespace std;

struct QuotaConfig {
    string db_path = "./quota.db";
    string log_path = "./quota.log";
    bool enabled = true;
    RateTable rates = {{"cpu", 1}};
    int64_t default_grant = 0;
    int64_t minimum_to_start = 10;   // informational, shown to users
    int64_t stale_minutes = 480;
};

// Reads QUOTA_DB_PATH, QUOTA_LOG_PATH, QUOTA_ENABLED, QUOTA_RATES,
// QUOTA_DEFAULT_GRANT, QUOTA_MINIMUM_TO_START and QUOTA_STALE_MINUTES over
// the defaults above. Unset variables keep the default; malformed ones
// fail the load.
bool load_quota_config(QuotaConfig &cfg, string &err);

// "cpu=1, gpu=10" -> table. Rates must be non-negative integers.
bool parse_rates(const string &text, RateTable &out, string &err);

// Inverse of parse_rates, keys sorted.
string format_rates(const RateTable &rates);
