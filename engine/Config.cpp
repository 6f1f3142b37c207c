#include "Config.hpp"
#include "../common/Utils.hpp"
#include <cstdlib>
#include <map>

namespace {

bool env_string(const char *name, string &out) {
    const char *p = ::getenv(name);
    if (!p || !*p) return false;
    out = p;
    return true;
}

bool env_count(const char *name, int64_t &out, string &err) {
    string raw;
    if (!env_string(name, raw)) return true;
    int64_t v = 0;
    if (!utils::parse_int64(utils::trim(raw), v) || v < 0) {
        err = string(name) + ": invalid number '" + raw + "'";
        return false;
    }
    out = v;
    return true;
}

} // namespace

bool parse_rates(const string &text, RateTable &out, string &err) {
    RateTable rates;
    for (const string &item : utils::split(text, ',')) {
        size_t eq = item.find('=');
        if (eq == string::npos) {
            err = "Rate '" + item + "' is not type=rate";
            return false;
        }
        string type = utils::trim(item.substr(0, eq));
        string value = utils::trim(item.substr(eq + 1));
        int64_t rate = 0;
        if (type.empty() || !utils::parse_int64(value, rate) || rate < 0) {
            err = "Rate '" + item + "' is not type=rate";
            return false;
        }
        rates[type] = rate;
    }
    if (rates.empty()) {
        err = "No rates given";
        return false;
    }
    out = rates;
    return true;
}

string format_rates(const RateTable &rates) {
    map<string, int64_t> sorted(rates.begin(), rates.end());
    string s;
    for (const auto &kv : sorted) {
        if (!s.empty()) s += ",";
        s += kv.first + "=" + to_string(kv.second);
    }
    return s;
}

bool load_quota_config(QuotaConfig &cfg, string &err) {
    string raw;
    if (env_string("QUOTA_DB_PATH", raw)) cfg.db_path = raw;
    if (env_string("QUOTA_LOG_PATH", raw)) cfg.log_path = raw;

    if (env_string("QUOTA_ENABLED", raw) && !utils::parse_bool(raw, cfg.enabled)) {
        err = "QUOTA_ENABLED: expected true/false, got '" + raw + "'";
        return false;
    }

    if (env_string("QUOTA_RATES", raw)) {
        string rate_err;
        if (!parse_rates(raw, cfg.rates, rate_err)) {
            err = "QUOTA_RATES: " + rate_err;
            return false;
        }
    }

    if (!env_count("QUOTA_DEFAULT_GRANT", cfg.default_grant, err)) return false;
    if (!env_count("QUOTA_MINIMUM_TO_START", cfg.minimum_to_start, err)) return false;
    if (!env_count("QUOTA_STALE_MINUTES", cfg.stale_minutes, err)) return false;
    if (cfg.stale_minutes == 0) {
        err = "QUOTA_STALE_MINUTES must be positive";
        return false;
    }
    return true;
}
