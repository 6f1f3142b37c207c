#include "SessionTracker.hpp"
#include "../common/Utils.hpp"

namespace {
const char *kTag = "session";
}

SessionTracker::SessionTracker(Db &db, Ledger &ledger, Logger &logger)
    : db_(db), ledger_(ledger), logger_(logger) {}

bool SessionTracker::start_session(const string &username,
                                   const string &resource_type,
                                   int64_t &session_id,
                                   string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;
    if (resource_type.empty()) {
        err = "Resource type required";
        return false;
    }

    string start = utils::format_utc(utils::now_seconds());
    if (!db_.insert_session(user, resource_type, start, session_id, err)) return false;

    logger_.info(kTag, "Session " + to_string(session_id) + " started for " + user +
                 " (" + resource_type + ")");
    return true;
}

bool SessionTracker::end_session(int64_t session_id,
                                 const RateTable &rates,
                                 int64_t &duration_minutes,
                                 int64_t &quota_consumed,
                                 string &err) {
    duration_minutes = 0;
    quota_consumed = 0;

    DbTx tx(db_);
    if (!tx.begin(err)) return false;

    UsageSession s;
    if (!db_.get_session(session_id, s, err)) {
        if (!err.empty()) return false;
        logger_.warn(kTag, "End of unknown session " + to_string(session_id) + " ignored");
        return true;
    }
    if (s.status != SessionStatus::Active) {
        logger_.warn(kTag, "Session " + to_string(session_id) + " already " +
                     session_status_name(s.status) + ", nothing to charge");
        return true;
    }

    time_t start = 0;
    if (!utils::parse_utc(s.start_time, start)) {
        err = "Session " + to_string(session_id) + " has bad start_time '" + s.start_time + "'";
        return false;
    }

    time_t now = utils::now_seconds();
    int64_t minutes = now > start ? static_cast<int64_t>(now - start) / 60 : 0;
    if (minutes < 1) minutes = 1;

    int64_t rate = rate_for(rates, s.resource_type);
    int64_t consumed = 0;
    if (!utils::checked_mul(minutes, rate, consumed)) consumed = INT64_MAX;

    if (!db_.complete_session(session_id, utils::format_utc(now), minutes, consumed, err)) {
        if (!err.empty()) return false;
        logger_.warn(kTag, "Session " + to_string(session_id) + " closed concurrently");
        return true;
    }

    int64_t balance_after = 0;
    string desc = "Session " + to_string(session_id) + ": " + to_string(minutes) +
                  " min @ " + to_string(rate) + "/min";
    if (!ledger_.charge_usage_locked(s.username, consumed, s.resource_type, desc,
                                     balance_after, err)) {
        return false;
    }

    if (!tx.commit(err)) return false;

    duration_minutes = minutes;
    quota_consumed = consumed;
    logger_.info(kTag, "Session " + to_string(session_id) + " ended for " + s.username +
                 ": " + to_string(minutes) + " min, " + to_string(consumed) +
                 " used, balance " + to_string(balance_after));
    return true;
}

bool SessionTracker::get_session(int64_t session_id, UsageSession &out, string &err) {
    return db_.get_session(session_id, out, err);
}

bool SessionTracker::get_active_session(const string &username, UsageSession &out, string &err) {
    string user;
    if (!normalize_username(username, user, err)) return false;
    return db_.find_active_session(user, out, err);
}

bool SessionTracker::active_session_count(int64_t &count, string &err) {
    return db_.count_active_sessions(count, err);
}
