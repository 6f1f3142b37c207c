#pragma once
#include <string>
#include <cstdint>
#include "Db.hpp"
#include "Ledger.hpp"
#include "Logger.hpp"
#include "Types.hpp"

using namespace std;

// Lifetime of one metered occupancy: active -> completed. Knows nothing
// about why a session exists beyond username and resource type.
class SessionTracker {
public:
    SessionTracker(Db &db, Ledger &ledger, Logger &logger);

    bool start_session(const string &username,
                       const string &resource_type,
                       int64_t &session_id,
                       string &err);

    // Closes an active session and charges duration * rate (minimum one
    // minute). A session that is unknown, already closed, or reclaimed
    // concurrently yields (0, 0) and a successful return.
    bool end_session(int64_t session_id,
                     const RateTable &rates,
                     int64_t &duration_minutes,
                     int64_t &quota_consumed,
                     string &err);

    // false with an empty err when not found / none active.
    bool get_session(int64_t session_id, UsageSession &out, string &err);
    bool get_active_session(const string &username, UsageSession &out, string &err);

    bool active_session_count(int64_t &count, string &err);

private:
    Db &db_;
    Ledger &ledger_;
    Logger &logger_;
};
