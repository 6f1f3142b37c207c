#include "Reclaimer.hpp"
#include "../common/Utils.hpp"
#include <algorithm>

namespace {
const char *kTag = "reclaim";
}

Reclaimer::Reclaimer(Db &db, Logger &logger) : db_(db), logger_(logger) {}

bool Reclaimer::reclaim(int64_t max_duration_minutes,
                        vector<ReclaimedSession> &out,
                        string &err) {
    out.clear();
    if (max_duration_minutes <= 0) {
        err = "Max duration must be positive";
        return false;
    }

    time_t now = utils::now_seconds();
    string cutoff = utils::format_utc(now - static_cast<time_t>(max_duration_minutes * 60));
    string end_time = utils::format_utc(now);

    vector<UsageSession> stale;
    if (!db_.list_active_sessions_before(cutoff, stale, err)) return false;

    for (const UsageSession &s : stale) {
        int64_t elapsed = max_duration_minutes;
        time_t start = 0;
        if (utils::parse_utc(s.start_time, start)) {
            elapsed = static_cast<int64_t>(now - start) / 60;
        } else {
            logger_.warn(kTag, "Session " + to_string(s.id) + " has bad start_time '" +
                         s.start_time + "', capping duration");
        }
        int64_t duration = min(elapsed, max_duration_minutes);

        string row_err;
        if (!db_.cleanup_session(s.id, end_time, duration, row_err)) {
            if (row_err.empty()) {
                logger_.info(kTag, "Session " + to_string(s.id) + " closed before reclaim");
            } else {
                logger_.error(kTag, "Session " + to_string(s.id) + ": " + row_err);
            }
            continue;
        }

        ReclaimedSession r;
        r.session_id = s.id;
        r.username = s.username;
        r.resource_type = s.resource_type;
        r.duration_minutes = duration;
        out.push_back(r);

        logger_.info(kTag, "Cleaned up stale session " + to_string(s.id) + " for " +
                     s.username + ": " + to_string(duration) + " min");
    }
    return true;
}
