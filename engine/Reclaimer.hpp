#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "Db.hpp"
#include "Logger.hpp"

using namespace std;

struct ReclaimedSession {
    int64_t session_id = 0;
    string username;
    string resource_type;
    int64_t duration_minutes = 0;
};

// Closes sessions left active past max_duration_minutes as cleaned_up,
// without charging: the workload is assumed gone already. Meant to run at
// startup and from a caller-owned timer.
class Reclaimer {
public:
    Reclaimer(Db &db, Logger &logger);

    // Rows that fail or lose the race to a normal close are skipped.
    // Returns false only when the stale list cannot be read.
    bool reclaim(int64_t max_duration_minutes,
                 vector<ReclaimedSession> &out,
                 string &err);

private:
    Db &db_;
    Logger &logger_;
};
