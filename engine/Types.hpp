#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

using namespace std;

// resource type -> credit units per minute
using RateTable = unordered_map<string, int64_t>;

// Rate for a resource type: exact entry, else "cpu", else 1.
int64_t rate_for(const RateTable &rates, const string &resource_type);

enum class TxType {
    InitialGrant,
    Add,
    Deduct,
    Set,
    Usage,
    SetUnlimited,
    UnsetUnlimited,
    AutoRefresh,
};

const char *tx_type_name(TxType t);
bool parse_tx_type(const string &name, TxType &out);

enum class SessionStatus {
    Active,
    Completed,
    CleanedUp,
};

const char *session_status_name(SessionStatus s);
bool parse_session_status(const string &name, SessionStatus &out);

struct Account {
    int64_t id = 0;
    string username;
    int64_t balance = 0;
    bool unlimited = false;
    string created_at;
    string updated_at;
};

struct TransactionRecord {
    int64_t id = 0;
    string username;
    int64_t amount = 0;
    TxType type = TxType::Add;
    string resource_type;   // empty = none
    string description;
    int64_t balance_before = 0;
    int64_t balance_after = 0;
    string created_at;
    string created_by;      // empty = system
};

struct UsageSession {
    int64_t id = 0;
    string username;
    string resource_type;
    string start_time;
    string end_time;                // empty while active
    int64_t duration_minutes = 0;   // 0 while active
    int64_t quota_consumed = 0;     // 0 while active
    SessionStatus status = SessionStatus::Active;
};
