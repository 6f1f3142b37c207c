#include "Types.hpp"

int64_t rate_for(const RateTable &rates, const string &resource_type) {
    auto it = rates.find(resource_type);
    if (it != rates.end()) return it->second;
    it = rates.find("cpu");
    if (it != rates.end()) return it->second;
    return 1;
}

const char *tx_type_name(TxType t) {
    switch (t) {
    case TxType::InitialGrant:   return "initial_grant";
    case TxType::Add:            return "add";
    case TxType::Deduct:         return "deduct";
    case TxType::Set:            return "set";
    case TxType::Usage:          return "usage";
    case TxType::SetUnlimited:   return "set_unlimited";
    case TxType::UnsetUnlimited: return "unset_unlimited";
    case TxType::AutoRefresh:    return "auto_refresh";
    }
    return "unknown";
}

bool parse_tx_type(const string &name, TxType &out) {
    static const TxType all[] = {
        TxType::InitialGrant, TxType::Add, TxType::Deduct, TxType::Set,
        TxType::Usage, TxType::SetUnlimited, TxType::UnsetUnlimited,
        TxType::AutoRefresh,
    };
    for (TxType t : all) {
        if (name == tx_type_name(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

const char *session_status_name(SessionStatus s) {
    switch (s) {
    case SessionStatus::Active:    return "active";
    case SessionStatus::Completed: return "completed";
    case SessionStatus::CleanedUp: return "cleaned_up";
    }
    return "unknown";
}

bool parse_session_status(const string &name, SessionStatus &out) {
    if (name == "active")     { out = SessionStatus::Active;    return true; }
    if (name == "completed")  { out = SessionStatus::Completed; return true; }
    if (name == "cleaned_up") { out = SessionStatus::CleanedUp; return true; }
    return false;
}
