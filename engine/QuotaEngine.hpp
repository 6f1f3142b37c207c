#pragma once
#include <string>
#include <memory>
#include "Logger.hpp"
#include "Db.hpp"
#include "Ledger.hpp"
#include "QuotaGate.hpp"
#include "SessionTracker.hpp"
#include "BatchRefresh.hpp"
#include "Reclaimer.hpp"

using namespace std;

// Everything the accounting engine needs, built once at process start and
// handed by reference to whoever admits, stops or administers workloads.
class QuotaEngine {
public:
    // db_path ":memory:" gives a private in-memory store.
    // Empty log_path logs to stderr.
    QuotaEngine(const string &db_path, const string &log_path);

    QuotaEngine(const QuotaEngine &) = delete;
    QuotaEngine &operator=(const QuotaEngine &) = delete;

    // Opens/migrates the schema. Must succeed before anything else is used.
    bool init(string &err);

    Logger& logger() { return logger_; }
    Db& db() { return *db_; }
    Ledger& ledger() { return ledger_; }
    QuotaGate& gate() { return gate_; }
    SessionTracker& sessions() { return sessions_; }
    BatchRefresh& refresher() { return refresher_; }
    Reclaimer& reclaimer() { return reclaimer_; }

private:
    string db_path_;
    Logger logger_;
    unique_ptr<Db> db_;
    Ledger ledger_;
    QuotaGate gate_;
    SessionTracker sessions_;
    BatchRefresh refresher_;
    Reclaimer reclaimer_;
};
