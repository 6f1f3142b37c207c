#include "QuotaEngine.hpp"
#include "DbSqlite.hpp"

QuotaEngine::QuotaEngine(const string &db_path, const string &log_path)
    : db_path_(db_path),
      logger_(log_path),
      db_(make_unique<DbSqlite>(db_path)),
      ledger_(*db_, logger_),
      gate_(ledger_),
      sessions_(*db_, ledger_, logger_),
      refresher_(*db_, ledger_, logger_),
      reclaimer_(*db_, logger_) {}

bool QuotaEngine::init(string &err) {
    if (!db_->init_schema(err)) {
        logger_.error("engine", "DB init failed for " + db_path_ + ": " + err);
        return false;
    }
    logger_.info("engine", "Quota store ready at " + db_path_);
    return true;
}
