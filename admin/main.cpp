#include "AdminConsole.hpp"
#include "../engine/QuotaEngine.hpp"
#include "../common/Utils.hpp"
#include <iostream>
#include <string>

using namespace std;

int main(int argc, char *argv[]) {
    QuotaConfig cfg;
    string err;
    if (!load_quota_config(cfg, err)) {
        cerr << "Config error: " << err << "\n";
        return 1;
    }
    if (argc > 1) cfg.db_path = argv[1];

    for (const string &path : {cfg.db_path, cfg.log_path}) {
        string dir = utils::parent_dir(path);
        if (!dir.empty() && !utils::ensure_dir(dir)) {
            cerr << "Cannot create directory " << dir << "\n";
            return 1;
        }
    }

    bool fresh = cfg.db_path != ":memory:" && !utils::file_exists(cfg.db_path);

    QuotaEngine engine(cfg.db_path, cfg.log_path);
    if (!engine.init(err)) {
        cerr << "DB init failed: " << err << "\n";
        return 1;
    }
    if (fresh) engine.logger().info("main", "Created new quota store " + cfg.db_path);

    // Sessions left active by a crash are closed without charge
    vector<ReclaimedSession> reclaimed;
    if (!engine.reclaimer().reclaim(cfg.stale_minutes, reclaimed, err)) {
        engine.logger().error("main", "Startup reclaim failed: " + err);
    } else if (!reclaimed.empty()) {
        engine.logger().info("main", "Startup reclaim closed " + to_string(reclaimed.size()) +
                             " stale session(s)");
    }

    AdminConsole console(engine, cin, cout);
    console.run();
    return 0;
}
