#pragma once
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "../engine/Config.hpp"

using namespace std;

class QuotaEngine;

// Line-oriented admin/supervisor front end over a QuotaEngine.
// Each command gets one "OK <code> ..." or "ERR <code> ..." line; list
// replies are "OK 200 <count>" followed by <count> '|' separated rows.
class AdminConsole {
public:
    AdminConsole(QuotaEngine &engine, istream &in, ostream &out);

    void run();

    // false once the session should end (QUIT / EXIT)
    bool handle_command(const string &line);

    const string& actor() const { return actor_; }

private:
    bool cmd_actor(const vector<string> &tokens);
    bool cmd_balance(const vector<string> &tokens);
    bool cmd_account(const vector<string> &tokens);
    bool cmd_balances();
    bool cmd_history(const vector<string> &tokens);
    bool cmd_set(const vector<string> &tokens);
    bool cmd_add(const vector<string> &tokens);
    bool cmd_deduct(const vector<string> &tokens);
    bool cmd_unlimited(const vector<string> &tokens);
    bool cmd_batch_set(const vector<string> &tokens);
    bool cmd_refresh(const vector<string> &tokens);

    // Workload supervisor side
    bool cmd_can_start(const vector<string> &tokens);
    bool cmd_start(const vector<string> &tokens);
    bool cmd_end(const vector<string> &tokens);
    bool cmd_active(const vector<string> &tokens);
    bool cmd_sessions();
    bool cmd_reclaim(const vector<string> &tokens);
    bool cmd_rates();

    // Config is re-read for every command that needs it
    bool load_config(QuotaConfig &cfg);
    void send_line(const string &line);

    QuotaEngine &engine_;
    istream &in_;
    ostream &out_;
    string actor_ = "admin";
};
