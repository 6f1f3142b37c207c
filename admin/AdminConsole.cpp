#include "AdminConsole.hpp"
#include "../engine/QuotaEngine.hpp"
#include "../common/Utils.hpp"
#include <utility>

using namespace std;
using utils::parse_int64;
using utils::split_tokens;

namespace {
const char *kTag = "admin";

// Rest of the line from token i on, for free-text descriptions
string join_from(const vector<string> &tokens, size_t i) {
    string s;
    for (; i < tokens.size(); ++i) {
        if (!s.empty()) s += " ";
        s += tokens[i];
    }
    return s;
}

string account_row(const Account &a) {
    return a.username + "|" + to_string(a.balance) + "|" + (a.unlimited ? "1" : "0") +
           "|" + a.updated_at;
}
} // namespace

AdminConsole::AdminConsole(QuotaEngine &engine, istream &in, ostream &out)
    : engine_(engine), in_(in), out_(out) {}

void AdminConsole::send_line(const string &line) {
    out_ << line << "\n";
    out_.flush();
}

bool AdminConsole::load_config(QuotaConfig &cfg) {
    string err;
    if (!load_quota_config(cfg, err)) {
        engine_.logger().error(kTag, "Config error: " + err);
        send_line("ERR 500 Config error: " + err);
        return false;
    }
    return true;
}

void AdminConsole::run() {
    string line;
    while (getline(in_, line)) {
        if (!handle_command(line)) break;
    }
}

bool AdminConsole::handle_command(const string &line) {
    vector<string> tokens = split_tokens(line);
    if (tokens.empty()) {
        send_line("ERR 400 Empty command");
        return true;
    }

    string cmd = tokens[0];

    if (cmd == "QUIT" || cmd == "EXIT") {
        send_line("OK 200 Bye");
        return false;
    }
    if (cmd == "ACTOR")     return cmd_actor(tokens);

    if (cmd == "BALANCE")   return cmd_balance(tokens);
    if (cmd == "ACCOUNT")   return cmd_account(tokens);
    if (cmd == "BALANCES")  return cmd_balances();
    if (cmd == "HISTORY")   return cmd_history(tokens);
    if (cmd == "SET")       return cmd_set(tokens);
    if (cmd == "ADD")       return cmd_add(tokens);
    if (cmd == "DEDUCT")    return cmd_deduct(tokens);
    if (cmd == "UNLIMITED") return cmd_unlimited(tokens);
    if (cmd == "BATCH_SET") return cmd_batch_set(tokens);
    if (cmd == "REFRESH")   return cmd_refresh(tokens);

    if (cmd == "CAN_START") return cmd_can_start(tokens);
    if (cmd == "START")     return cmd_start(tokens);
    if (cmd == "END")       return cmd_end(tokens);
    if (cmd == "ACTIVE")    return cmd_active(tokens);
    if (cmd == "SESSIONS")  return cmd_sessions();
    if (cmd == "RECLAIM")   return cmd_reclaim(tokens);
    if (cmd == "RATES")     return cmd_rates();

    send_line("ERR 400 Unknown command");
    return true;
}

bool AdminConsole::cmd_actor(const vector<string> &tokens) {
    if (tokens.size() < 2) {
        send_line("ERR 400 Usage: ACTOR <name>");
        return true;
    }
    actor_ = tokens[1];
    send_line("OK 200 Actor " + actor_);
    return true;
}

bool AdminConsole::cmd_balance(const vector<string> &tokens) {
    if (tokens.size() < 2) {
        send_line("ERR 400 Usage: BALANCE <user>");
        return true;
    }

    string err;
    int64_t balance = 0;
    bool unlimited = false;
    if (!engine_.ledger().get_balance(tokens[1], balance, err) ||
        !engine_.ledger().is_unlimited(tokens[1], unlimited, err)) {
        send_line("ERR 500 DB error: " + err);
        return true;
    }

    send_line("OK 200 " + utils::to_lower(tokens[1]) + " balance=" + to_string(balance) +
              " unlimited=" + (unlimited ? "1" : "0"));
    return true;
}

bool AdminConsole::cmd_account(const vector<string> &tokens) {
    if (tokens.size() < 2) {
        send_line("ERR 400 Usage: ACCOUNT <user>");
        return true;
    }

    string err;
    Account acc;
    if (!engine_.ledger().get_account(tokens[1], acc, err)) {
        if (!err.empty()) {
            send_line("ERR 500 DB error: " + err);
        } else {
            send_line("ERR 404 No such account");
        }
        return true;
    }

    send_line("OK 200 " + account_row(acc));
    return true;
}

bool AdminConsole::cmd_balances() {
    string err;
    vector<Account> accounts;
    if (!engine_.ledger().get_all_balances(accounts, err)) {
        send_line("ERR 500 DB error: " + err);
        return true;
    }

    send_line("OK 200 " + to_string(accounts.size()));
    for (const Account &a : accounts) send_line(account_row(a));
    return true;
}

bool AdminConsole::cmd_history(const vector<string> &tokens) {
    if (tokens.size() < 2) {
        send_line("ERR 400 Usage: HISTORY <user> [limit]");
        return true;
    }

    int64_t limit = 20;
    if (tokens.size() > 2 && (!parse_int64(tokens[2], limit) || limit <= 0)) {
        send_line("ERR 400 Invalid limit");
        return true;
    }

    string err;
    vector<TransactionRecord> txs;
    if (!engine_.ledger().get_transactions(tokens[1], static_cast<int>(limit), txs, err)) {
        send_line("ERR 500 DB error: " + err);
        return true;
    }

    send_line("OK 200 " + to_string(txs.size()));
    for (const TransactionRecord &t : txs) {
        send_line(to_string(t.id) + "|" + tx_type_name(t.type) + "|" + to_string(t.amount) +
                  "|" + to_string(t.balance_before) + "|" + to_string(t.balance_after) +
                  "|" + t.resource_type + "|" + t.description + "|" + t.created_at +
                  "|" + t.created_by);
    }
    return true;
}

bool AdminConsole::cmd_set(const vector<string> &tokens) {
    int64_t amount = 0;
    if (tokens.size() < 3 || !parse_int64(tokens[2], amount)) {
        send_line("ERR 400 Usage: SET <user> <amount>");
        return true;
    }

    string err;
    int64_t balance = 0;
    if (!engine_.ledger().set_balance(tokens[1], amount, actor_, balance, err)) {
        send_line("ERR 500 " + err);
        return true;
    }
    send_line("OK 200 " + utils::to_lower(tokens[1]) + " balance=" + to_string(balance));
    return true;
}

bool AdminConsole::cmd_add(const vector<string> &tokens) {
    int64_t amount = 0;
    if (tokens.size() < 3 || !parse_int64(tokens[2], amount)) {
        send_line("ERR 400 Usage: ADD <user> <amount> [description]");
        return true;
    }

    string err;
    int64_t balance = 0;
    if (!engine_.ledger().add_balance(tokens[1], amount, actor_, join_from(tokens, 3),
                                      balance, err)) {
        send_line("ERR 500 " + err);
        return true;
    }
    send_line("OK 200 " + utils::to_lower(tokens[1]) + " balance=" + to_string(balance));
    return true;
}

bool AdminConsole::cmd_deduct(const vector<string> &tokens) {
    int64_t amount = 0;
    if (tokens.size() < 3 || !parse_int64(tokens[2], amount) || amount < 0) {
        send_line("ERR 400 Usage: DEDUCT <user> <amount> [description]");
        return true;
    }

    string err;
    int64_t balance = 0;
    bool insufficient = false;
    if (!engine_.ledger().deduct_balance(tokens[1], amount, actor_, join_from(tokens, 3),
                                         balance, insufficient, err)) {
        send_line("ERR 500 " + err);
        return true;
    }
    if (insufficient) {
        send_line("ERR 400 Insufficient balance");
        return true;
    }
    send_line("OK 200 " + utils::to_lower(tokens[1]) + " balance=" + to_string(balance));
    return true;
}

bool AdminConsole::cmd_unlimited(const vector<string> &tokens) {
    bool flag = false;
    if (tokens.size() < 3 || !utils::parse_bool(tokens[2], flag)) {
        send_line("ERR 400 Usage: UNLIMITED <user> on|off");
        return true;
    }

    string err;
    if (!engine_.ledger().set_unlimited(tokens[1], flag, actor_, err)) {
        send_line("ERR 500 " + err);
        return true;
    }
    send_line("OK 200 " + utils::to_lower(tokens[1]) + " unlimited=" + (flag ? "1" : "0"));
    return true;
}

bool AdminConsole::cmd_batch_set(const vector<string> &tokens) {
    vector<pair<string, int64_t>> entries;
    for (size_t i = 1; i < tokens.size(); ++i) {
        for (const string &item : utils::split(tokens[i], ',')) {
            size_t eq = item.find('=');
            int64_t amount = 0;
            if (eq == string::npos || eq == 0 || !parse_int64(item.substr(eq + 1), amount)) {
                send_line("ERR 400 Bad entry '" + item + "', expected user=amount");
                return true;
            }
            entries.emplace_back(item.substr(0, eq), amount);
        }
    }
    if (entries.empty()) {
        send_line("ERR 400 Usage: BATCH_SET <user=amount>[,<user=amount>...]");
        return true;
    }

    string err;
    BatchSetResult result;
    if (!engine_.refresher().batch_set(entries, actor_, result, err)) {
        send_line("ERR 500 " + err);
        return true;
    }

    send_line("OK 200 " + to_string(result.details.size()) + " success=" +
              to_string(result.success) + " failed=" + to_string(result.failed));
    for (const BatchSetEntry &d : result.details) {
        send_line(d.username + "|" + (d.ok ? "success" : "failed") + "|" +
                  (d.ok ? to_string(d.balance) : d.error));
    }
    return true;
}

bool AdminConsole::cmd_refresh(const vector<string> &tokens) {
    const string usage =
        "ERR 400 Usage: REFRESH <amount> <add|set> [max=N] [min=N] [below=N] [above=N] "
        "[include=u1,u2] [exclude=u1,u2] [pattern=RE] [unlimited=on] [rule=NAME]";

    RefreshRequest req;
    if (tokens.size() < 3 || !parse_int64(tokens[1], req.amount)) {
        send_line(usage);
        return true;
    }
    if (!parse_refresh_action(tokens[2], req.action)) {
        send_line("ERR 400 Invalid action: " + tokens[2]);
        return true;
    }

    for (size_t i = 3; i < tokens.size(); ++i) {
        size_t eq = tokens[i].find('=');
        if (eq == string::npos) {
            send_line(usage);
            return true;
        }
        string key = tokens[i].substr(0, eq);
        string value = tokens[i].substr(eq + 1);

        bool ok = true;
        if (key == "max") {
            req.has_max_balance = parse_int64(value, req.max_balance);
            ok = req.has_max_balance;
        } else if (key == "min") {
            req.has_min_balance = parse_int64(value, req.min_balance);
            ok = req.has_min_balance;
        } else if (key == "below") {
            req.targets.has_balance_below = parse_int64(value, req.targets.balance_below);
            ok = req.targets.has_balance_below;
        } else if (key == "above") {
            req.targets.has_balance_above = parse_int64(value, req.targets.balance_above);
            ok = req.targets.has_balance_above;
        } else if (key == "include") {
            req.targets.include_users = utils::split(value, ',');
        } else if (key == "exclude") {
            req.targets.exclude_users = utils::split(value, ',');
        } else if (key == "pattern") {
            req.targets.username_pattern = value;
        } else if (key == "unlimited") {
            ok = utils::parse_bool(value, req.targets.include_unlimited);
        } else if (key == "rule") {
            ok = !value.empty();
            req.rule_name = value;
        } else {
            ok = false;
        }
        if (!ok) {
            send_line("ERR 400 Bad option '" + tokens[i] + "'");
            return true;
        }
    }

    engine_.logger().info(kTag, "Refresh triggered by " + actor_ + ": rule=" + req.rule_name +
                          ", action=" + refresh_action_name(req.action) +
                          ", amount=" + to_string(req.amount));

    string err;
    RefreshResult result;
    if (!engine_.refresher().refresh(req, result, err)) {
        send_line("ERR 500 " + err);
        return true;
    }

    send_line("OK 200 updated=" + to_string(result.users_updated) +
              " change=" + to_string(result.total_change) +
              " skipped=" + to_string(result.skipped) +
              " failed=" + to_string(result.failed) +
              " action=" + refresh_action_name(req.action) +
              " rule=" + req.rule_name);
    return true;
}

bool AdminConsole::cmd_can_start(const vector<string> &tokens) {
    int64_t minutes = 0;
    if (tokens.size() < 4 || !parse_int64(tokens[3], minutes) || minutes < 0) {
        send_line("ERR 400 Usage: CAN_START <user> <resource> <minutes>");
        return true;
    }

    QuotaConfig cfg;
    if (!load_config(cfg)) return true;
    if (!cfg.enabled) {
        send_line("OK 200 ALLOW cost=0 Quota disabled");
        return true;
    }

    string err;
    GateDecision d;
    if (!engine_.gate().can_start(tokens[1], tokens[2], minutes, cfg.rates,
                                  cfg.default_grant, d, err)) {
        send_line("ERR 500 " + err);
        return true;
    }

    if (d.allowed) {
        send_line("OK 200 ALLOW cost=" + to_string(d.estimated_cost) + " " + d.message);
    } else {
        send_line("ERR 402 " + d.message);
    }
    return true;
}

bool AdminConsole::cmd_start(const vector<string> &tokens) {
    int64_t minutes = 0;
    if (tokens.size() < 4 || !parse_int64(tokens[3], minutes) || minutes < 0) {
        send_line("ERR 400 Usage: START <user> <resource> <minutes>");
        return true;
    }

    QuotaConfig cfg;
    if (!load_config(cfg)) return true;
    if (!cfg.enabled) {
        send_line("OK 200 session=0 Quota disabled");
        return true;
    }

    string err;
    GateDecision d;
    if (!engine_.gate().can_start(tokens[1], tokens[2], minutes, cfg.rates,
                                  cfg.default_grant, d, err)) {
        send_line("ERR 500 " + err);
        return true;
    }
    if (!d.allowed) {
        engine_.logger().info(kTag, "Blocked start for " + tokens[1] + ": " + d.message);
        send_line("ERR 402 Cannot start: " + d.message);
        return true;
    }

    int64_t session_id = 0;
    if (!engine_.sessions().start_session(tokens[1], tokens[2], session_id, err)) {
        send_line("ERR 500 " + err);
        return true;
    }
    send_line("OK 200 session=" + to_string(session_id) +
              " estimated_cost=" + to_string(d.estimated_cost));
    return true;
}

bool AdminConsole::cmd_end(const vector<string> &tokens) {
    int64_t session_id = 0;
    if (tokens.size() < 2 || !parse_int64(tokens[1], session_id)) {
        send_line("ERR 400 Usage: END <session_id>");
        return true;
    }

    QuotaConfig cfg;
    if (!load_config(cfg)) return true;

    string err;
    int64_t duration = 0;
    int64_t consumed = 0;
    if (!engine_.sessions().end_session(session_id, cfg.rates, duration, consumed, err)) {
        send_line("ERR 500 " + err);
        return true;
    }
    send_line("OK 200 duration=" + to_string(duration) + " consumed=" + to_string(consumed));
    return true;
}

bool AdminConsole::cmd_active(const vector<string> &tokens) {
    if (tokens.size() < 2) {
        send_line("ERR 400 Usage: ACTIVE <user>");
        return true;
    }

    string err;
    UsageSession s;
    if (!engine_.sessions().get_active_session(tokens[1], s, err)) {
        if (!err.empty()) {
            send_line("ERR 500 DB error: " + err);
        } else {
            send_line("ERR 404 No active session");
        }
        return true;
    }
    send_line("OK 200 session=" + to_string(s.id) + " resource=" + s.resource_type +
              " start=" + s.start_time);
    return true;
}

bool AdminConsole::cmd_sessions() {
    string err;
    int64_t count = 0;
    if (!engine_.sessions().active_session_count(count, err)) {
        send_line("ERR 500 DB error: " + err);
        return true;
    }
    send_line("OK 200 active=" + to_string(count));
    return true;
}

bool AdminConsole::cmd_reclaim(const vector<string> &tokens) {
    QuotaConfig cfg;
    if (!load_config(cfg)) return true;

    int64_t minutes = cfg.stale_minutes;
    if (tokens.size() > 1 && (!parse_int64(tokens[1], minutes) || minutes <= 0)) {
        send_line("ERR 400 Usage: RECLAIM [max_minutes]");
        return true;
    }

    string err;
    vector<ReclaimedSession> reclaimed;
    if (!engine_.reclaimer().reclaim(minutes, reclaimed, err)) {
        send_line("ERR 500 " + err);
        return true;
    }

    send_line("OK 200 " + to_string(reclaimed.size()));
    for (const ReclaimedSession &r : reclaimed) {
        send_line(to_string(r.session_id) + "|" + r.username + "|" + r.resource_type + "|" +
                  to_string(r.duration_minutes));
    }
    return true;
}

bool AdminConsole::cmd_rates() {
    QuotaConfig cfg;
    if (!load_config(cfg)) return true;

    send_line(string("OK 200 enabled=") + (cfg.enabled ? "1" : "0") +
              " rates=" + format_rates(cfg.rates) +
              " default_grant=" + to_string(cfg.default_grant) +
              " minimum_to_start=" + to_string(cfg.minimum_to_start));
    return true;
}
