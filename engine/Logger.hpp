#pragma once
#include <fstream>
#include <mutex>
#include <atomic>
#include <string>

using namespace std;

enum class LogLevel {
    Info,
    Warn,
    Error,
};

// Appends "YYYY-MM-DD HH:MM:SS [LEVEL] [tag] message" lines.
// An empty filename (or one that cannot be opened) logs to stderr.
class Logger {
public:
    explicit Logger(const string &filename = "");

    void log(LogLevel level, const string &tag, const string &msg);

    void info(const string &tag, const string &msg)  { log(LogLevel::Info, tag, msg); }
    void warn(const string &tag, const string &msg)  { log(LogLevel::Warn, tag, msg); }
    void error(const string &tag, const string &msg) { log(LogLevel::Error, tag, msg); }

    // Drop INFO lines (tests, quiet consoles)
    void set_quiet(bool quiet) { quiet_ = quiet; }

private:
    ofstream out_;
    mutex mtx_;
    atomic<bool> quiet_{false};
};
