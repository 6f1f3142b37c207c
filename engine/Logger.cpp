#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace {
const char *level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}
} // namespace

Logger::Logger(const string &filename) {
    if (!filename.empty()) {
        out_.open(filename, ios::app);
        if (!out_) {
            cerr << "Cannot open log file " << filename << ", logging to stderr\n";
        }
    }
}

void Logger::log(LogLevel level, const string &tag, const string &msg) {
    if (quiet_ && level == LogLevel::Info) return;

    auto now = chrono::system_clock::now();
    auto tt  = chrono::system_clock::to_time_t(now);
    tm tmv{};
    localtime_r(&tt, &tmv);

    lock_guard<mutex> lock(mtx_);
    ostream &os = out_.is_open() ? static_cast<ostream&>(out_) : static_cast<ostream&>(cerr);
    os << put_time(&tmv, "%Y-%m-%d %H:%M:%S")
       << " [" << level_name(level) << "] [" << tag << "] " << msg << "\n";
    os.flush();
}
