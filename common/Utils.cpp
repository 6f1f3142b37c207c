#include "Utils.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>

using namespace std;

namespace utils {

string to_lower(const string &s) {
    string out = s;
    for (char &c : out) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

string trim(const string &s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

vector<string> split_tokens(const string &s) {
    vector<string> tokens;
    string cur;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

vector<string> split(const string &s, char sep) {
    vector<string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(sep, start);
        if (pos == string::npos) pos = s.size();
        string part = trim(s.substr(start, pos - start));
        if (!part.empty()) parts.push_back(part);
        start = pos + 1;
    }
    return parts;
}

bool parse_int64(const string &s, int64_t &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    long long v = strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

bool checked_add(int64_t a, int64_t b, int64_t &out) {
    int64_t r;
    if (__builtin_add_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

bool checked_mul(int64_t a, int64_t b, int64_t &out) {
    int64_t r;
    if (__builtin_mul_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

bool parse_bool(const string &s, bool &out) {
    string v = to_lower(trim(s));
    if (v == "1" || v == "true" || v == "on" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "off" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

time_t now_seconds() {
    return ::time(nullptr);
}

string format_utc(time_t t) {
    tm tmv{};
    gmtime_r(&t, &tmv);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return string(buf);
}

bool parse_utc(const string &text, time_t &out) {
    tm tmv{};
    int consumed = 0;
    if (sscanf(text.c_str(), "%d-%d-%d %d:%d:%d%n",
               &tmv.tm_year, &tmv.tm_mon, &tmv.tm_mday,
               &tmv.tm_hour, &tmv.tm_min, &tmv.tm_sec, &consumed) != 6) {
        return false;
    }
    if (static_cast<size_t>(consumed) != text.size()) return false;
    tmv.tm_year -= 1900;
    tmv.tm_mon  -= 1;
    out = timegm(&tmv);
    return true;
}

string join_path(const string &a, const string &b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_slash_end = (a.back() == '/');
    bool b_slash_start = (b.front() == '/');

    if (a_slash_end && b_slash_start) {
        return a + b.substr(1);
    } else if (!a_slash_end && !b_slash_start) {
        return a + "/" + b;
    } else {
        return a + b;
    }
}

string parent_dir(const string &path) {
    size_t pos = path.find_last_of('/');
    if (pos == string::npos) return "";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

static bool mkdir_single(const string &path) {
    if (path.empty()) return true;
    int rc = ::mkdir(path.c_str(), 0755);
    if (rc == 0) return true;
    if (errno == EEXIST) return true;
    return false;
}

vector<string> split_path(const string &path) {
    vector<string> parts;
    string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) {
                parts.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

bool ensure_dir(const string &path) {
    if (path.empty()) return true;

    vector<string> parts = split_path(path);
    string cur;
    if (path.front() == '/') {
        cur = "/";
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (cur == "/" || cur.empty())
            cur += parts[i];
        else
            cur = join_path(cur, parts[i]);

        if (!mkdir_single(cur)) {
            struct stat st{};
            if (::stat(cur.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
                return false;
            }
        }
    }
    return true;
}

bool file_exists(const string &path) {
    struct stat st{};
    return (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode));
}

} // namespace utils
