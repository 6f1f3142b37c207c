#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

using namespace std;

namespace utils {

// Lowercase ASCII copy; usernames are keyed this way.
string to_lower(const string &s);

// Strip leading/trailing whitespace
string trim(const string &s);

// Split on space/tab, dropping empty tokens
vector<string> split_tokens(const string &s);

// Split on a single separator, trimming each part and dropping empty ones
vector<string> split(const string &s, char sep);

// Strict base-10 parse of the whole string. False on garbage or overflow.
bool parse_int64(const string &s, int64_t &out);

// a + b / a * b into out. False (out untouched) when the result does not
// fit in int64_t.
bool checked_add(int64_t a, int64_t b, int64_t &out);
bool checked_mul(int64_t a, int64_t b, int64_t &out);

// "on/off", "true/false", "yes/no", "1/0"
bool parse_bool(const string &s, bool &out);

// Current time, whole seconds
time_t now_seconds();

// UTC "YYYY-MM-DD HH:MM:SS" (same shape as SQLite CURRENT_TIMESTAMP)
string format_utc(time_t t);

// Inverse of format_utc. False if the text is not in that shape.
bool parse_utc(const string &text, time_t &out);

// Join two paths with exactly one '/'
string join_path(const string &a, const string &b);

// Directory part of a path ("" if none)
string parent_dir(const string &path);

// "mkdir -p". True if the directory exists afterwards.
bool ensure_dir(const string &path);

// Regular file exists
bool file_exists(const string &path);

// Split a path on '/', dropping empty components
vector<string> split_path(const string &path);

} // namespace utils
