#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
// Fractional seconds and a trailing UTC offset are accepted and ignored.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Random lowercase hex string of n_bytes * 2 characters.
std::string random_hex(size_t n_bytes);

// Percent-encode a query parameter value (RFC 3986 unreserved set kept).
std::string url_encode(const std::string& value);

// Percent-encode a path, keeping '/' separators.
std::string url_encode_path(const std::string& path);

// Join a remote root and a relative key with exactly one '/'.
std::string join_remote(const std::string& root, const std::string& rel);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
