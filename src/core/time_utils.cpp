#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <cctype>
#include <sstream>
#include <iomanip>

// Parses the leading YYYY-MM-DDTHH:MM:SS; fractional seconds and offsets that
// follow are ignored. Server timestamps are UTC.
static bool parse_iso(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    return !ss.fail();
}

static bool to_epoch(const std::string& s, std::time_t* out) {
    struct tm tm_buf = {};
    if (!parse_iso(s, &tm_buf)) return false;
    *out = timegm(&tm_buf);
    return true;
}

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    long long seconds = elapsed.count() / 1000;
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    std::time_t start_t;
    if (!to_epoch(start_time, &start_t)) return "?";

    std::time_t end_t;
    if (!end_time.empty()) {
        if (!to_epoch(end_time, &end_t)) return "?";
    } else {
        end_t = std::time(nullptr);
    }

    auto diff = static_cast<long long>(std::difftime(end_t, start_t));
    return format_elapsed(std::chrono::seconds(diff));
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time, &tm_buf)) {
        return "?";
    }

    // "08:13PM" -> "8:13pm"
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string format_bytes(int64_t bytes) {
    if (bytes < 1024) return fmt::format("{}B", bytes);
    const char* units[] = {"K", "M", "G", "T"};
    double v = static_cast<double>(bytes);
    int u = -1;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        ++u;
    }
    return fmt::format("{:.1f}{}", v, units[u]);
}
