#include "log.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>

namespace fs = std::filesystem;

// Transfers and pollers log from worker threads.
static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "neuro_debug.log").string();
    return path;
}

void set_log_path(const fs::path& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    log_path_storage() = path.string();
}

std::string neuro_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void neuro_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

std::string job_log_path(const std::string& job_id) {
    return (platform::home_dir() / ".neuro" / "logs" / (job_id + ".log")).string();
}

void append_job_log(const std::string& job_id, const std::string& msg) {
    std::string path = job_log_path(job_id);
    std::lock_guard<std::mutex> lock(log_mutex());
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}
