#pragma once

#include <string>
#include <filesystem>

// Debug log: one "[HH:MM:SS.mmm] msg" line per call. Defaults to
// <tmp>/neuro_debug.log until set_log_path() is called with a non-empty path.
void set_log_path(const std::filesystem::path& path);
std::string neuro_log_path();
void neuro_log(const std::string& msg);

// Persistent per-job history: ~/.neuro/logs/{job_id}.log
std::string job_log_path(const std::string& job_id);

// Append a timestamped line to a job's persistent history file.
void append_job_log(const std::string& job_id, const std::string& msg);
