#pragma once

#include <string>
#include <chrono>
#include <cstdint>

// Duration between two server timestamps ("2018-08-29T12:23:13.981621+00:00"
// or plain "YYYY-MM-DDTHH:MM:SS"). If end_time is empty, uses current time.
// Returns "2h35m", "14m22s", "8s", "-" if start is empty, "?" on parse failure.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Same rendering for an already measured interval.
std::string format_elapsed(std::chrono::milliseconds elapsed);

// Format a timestamp as "2:35pm". Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);

// Human-readable byte count: "512B", "4.0K", "12.5M", "3.1G".
std::string format_bytes(int64_t bytes);
