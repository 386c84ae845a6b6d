#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "errors.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(Error err) {
        return {false, T{}, std::move(err)};
    }

    static Result<T> Err(const std::string& msg) {
        return Err(Error::make(ErrorKind::Permanent, msg));
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(Error err) {
        return {false, std::move(err)};
    }

    static Result<void> Err(const std::string& msg) {
        return Err(Error::make(ErrorKind::Permanent, msg));
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// HTTP response as seen by the core (status + body)
struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Configuration structures
struct ApiConfig {
    std::string url;
    std::string token;
    int timeout = 60;
};

struct StorageConfig {
    std::string url;
    int concurrency = 10;
};

struct JobsConfig {
    double poll_interval = 5.0;       // seconds
    double poll_interval_max = 30.0;  // seconds, adaptive backoff cap
};

struct RetryConfig {
    int max_attempts = 5;
    int base_delay_ms = 500;
    int max_delay_ms = 30000;
    double max_elapsed = 120.0;       // seconds
    double rate_limit_multiplier = 4.0;
};

struct Preset {
    double cpu = 1.0;
    int memory_mb = 1024;
    int gpu = 0;
    std::string gpu_model;
    bool is_preemptible = false;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
