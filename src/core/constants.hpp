#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* NEURO_VERSION = "0.4.0";

// ── Defaults (overridable in ~/.neuro/config.yaml) ──────────
constexpr int DEFAULT_CONCURRENCY           = 10;
constexpr double DEFAULT_POLL_INTERVAL_SECS = 5.0;
constexpr double DEFAULT_POLL_MAX_SECS      = 30.0;
constexpr int DEFAULT_HTTP_TIMEOUT_SECS     = 60;
constexpr int MAX_CONCURRENCY               = 64;

// ── Retry policy ────────────────────────────────────────────
constexpr int RETRY_MAX_ATTEMPTS            = 5;
constexpr int RETRY_BASE_DELAY_MS           = 500;
constexpr int RETRY_MAX_DELAY_MS            = 30000;
constexpr double RETRY_MAX_ELAPSED_SECS     = 120.0;
constexpr double RETRY_RATE_LIMIT_FACTOR    = 4.0;

// ── Polling ─────────────────────────────────────────────────
constexpr double POLL_BACKOFF_FACTOR        = 1.5;   // per unchanged poll

// ── Job resource bounds ─────────────────────────────────────
constexpr double JOB_MAX_CPU                = 128.0;
constexpr int JOB_MIN_MEMORY_MB             = 16;
constexpr int JOB_MAX_MEMORY_MB             = 1024 * 1024;  // 1 TB
constexpr int JOB_MAX_GPU                   = 16;

// ── Buffers ─────────────────────────────────────────────────
constexpr int HASH_READ_BUF_SIZE            = 64 * 1024;
constexpr int STREAM_CHANNEL_CAPACITY       = 64;    // byte chunks in flight
constexpr int EVENT_CHANNEL_CAPACITY        = 256;

// ── Local files ─────────────────────────────────────────────
constexpr const char* PARTIAL_SUFFIX        = ".neuro-part";
constexpr const char* STORAGE_URI_SCHEME    = "storage://";
