#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <transport/api_transport.hpp>
#include "job_model.hpp"
#include "retry_policy.hpp"

class EventReporter;

enum class LogStreamKind { Stdout, Stderr };

struct LogChunk {
    uint64_t seq = 0;
    LogStreamKind stream = LogStreamKind::Stdout;
    std::string data;
};

// Lazy sequence of a job's log chunks, read from
// GET /jobs/{id}/log?since=N (newline-delimited JSON).
//
// next() returns:
//   Ok(chunk)    the next chunk; seq strictly increases
//   Ok(nullopt)  the remote stream closed cleanly and the job is terminal
//   Err(...)     SequenceGap when chunks were skipped (the chunk after the gap
//                is returned by the following call), Cancelled, or the last
//                error once reconnects are exhausted; the stream is finished
//                after any error other than SequenceGap.
//
// A broken connection is reopened with since=<last seq>; chunks the server
// replays (seq <= last) are dropped. Single consumer: next() and close() must
// be called from the same thread. Use the cancel token from elsewhere.
class LogStream {
public:
    using StatusFetch = std::function<Result<JobStatus>()>;

    LogStream(ApiTransport& api, const RetryPolicy& policy, std::string job_id,
              StatusFetch fetch_status, std::chrono::milliseconds reopen_delay,
              Sleeper sleep, CancelToken cancel, EventReporter* reporter = nullptr,
              uint64_t since = 0);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    Result<std::optional<LogChunk>> next();
    void close();

    const std::string& job_id() const { return job_id_; }
    uint64_t last_seq() const { return last_seq_; }
    int reconnects() const { return reconnects_; }
    uint64_t duplicates_dropped() const { return duplicates_; }

private:
    ApiTransport& api_;
    const RetryPolicy& policy_;
    std::string job_id_;
    StatusFetch fetch_status_;
    std::chrono::milliseconds reopen_delay_;
    Sleeper sleep_;
    CancelToken cancel_;
    EventReporter* reporter_;

    std::unique_ptr<ByteStream> stream_;
    std::string line_buf_;
    struct Pending {
        LogChunk chunk;
        std::optional<Error> gap;   // reported before the chunk
    };
    std::deque<Pending> ready_;
    uint64_t last_seq_ = 0;
    uint64_t duplicates_ = 0;
    int reconnects_ = 0;
    bool terminal_seen_ = false;
    bool finished_ = false;

    // Consecutive connection failures since the last good read.
    int failures_ = 0;
    std::chrono::steady_clock::time_point first_failure_;

    Result<void> open();
    Result<void> consume(const std::string& bytes, bool flush);
    Result<void> accept_line(const std::string& line);
    // Returns Ok to retry, Err to give up.
    Result<void> on_failure(const Error& err);
    Result<void> on_clean_close();
    Result<std::optional<LogChunk>> fail(Error err);
};
