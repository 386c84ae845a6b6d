#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <transport/api_transport.hpp>
#include "job_model.hpp"
#include "event_reporter.hpp"
#include "log_stream.hpp"
#include "retry_policy.hpp"
#include "worker_pool.hpp"

class StateStore;

struct JobFilter {
    std::vector<JobStatus> statuses;
    std::string name;
    std::string client_request_id;
    std::string description;   // exact match, applied to the returned list
};

// "?status=running&name=train" (empty string for an empty filter).
// The description is not sent.
std::string job_filter_query(const JobFilter& filter);

struct WaitOptions {
    std::chrono::milliseconds poll_interval{5000};
    std::chrono::milliseconds poll_interval_max{30000};
    std::optional<std::chrono::milliseconds> timeout;
};

struct JobOutcome {
    std::string job_id;
    Result<Job> result;
};

struct CancelOutcome {
    std::string job_id;
    Result<void> result;
};

// Drives remote jobs through submit / poll / cancel / log streaming.
//
// Every request goes through the shared ConcurrencyLimiter and the shared
// RetryPolicy. Observed statuses are checked against the job state machine;
// accepted transitions land in the per-job history log and, when a
// StateStore is attached, in ~/.neuro/state.yaml.
class JobController {
public:
    using SleeperFactory = std::function<Sleeper(CancelToken)>;

    JobController(ApiTransport& api, const RetryPolicy& policy, ConcurrencyLimiter& limiter,
                  const JobsConfig& config, EventReporter* reporter = nullptr,
                  StateStore* state = nullptr);

    // Replace how backoff and poll sleeps are performed (tests).
    void set_sleeper_factory(SleeperFactory factory) { sleeper_factory_ = std::move(factory); }

    // Validate and POST the job spec with a fresh client_request_id. Only failures
    // that provably happened before the request left are retried. Anything
    // else comes back as AmbiguousState whose subject is the request id; the
    // request is never resent automatically.
    Result<Job> submit(const JobSpec& spec, CancelToken cancel = {});

    // Resolve an ambiguous submission: look the request id up on the server.
    // If nothing is there and resubmit is set, the stored request is sent
    // again under the same id.
    Result<Job> confirm_submission(const std::string& request_id, bool resubmit,
                                   CancelToken cancel = {});

    Result<Job> status(const std::string& job_id, CancelToken cancel = {});

    // Poll until terminal. The interval grows by POLL_BACKOFF_FACTOR on every
    // unchanged poll (capped at poll_interval_max) and resets on a change.
    // Timeout leaves the remote job untouched.
    Result<Job> wait(const std::string& job_id, const WaitOptions& opts,
                     CancelToken cancel = {},
                     const std::function<void(const Job&)>& on_change = nullptr);

    std::vector<JobOutcome> wait_all(const std::vector<std::string>& job_ids,
                                     const WaitOptions& opts, CancelToken cancel = {});

    // Idempotent: a job that is already terminal is left alone.
    Result<void> cancel(const std::string& job_id, CancelToken cancel = {});
    std::vector<CancelOutcome> cancel_many(const std::vector<std::string>& job_ids,
                                           CancelToken cancel = {});

    Result<std::vector<Job>> list(const JobFilter& filter, CancelToken cancel = {});

    std::unique_ptr<LogStream> stream_logs(const std::string& job_id, CancelToken cancel = {},
                                           uint64_t since = 0);

    WaitOptions default_wait_options() const;

private:
    ApiTransport& api_;
    const RetryPolicy& policy_;
    ConcurrencyLimiter& limiter_;
    JobsConfig config_;
    EventReporter* reporter_;
    StateStore* state_;
    SleeperFactory sleeper_factory_;

    std::mutex known_mutex_;
    std::map<std::string, JobStatus> known_;

    Result<HttpResponse> call(const std::string& method, const std::string& path,
                              const std::string& body, const std::string& subject,
                              CancelToken cancel);
    Result<Job> post_submission(const std::string& request_id, const std::string& body,
                                CancelToken cancel);
    Result<void> observe(const Job& job);
    void record(const Job& job);
    void emit(const std::string& job_id, EventKind kind, const std::string& message);
};
