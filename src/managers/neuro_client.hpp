#pragma once

#include <memory>
#include <core/config.hpp>
#include <transport/api_transport.hpp>
#include "event_reporter.hpp"
#include "job_controller.hpp"
#include "retry_policy.hpp"
#include "state_store.hpp"
#include "storage_sync.hpp"
#include "worker_pool.hpp"

// Everything one invocation needs, built from a single Config value.
// The job controller and the sync engine share one RetryPolicy, one
// ConcurrencyLimiter and one EventReporter.
class NeuroClient {
public:
    // Validates the config and builds libcurl transports for api.url and
    // storage.url.
    static Result<std::unique_ptr<NeuroClient>> create(const Config& config);

    NeuroClient(const Config& config, std::unique_ptr<ApiTransport> api,
                std::unique_ptr<ApiTransport> storage, std::unique_ptr<StateStore> state);

    NeuroClient(const NeuroClient&) = delete;
    NeuroClient& operator=(const NeuroClient&) = delete;

    JobController& jobs() { return jobs_; }
    SyncEngine& sync() { return sync_; }
    EventReporter& events() { return events_; }
    StateStore* state() { return state_.get(); }
    const Config& config() const { return config_; }
    const RetryPolicy& retry_policy() const { return policy_; }
    ConcurrencyLimiter& limiter() { return limiter_; }

private:
    Config config_;
    std::unique_ptr<ApiTransport> api_;
    std::unique_ptr<ApiTransport> storage_api_;
    std::unique_ptr<StateStore> state_;
    RetryPolicy policy_;
    ConcurrencyLimiter limiter_;
    EventReporter events_;
    JobController jobs_;
    SyncEngine sync_;
};
