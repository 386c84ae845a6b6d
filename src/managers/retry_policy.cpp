#include "retry_policy.hpp"
#include <algorithm>
#include <cmath>

RetryPolicy::RetryPolicy(const RetryConfig& config)
    : config_(config), rng_(std::random_device{}()) {}

RetryDecision RetryPolicy::decide(ErrorKind kind, int attempt,
                                  std::chrono::milliseconds elapsed, double jitter) const {
    if (kind != ErrorKind::TransientNetwork && kind != ErrorKind::RateLimited) {
        return RetryDecision::stop();
    }
    if (attempt >= config_.max_attempts) {
        return RetryDecision::stop();
    }

    double base = static_cast<double>(std::max(config_.base_delay_ms, 1));
    double cap = static_cast<double>(std::max(config_.max_delay_ms, config_.base_delay_ms));
    double delay = std::min(base * std::pow(2.0, std::max(attempt - 1, 0)), cap);
    if (kind == ErrorKind::RateLimited) {
        delay *= std::max(config_.rate_limit_multiplier, 1.0);
    }

    jitter = std::clamp(jitter, 0.0, 1.0);
    auto ms = std::chrono::milliseconds(static_cast<long long>(delay * (0.5 + 0.5 * jitter)));

    auto budget = std::chrono::milliseconds(static_cast<long long>(config_.max_elapsed * 1000.0));
    if (elapsed + ms > budget) {
        return RetryDecision::stop();
    }
    return RetryDecision::retry_after(ms);
}

double RetryPolicy::sample_jitter() const {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

Sleeper cancellable_sleeper(CancelToken cancel) {
    return [cancel](std::chrono::milliseconds d) {
        return !cancel.wait_for(d);
    };
}
