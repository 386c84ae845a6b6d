#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

struct RetryDecision {
    bool give_up = true;
    std::chrono::milliseconds delay{0};

    static RetryDecision retry_after(std::chrono::milliseconds d) { return {false, d}; }
    static RetryDecision stop() { return {true, std::chrono::milliseconds(0)}; }
};

// Per-invocation bookkeeping; discarded on success or final failure.
struct RetryState {
    int attempts = 0;
    std::chrono::milliseconds next_delay{0};
    std::optional<Error> last_error;
};

// Shared backoff policy. decide() is a pure function of its arguments;
// the jitter sample is supplied by the caller (sample_jitter() for real use).
class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config);

    // attempt: number of attempts made so far (>= 1).
    // elapsed: time since the first attempt started.
    // jitter:  uniform sample in [0, 1); the delay is scaled into [d/2, d].
    RetryDecision decide(ErrorKind kind, int attempt,
                         std::chrono::milliseconds elapsed, double jitter) const;

    double sample_jitter() const;

    const RetryConfig& config() const { return config_; }

private:
    RetryConfig config_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937 rng_;
};

// Sleeps for the given delay; returns false if the wait was interrupted by
// cancellation. Injectable so tests can observe delays without sleeping.
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

Sleeper cancellable_sleeper(CancelToken cancel);

// Run op(attempt) until it succeeds, the policy gives up, or the sleeper
// reports cancellation. On final failure the returned error carries the
// attempt count and, if empty, `subject`. on_retry sees the state before each
// backoff sleep.
template <typename Op>
auto retry_call(const RetryPolicy& policy, const std::string& subject, Op&& op,
                const Sleeper& sleep, RetryState* state = nullptr,
                const std::function<void(const RetryState&)>& on_retry = nullptr)
    -> std::invoke_result_t<Op&, int> {
    using R = std::invoke_result_t<Op&, int>;

    RetryState local;
    RetryState& st = state ? *state : local;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        st.attempts++;
        R r = op(st.attempts);
        if (r.is_ok()) return r;

        st.last_error = r.error;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        RetryDecision d = policy.decide(r.error.kind, st.attempts, elapsed, policy.sample_jitter());
        if (d.give_up) {
            r.error.attempts = st.attempts;
            if (r.error.subject.empty()) r.error.subject = subject;
            return r;
        }

        st.next_delay = d.delay;
        if (on_retry) on_retry(st);
        if (!sleep(d.delay)) {
            Error e = Error::make(ErrorKind::Cancelled, "cancelled during retry backoff", subject);
            e.attempts = st.attempts;
            e.cause = r.error.message;
            return R::Err(e);
        }
    }
}
