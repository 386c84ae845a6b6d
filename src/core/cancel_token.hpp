#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

// Cooperative cancellation handle. Copies share state; a default-constructed
// token is valid and simply never cancelled unless cancel() is called on it
// or one of its copies.
class CancelToken {
public:
    CancelToken();

    void cancel();
    bool is_cancelled() const;

    // Sleep for up to d. Returns true if the token was cancelled (early wake).
    bool wait_for(std::chrono::milliseconds d) const;

    // Run fn once on cancel (immediately if already cancelled). Returns an id
    // for remove_on_cancel(); owners must remove before they are destroyed.
    // fn must not call back into this token.
    size_t on_cancel(std::function<void()> fn);

    // Blocks while callbacks are running, so after it returns the removed
    // callback is guaranteed not to be executing.
    void remove_on_cancel(size_t id);

private:
    struct State {
        std::atomic<bool> cancelled{false};
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::mutex callbacks_mutex;
        std::map<size_t, std::function<void()>> callbacks;
        size_t next_id = 1;
    };
    std::shared_ptr<State> state_;
};

// RAII registration of a cancel callback.
class CancelRegistration {
public:
    CancelRegistration(CancelToken token, std::function<void()> fn)
        : token_(std::move(token)), id_(token_.on_cancel(std::move(fn))) {}
    ~CancelRegistration() { token_.remove_on_cancel(id_); }

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

private:
    CancelToken token_;
    size_t id_;
};
