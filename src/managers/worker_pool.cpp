#include "worker_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>

// ── ConcurrencyLimiter ─────────────────────────────────────

ConcurrencyLimiter::ConcurrencyLimiter(size_t limit) : limit_(std::max<size_t>(limit, 1)) {}

ConcurrencyLimiter::Permit& ConcurrencyLimiter::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void ConcurrencyLimiter::Permit::release() {
    if (owner_) {
        owner_->release_one();
        owner_ = nullptr;
    }
}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::acquire(CancelToken cancel) {
    CancelRegistration wake(cancel, [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return cancel.is_cancelled() || in_use_ < limit_; });
    if (cancel.is_cancelled()) return std::nullopt;

    in_use_++;
    peak_ = std::max(peak_, in_use_);
    return Permit(this);
}

size_t ConcurrencyLimiter::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

size_t ConcurrencyLimiter::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void ConcurrencyLimiter::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) in_use_--;
    }
    cv_.notify_one();
}

// ── WorkerPool ─────────────────────────────────────────────

WorkerPool::WorkerPool(size_t threads) {
    threads = std::max<size_t>(threads, 1);
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    task_ready_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    task_ready_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_ready_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
            running_++;
        }

        try {
            task();
        } catch (const std::exception& e) {
            // Tasks report through Result; an escaped exception is a bug
            neuro_log(fmt::format("worker task threw: {}", e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_--;
            if (tasks_.empty() && running_ == 0) idle_.notify_all();
        }
    }
}
