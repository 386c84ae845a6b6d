#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>
#include <core/cancel_token.hpp>

// Counting limit on concurrent network operations, shared by every transfer
// and job waiter of one client. Permits are RAII: the slot is returned on
// every exit path, including errors and cancellation.
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(size_t limit);

    class Permit {
    public:
        Permit() = default;
        explicit Permit(ConcurrencyLimiter* owner) : owner_(owner) {}
        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        ~Permit() { release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        void release();

    private:
        ConcurrencyLimiter* owner_ = nullptr;
    };

    // Blocks until a slot is free. nullopt if cancel fires first.
    std::optional<Permit> acquire(CancelToken cancel = {});

    size_t limit() const { return limit_; }
    size_t in_use() const;
    size_t peak() const;

private:
    const size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_use_ = 0;
    size_t peak_ = 0;

    void release_one();
};

// Fixed set of worker threads draining a task queue.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    // Block until the queue is empty and no task is running.
    void wait_idle();

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable task_ready_;
    std::condition_variable idle_;
    size_t running_ = 0;
    bool stop_ = false;

    void worker_loop();
};
