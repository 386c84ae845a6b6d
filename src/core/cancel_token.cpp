#include "cancel_token.hpp"

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true)) return;
    }
    state_->cv.notify_all();

    std::lock_guard<std::mutex> lock(state_->callbacks_mutex);
    for (auto& [id, fn] : state_->callbacks) fn();
    state_->callbacks.clear();
}

bool CancelToken::is_cancelled() const {
    return state_->cancelled.load();
}

bool CancelToken::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, d, [this] { return state_->cancelled.load(); });
}

size_t CancelToken::on_cancel(std::function<void()> fn) {
    std::unique_lock<std::mutex> lock(state_->callbacks_mutex);
    if (state_->cancelled.load()) {
        lock.unlock();
        fn();
        return 0;
    }
    size_t id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(fn));
    return id;
}

void CancelToken::remove_on_cancel(size_t id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lock(state_->callbacks_mutex);
    state_->callbacks.erase(id);
}
