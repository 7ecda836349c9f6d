#include "runner/cancel_token.hpp"

#include <vector>

namespace codejoin::runner {

void CancelToken::Cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        dispatching_ = true;
        dispatcher_ = std::this_thread::get_id();
        for (auto& [id, callback] : callbacks_) {
            callbacks.push_back(std::move(callback));
        }
        callbacks_.clear();
    }
    for (const auto& callback : callbacks) {
        if (callback) {
            callback();
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatching_ = false;
    }
    cv_.notify_all();
}

bool CancelToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::size_t CancelToken::OnCancel(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            const auto id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    if (callback) {
        callback();
    }
    return 0;
}

void CancelToken::RemoveCallback(std::size_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    callbacks_.erase(id);
    if (dispatcher_ == std::this_thread::get_id()) {
        return;
    }
    cv_.wait(lock, [this] { return !dispatching_; });
}

}  // namespace codejoin::runner
