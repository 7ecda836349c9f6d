#include "bus/terminal_event_bus.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace codejoin::bus {

TerminalEventBus::TerminalEventBus()
    : TerminalEventBus(Options{}) {}

TerminalEventBus::TerminalEventBus(Options options)
    : options_(options) {
    options_.capacity = std::max<std::size_t>(1, options_.capacity);
}

bool TerminalEventBus::Publish(TerminalEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool closing = event.kind == EventKind::kClosed;
    if (queue_.size() >= options_.capacity && !closing) {
        bool room = false;
        if (options_.overflow == config::OverflowPolicy::kBlock) {
            room = not_full_.wait_for(lock, options_.publish_wait, [this] {
                return queue_.size() < options_.capacity;
            });
        }
        if (!room && !DropOldestOutput(event.session_id)) {
            ++dropped_;
            lock.unlock();
            utils::Log(utils::LogLevel::kWarn, "bus", "event dropped",
                       {{"session", event.session_id}, {"capacity", std::to_string(options_.capacity)}});
            return false;
        }
    }
    queue_.push_back(std::move(event));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

bool TerminalEventBus::DropOldestOutput(const std::string& session_id) {
    auto it = std::find_if(queue_.begin(), queue_.end(), [&session_id](const TerminalEvent& queued) {
        return queued.kind == EventKind::kOutput && queued.session_id == session_id;
    });
    if (it == queue_.end()) {
        return false;
    }
    queue_.erase(it);
    ++dropped_;
    return true;
}

bool TerminalEventBus::TryConsume(TerminalEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
}

std::size_t TerminalEventBus::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TerminalEventBus::Subscribe(std::function<void(const TerminalEvent&)> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(callback));
}

void TerminalEventBus::Dispatch() {
    running_ = true;
    while (running_) {
        TerminalEvent event;
        if (!TryConsume(event, std::chrono::milliseconds(200))) {
            continue;
        }
        std::vector<std::function<void(const TerminalEvent&)>> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks = subscribers_;
        }
        for (const auto& cb : callbacks) {
            if (cb) {
                cb(event);
            }
        }
    }
}

void TerminalEventBus::Stop() {
    running_ = false;
}

}  // namespace codejoin::bus
