#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace codejoin::bus {

enum class EventKind {
    kOutput,
    kClosed
};

struct TerminalEvent {
    EventKind kind = EventKind::kOutput;
    std::string session_id;
    // Output bytes for kOutput.
    std::string data;
    // Close reason for kClosed: stopped, idle-timeout, crashed, disconnect, shutdown.
    std::string reason;
    std::optional<int> exit_code;
};

/**
 * Bounded queue between session readers (producers) and the transport
 * (consumer). When full, kBlock waits up to publish_wait for room and then
 * discards the publishing session's oldest output event; kDropOldest discards
 * it at once. A session never evicts another session's events: with nothing
 * of its own queued, its new event is dropped instead. Close events are never
 * discarded, so a consumer always learns a session ended.
 */
class TerminalEventBus {
public:
    struct Options {
        std::size_t capacity = 1024;
        config::OverflowPolicy overflow = config::OverflowPolicy::kBlock;
        std::chrono::milliseconds publish_wait{250};
    };

    TerminalEventBus();
    explicit TerminalEventBus(Options options);

    // Returns false if the new event itself had to be dropped.
    bool Publish(TerminalEvent event);
    bool TryConsume(TerminalEvent& event, std::chrono::milliseconds timeout);
    std::size_t Size() const;

    void Subscribe(std::function<void(const TerminalEvent&)> callback);
    // Delivers events to subscribers until Stop().
    void Dispatch();
    void Stop();

    std::uint64_t DroppedCount() const { return dropped_.load(); }
    const Options& GetOptions() const { return options_; }

private:
    bool DropOldestOutput(const std::string& session_id);

    Options options_;
    std::deque<TerminalEvent> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::vector<std::function<void(const TerminalEvent&)>> subscribers_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace codejoin::bus
