#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace codejoin::runner {

/**
 * External cancellation signal for one batch run. Callbacks run once, on the
 * thread that calls Cancel(). RemoveCallback() waits for a callback that is
 * currently running, so a callback may safely reference its registrant's
 * stack frame.
 */
class CancelToken {
public:
    void Cancel();
    bool IsCancelled() const;

    // Runs callback immediately when already cancelled.
    std::size_t OnCancel(std::function<void()> callback);
    void RemoveCallback(std::size_t id);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    bool dispatching_ = false;
    std::thread::id dispatcher_;
    std::size_t next_id_ = 1;
    std::map<std::size_t, std::function<void()>> callbacks_;
};

}  // namespace codejoin::runner
