#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "bus/terminal_event_bus.hpp"
#include "config/language_profiles.hpp"
#include "input/input_pipeline.hpp"
#include "runner/admission_gate.hpp"
#include "runtime/container_runtime.hpp"
#include "stream/stream_transcoder.hpp"

namespace codejoin::terminal {

enum class SessionState {
    kStarting,
    kActive,
    kCrashed,
    kIdleTimeout,
    kStopped,
    kRemoved
};

const char* ToString(SessionState state);

enum class SessionError {
    kNone,
    kNotFound,
    kNotActive,
    kRejected,
    kIoFailure
};

const char* ToString(SessionError error);

enum class PromptState {
    kUnknown,
    kPrimary,
    kSecondary
};

// Follows the tail of a REPL's output to tell whether it is waiting at a prompt.
class PromptTracker {
public:
    PromptTracker() = default;
    explicit PromptTracker(input::HandlerPtr handler);

    PromptState Observe(std::string_view output);
    PromptState State() const { return state_; }

private:
    input::HandlerPtr handler_;
    std::string window_;
    PromptState state_ = PromptState::kUnknown;
};

struct SessionInfo {
    std::string id;
    std::string language;
    std::string owner;
    std::string container_name;
    SessionState state = SessionState::kStarting;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_activity;
    int cols = 80;
    int rows = 24;
    PromptState prompt = PromptState::kUnknown;
    stream::StreamStats input_stats;
    stream::StreamStats output_stats;
};

struct StartResult {
    bool ok = false;
    std::string session_id;
    std::string error;
};

struct SessionManagerOptions {
    std::chrono::milliseconds idle_timeout{15 * 60 * 1000};
    std::chrono::milliseconds sweep_interval{30 * 1000};
    std::size_t max_sessions = 50;
    std::size_t max_input_bytes = 64 * 1024;
    bool validation = true;
    std::chrono::milliseconds admission_wait{2000};
    std::chrono::milliseconds remove_grace{5000};
};

/**
 * Owns every interactive session: one TTY sandbox, one reader thread and
 * separate input/output transcoders per session. Output is forwarded to the
 * event bus chunk by chunk; every way a session ends (stop, idle sweep,
 * crash, disconnect, shutdown) goes through the same teardown, which removes
 * the sandbox and publishes exactly one close event.
 */
class SessionManager {
public:
    SessionManager(runtime::ContainerRuntime& runtime,
                   const input::InputPipeline& pipeline,
                   runner::AdmissionGate& gate,
                   bus::TerminalEventBus& events,
                   SessionManagerOptions options = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    StartResult Start(const config::LanguageProfile& profile, const std::string& owner = "");
    // reason receives the pipeline's message when the input is rejected.
    SessionError SendInput(const std::string& session_id, std::string_view bytes, std::string* reason = nullptr);
    SessionError Resize(const std::string& session_id, int cols, int rows);
    // Idempotent; false when the session is unknown or already gone.
    bool Stop(const std::string& session_id, const std::string& reason = "stopped");
    std::size_t StopAll(const std::string& reason);
    std::size_t DisconnectOwner(const std::string& owner);

    // Stops sessions idle for longer than the configured timeout.
    std::size_t SweepIdle();
    void StartSweeper();
    void StopSweeper();

    std::optional<SessionInfo> Info(const std::string& session_id) const;
    std::vector<SessionInfo> List() const;
    std::size_t Count() const;

    const SessionManagerOptions& Options() const { return options_; }

private:
    struct Session;
    using SessionPtr = std::shared_ptr<Session>;

    SessionPtr Find(const std::string& session_id) const;
    std::vector<SessionPtr> Snapshot() const;
    void ReadLoop(SessionPtr session);
    bool Teardown(const SessionPtr& session, SessionState state, const std::string& reason,
                  std::optional<int> exit_code = std::nullopt);
    void SweepLoop();
    static SessionInfo Describe(Session& session);

    runtime::ContainerRuntime& runtime_;
    const input::InputPipeline& pipeline_;
    runner::AdmissionGate& gate_;
    bus::TerminalEventBus& events_;
    SessionManagerOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;
    std::size_t starting_ = 0;

    std::mutex readers_mutex_;
    std::condition_variable readers_cv_;
    std::size_t readers_ = 0;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::atomic<bool> sweeping_{false};
    std::thread sweeper_;
};

}  // namespace codejoin::terminal
