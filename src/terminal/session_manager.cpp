#include "terminal/session_manager.hpp"

#include <regex>

#include "input/dangerous_patterns.hpp"
#include "runtime/sandbox_id.hpp"
#include "runtime/sandbox_lease.hpp"
#include "runtime/sandbox_spec.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codejoin::terminal {
namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr std::size_t kPromptWindow = 256;
constexpr int kDefaultCols = 80;
constexpr int kDefaultRows = 24;

stream::TranscodeOptions OutputTranscodeOptions() {
    stream::TranscodeOptions options;
    options.line_endings = stream::LineEndings::kPreserve;
    return options;
}

stream::TranscodeOptions InputTranscodeOptions() {
    stream::TranscodeOptions options;
    options.line_endings = stream::LineEndings::kPreserve;
    options.hold_trailing_escape = false;
    return options;
}

class StartingSlot {
public:
    StartingSlot(std::mutex& mutex, std::size_t& starting)
        : mutex_(mutex), starting_(starting) {}
    ~StartingSlot() {
        std::lock_guard<std::mutex> lock(mutex_);
        --starting_;
    }

private:
    std::mutex& mutex_;
    std::size_t& starting_;
};

}  // namespace

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::kStarting: return "starting";
        case SessionState::kActive: return "active";
        case SessionState::kCrashed: return "crashed";
        case SessionState::kIdleTimeout: return "idle-timeout";
        case SessionState::kStopped: return "stopped";
        case SessionState::kRemoved: return "removed";
    }
    return "unknown";
}

const char* ToString(SessionError error) {
    switch (error) {
        case SessionError::kNone: return "none";
        case SessionError::kNotFound: return "not-found";
        case SessionError::kNotActive: return "not-active";
        case SessionError::kRejected: return "rejected";
        case SessionError::kIoFailure: return "io-failure";
    }
    return "unknown";
}

PromptTracker::PromptTracker(input::HandlerPtr handler)
    : handler_(std::move(handler)) {}

PromptState PromptTracker::Observe(std::string_view output) {
    const auto text = input::PrintableText(output);
    if (text.empty()) {
        return state_;
    }
    window_ += text;
    if (window_.size() > kPromptWindow) {
        window_.erase(0, window_.size() - kPromptWindow);
    }
    if (!handler_) {
        return state_;
    }
    if (handler_->primary_prompt && std::regex_search(window_, *handler_->primary_prompt)) {
        state_ = PromptState::kPrimary;
    } else if (handler_->secondary_prompt && std::regex_search(window_, *handler_->secondary_prompt)) {
        state_ = PromptState::kSecondary;
    } else {
        state_ = PromptState::kUnknown;
    }
    return state_;
}

struct SessionManager::Session {
    std::string id;
    std::string language;
    std::string handler_name;
    std::string owner;
    std::string container_id;
    std::string container_name;
    std::chrono::steady_clock::time_point created_at;
    runner::AdmissionGate::Ticket ticket;
    std::unique_ptr<runtime::SandboxLease> lease;
    // Declared after the lease so the connection closes before removal.
    std::unique_ptr<runtime::AttachedStream> stream;
    std::atomic<bool> closing{false};

    // Guards the fields below.
    std::mutex mutex;
    SessionState state = SessionState::kStarting;
    std::chrono::steady_clock::time_point last_activity;
    int cols = kDefaultCols;
    int rows = kDefaultRows;
    stream::StreamTranscoder output{OutputTranscodeOptions()};
    PromptTracker prompt;
    stream::StreamStats input_stats;

    // Serializes writes so keystrokes reach the terminal in order.
    std::mutex input_mutex;
    stream::StreamTranscoder input{InputTranscodeOptions()};
};

SessionManager::SessionManager(runtime::ContainerRuntime& runtime,
                               const input::InputPipeline& pipeline,
                               runner::AdmissionGate& gate,
                               bus::TerminalEventBus& events,
                               SessionManagerOptions options)
    : runtime_(runtime)
    , pipeline_(pipeline)
    , gate_(gate)
    , events_(events)
    , options_(std::move(options)) {}

SessionManager::~SessionManager() {
    StopSweeper();
    StopAll("shutdown");
    std::unique_lock<std::mutex> lock(readers_mutex_);
    readers_cv_.wait(lock, [this] { return readers_ == 0; });
}

StartResult SessionManager::Start(const config::LanguageProfile& profile, const std::string& owner) {
    StartResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.size() + starting_ >= options_.max_sessions) {
            result.error = "Maximum number of terminal sessions reached";
            utils::Log(utils::LogLevel::kWarn, "terminal", "session limit reached",
                       {{"language", profile.id}, {"limit", std::to_string(options_.max_sessions)}});
            return result;
        }
        ++starting_;
    }
    StartingSlot slot(mutex_, starting_);

    auto ticket = gate_.TryAcquireFor(options_.admission_wait);
    if (!ticket.Valid()) {
        result.error = "Sandbox capacity exhausted, try again later";
        utils::Log(utils::LogLevel::kWarn, "terminal", "admission refused", {{"language", profile.id}});
        return result;
    }

    auto session = std::make_shared<Session>();
    session->language = profile.id;
    session->handler_name = profile.HandlerName();
    session->owner = owner;
    session->ticket = std::move(ticket);
    session->prompt = PromptTracker(pipeline_.Handlers().Find(session->handler_name));
    try {
        session->id = runtime::NewSandboxId();
        const auto spec = runtime::BuildInteractiveSpec(profile, session->id);
        session->container_name = spec.name;
        session->container_id = runtime_.Create(spec);
        session->lease = std::make_unique<runtime::SandboxLease>(
            runtime_, session->container_id, spec.name, options_.remove_grace);
        session->stream = runtime_.Attach(session->container_id);
        runtime_.Start(session->container_id);
    } catch (const runtime::RuntimeError& ex) {
        result.error = runtime::DescribeForUser(ex, profile.image);
        utils::Log(utils::LogLevel::kError, "terminal", "session provisioning failed",
                   {{"language", profile.id}, {"kind", runtime::ToString(ex.Kind())}, {"error", ex.what()}});
        return result;
    } catch (const std::exception& ex) {
        result.error = std::string("Failed to create sandbox: ") + ex.what();
        utils::Log(utils::LogLevel::kError, "terminal", "session provisioning failed",
                   {{"language", profile.id}, {"error", ex.what()}});
        return result;
    }

    try {
        runtime_.Resize(session->container_id, kDefaultCols, kDefaultRows);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kDebug, "terminal", "initial resize failed",
                   {{"session", session->id}, {"error", ex.what()}});
    }

    session->created_at = utils::Now();
    session->last_activity = session->created_at;
    session->state = SessionState::kActive;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.emplace(session->id, session);
    }
    {
        std::lock_guard<std::mutex> lock(readers_mutex_);
        ++readers_;
    }
    std::thread([this, session] {
        ReadLoop(session);
        std::unique_lock<std::mutex> lock(readers_mutex_);
        --readers_;
        std::notify_all_at_thread_exit(readers_cv_, std::move(lock));
    }).detach();

    utils::Log(utils::LogLevel::kInfo, "terminal", "session started",
               {{"session", session->id}, {"language", profile.id}, {"name", session->container_name}});
    result.ok = true;
    result.session_id = session->id;
    return result;
}

SessionError SessionManager::SendInput(const std::string& session_id, std::string_view bytes, std::string* reason) {
    auto session = Find(session_id);
    if (!session) {
        return SessionError::kNotFound;
    }
    if (session->closing.load()) {
        return SessionError::kNotActive;
    }

    input::InputOptions options;
    options.mode = input::InputMode::kTerminal;
    options.enable_validation = options_.validation;
    options.max_bytes = options_.max_input_bytes;
    options.session_id = session_id;

    std::lock_guard<std::mutex> input_lock(session->input_mutex);
    const auto processed = pipeline_.Process(bytes, session->handler_name, options, &session->input);
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->input_stats = session->input.Stats();
        if (processed.accepted) {
            session->last_activity = utils::Now();
        }
    }
    if (!processed.accepted) {
        if (reason) {
            *reason = processed.reason;
        }
        return SessionError::kRejected;
    }
    if (processed.normalized.empty()) {
        return SessionError::kNone;
    }
    try {
        session->stream->Write(processed.normalized);
    } catch (const runtime::RuntimeError& ex) {
        if (reason) {
            *reason = ex.what();
        }
        utils::Log(utils::LogLevel::kWarn, "terminal", "input write failed",
                   {{"session", session_id}, {"error", ex.what()}});
        return session->closing.load() ? SessionError::kNotActive : SessionError::kIoFailure;
    }
    return SessionError::kNone;
}

SessionError SessionManager::Resize(const std::string& session_id, int cols, int rows) {
    if (cols <= 0 || rows <= 0) {
        return SessionError::kRejected;
    }
    auto session = Find(session_id);
    if (!session) {
        return SessionError::kNotFound;
    }
    if (session->closing.load()) {
        return SessionError::kNotActive;
    }
    try {
        runtime_.Resize(session->container_id, cols, rows);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kWarn, "terminal", "resize failed",
                   {{"session", session_id}, {"error", ex.what()}});
        return SessionError::kIoFailure;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    session->cols = cols;
    session->rows = rows;
    session->last_activity = utils::Now();
    return SessionError::kNone;
}

bool SessionManager::Stop(const std::string& session_id, const std::string& reason) {
    auto session = Find(session_id);
    if (!session) {
        return false;
    }
    return Teardown(session, SessionState::kStopped, reason);
}

std::size_t SessionManager::StopAll(const std::string& reason) {
    std::size_t stopped = 0;
    for (const auto& session : Snapshot()) {
        if (Teardown(session, SessionState::kStopped, reason)) {
            ++stopped;
        }
    }
    return stopped;
}

std::size_t SessionManager::DisconnectOwner(const std::string& owner) {
    std::size_t stopped = 0;
    for (const auto& session : Snapshot()) {
        if (session->owner == owner && Teardown(session, SessionState::kStopped, "disconnect")) {
            ++stopped;
        }
    }
    return stopped;
}

std::size_t SessionManager::SweepIdle() {
    const auto now = utils::Now();
    std::size_t stopped = 0;
    for (const auto& session : Snapshot()) {
        std::chrono::steady_clock::time_point last_activity;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            last_activity = session->last_activity;
        }
        if (now - last_activity < options_.idle_timeout) {
            continue;
        }
        if (Teardown(session, SessionState::kIdleTimeout, "idle-timeout")) {
            ++stopped;
        }
    }
    if (stopped > 0) {
        utils::Log(utils::LogLevel::kInfo, "terminal", "idle sessions reclaimed", {{"count", std::to_string(stopped)}});
    }
    return stopped;
}

void SessionManager::StartSweeper() {
    if (sweeping_.exchange(true)) {
        return;
    }
    sweeper_ = std::thread([this]() { SweepLoop(); });
}

void SessionManager::StopSweeper() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        if (!sweeping_.exchange(false)) {
            return;
        }
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void SessionManager::SweepLoop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (sweeping_) {
        if (sweep_cv_.wait_for(lock, options_.sweep_interval, [this] { return !sweeping_.load(); })) {
            break;
        }
        lock.unlock();
        SweepIdle();
        lock.lock();
    }
}

std::optional<SessionInfo> SessionManager::Info(const std::string& session_id) const {
    auto session = Find(session_id);
    if (!session) {
        return std::nullopt;
    }
    return Describe(*session);
}

std::vector<SessionInfo> SessionManager::List() const {
    std::vector<SessionInfo> infos;
    for (const auto& session : Snapshot()) {
        infos.push_back(Describe(*session));
    }
    return infos;
}

std::size_t SessionManager::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

SessionManager::SessionPtr SessionManager::Find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<SessionManager::SessionPtr> SessionManager::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionPtr> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}

SessionInfo SessionManager::Describe(Session& session) {
    SessionInfo info;
    info.id = session.id;
    info.language = session.language;
    info.owner = session.owner;
    info.container_name = session.container_name;
    info.created_at = session.created_at;
    std::lock_guard<std::mutex> lock(session.mutex);
    info.state = session.state;
    info.last_activity = session.last_activity;
    info.cols = session.cols;
    info.rows = session.rows;
    info.prompt = session.prompt.State();
    info.input_stats = session.input_stats;
    info.output_stats = session.output.Stats();
    return info;
}

void SessionManager::ReadLoop(SessionPtr session) {
    std::string buffer(kReadChunk, '\0');
    try {
        while (true) {
            const auto count = session->stream->Read(buffer.data(), buffer.size());
            if (count == 0) {
                break;
            }
            std::string emitted;
            {
                std::lock_guard<std::mutex> lock(session->mutex);
                emitted = session->output.Feed(std::string_view(buffer.data(), count));
                session->prompt.Observe(emitted);
                session->last_activity = utils::Now();
            }
            if (!emitted.empty()) {
                bus::TerminalEvent event;
                event.session_id = session->id;
                event.data = std::move(emitted);
                events_.Publish(std::move(event));
            }
        }
    } catch (const runtime::RuntimeError& ex) {
        if (!session->closing.load()) {
            utils::Log(utils::LogLevel::kWarn, "terminal", "output stream broke",
                       {{"session", session->id}, {"error", ex.what()}});
        }
    }

    std::string rest;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        rest = session->output.Flush();
    }
    if (session->closing.load()) {
        return;
    }
    if (!rest.empty()) {
        bus::TerminalEvent event;
        event.session_id = session->id;
        event.data = std::move(rest);
        events_.Publish(std::move(event));
    }

    std::optional<int> exit_code;
    try {
        const auto state = runtime_.Inspect(session->container_id);
        if (!state.running) {
            exit_code = state.exit_code;
        }
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kDebug, "terminal", "inspect after exit failed",
                   {{"session", session->id}, {"error", ex.what()}});
    }
    utils::Log(utils::LogLevel::kWarn, "terminal", "session process exited",
               {{"session", session->id}, {"exit", exit_code ? std::to_string(*exit_code) : "unknown"}});
    Teardown(session, SessionState::kCrashed, "crashed", exit_code);
}

bool SessionManager::Teardown(const SessionPtr& session, SessionState state, const std::string& reason,
                              std::optional<int> exit_code) {
    if (session->closing.exchange(true)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->state = state;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session->id);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
    }
    session->stream->Close();
    session->lease->Release();
    session->ticket.Reset();
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->state = SessionState::kRemoved;
    }

    bus::TerminalEvent event;
    event.kind = bus::EventKind::kClosed;
    event.session_id = session->id;
    event.reason = reason;
    event.exit_code = exit_code;
    events_.Publish(std::move(event));

    utils::Log(utils::LogLevel::kInfo, "terminal", "session closed",
               {{"session", session->id},
                {"reason", reason},
                {"state", ToString(state)},
                {"lived_ms", std::to_string(utils::ElapsedMs(session->created_at))}});
    return true;
}

}  // namespace codejoin::terminal
