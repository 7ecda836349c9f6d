#include "runner/batch_runner.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "runtime/sandbox_id.hpp"
#include "runtime/sandbox_lease.hpp"
#include "runtime/sandbox_spec.hpp"
#include "runtime/tar_archive.hpp"
#include "stream/frame_demuxer.hpp"
#include "stream/utf8.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codejoin::runner {
namespace {

constexpr std::size_t kReadChunk = 8192;
// Captured beyond the ceiling so that truncation can pick a character boundary.
constexpr std::size_t kCaptureSlack = 4;
constexpr int kOomExitCode = 137;

ExecutionResult Failure(ErrorClass error_class, const std::string& message) {
    ExecutionResult result;
    result.error_class = error_class;
    result.error_message = message;
    result.error = message;
    return result;
}

// Kills the sandbox once the deadline passes unless Disarm() comes first.
class Watchdog {
public:
    Watchdog(std::chrono::milliseconds timeout, std::function<void()> on_expire)
        : on_expire_(std::move(on_expire)) {
        const auto deadline = utils::Now() + timeout;
        worker_ = std::thread([this, deadline] {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, deadline, [this] { return disarmed_; })) {
                return;
            }
            expired_ = true;
            lock.unlock();
            on_expire_();
        });
    }

    ~Watchdog() {
        Disarm();
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void Disarm() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            disarmed_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    bool Expired() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return expired_;
    }

private:
    std::function<void()> on_expire_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool disarmed_ = false;
    bool expired_ = false;
    std::thread worker_;
};

class ThreadJoiner {
public:
    explicit ThreadJoiner(std::thread& thread) : thread_(thread) {}
    ~ThreadJoiner() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::thread& thread_;
};

// Unregisters the cancel callback before the frame it captures goes away.
class CancelRegistration {
public:
    CancelRegistration(std::shared_ptr<CancelToken> token, std::function<void()> callback)
        : token_(std::move(token)) {
        if (token_) {
            id_ = token_->OnCancel(std::move(callback));
        }
    }

    ~CancelRegistration() {
        if (token_ && id_ != 0) {
            token_->RemoveCallback(id_);
        }
    }

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

private:
    std::shared_ptr<CancelToken> token_;
    std::size_t id_ = 0;
};

struct Capture {
    std::string data;
    bool overflow = false;

    void Append(const std::string& chunk, std::size_t limit) {
        if (chunk.empty() || overflow) {
            return;
        }
        const auto room = limit > data.size() ? limit - data.size() : 0;
        if (chunk.size() <= room) {
            data += chunk;
            return;
        }
        data.append(chunk, 0, stream::Utf8BoundaryAtOrBefore(chunk, room));
        overflow = true;
    }
};

std::string Finalize(const Capture& capture, std::size_t max_bytes, bool& truncated) {
    bool cut = false;
    auto text = stream::TruncateUtf8(stream::StripUnsafeControls(capture.data), max_bytes, &cut);
    truncated = truncated || cut || capture.overflow;
    return text;
}

}  // namespace

BatchRunner::BatchRunner(runtime::ContainerRuntime& runtime,
                         const input::InputPipeline& pipeline,
                         AdmissionGate& gate,
                         BatchRunnerOptions options)
    : runtime_(runtime)
    , pipeline_(pipeline)
    , gate_(gate)
    , options_(std::move(options)) {}

ExecutionResult BatchRunner::Run(const config::LanguageProfile& profile, const ExecutionRequest& request) const {
    input::InputOptions code_options;
    code_options.mode = input::InputMode::kSource;
    code_options.enable_validation = options_.validation;
    code_options.max_bytes = options_.max_code_bytes;
    const auto code = pipeline_.Process(request.code, profile.HandlerName(), code_options);
    if (!code.accepted) {
        utils::Log(utils::LogLevel::kInfo, "runner", "code rejected",
                   {{"language", profile.id}, {"reason", code.reason}});
        return Failure(ErrorClass::kValidation, code.reason);
    }

    std::string stdin_data;
    if (!request.stdin_data.empty()) {
        input::InputOptions stdin_options;
        stdin_options.mode = input::InputMode::kStdin;
        stdin_options.enable_validation = options_.validation;
        stdin_options.max_bytes = options_.max_stdin_bytes;
        const auto normalized = pipeline_.Process(request.stdin_data, profile.HandlerName(), stdin_options);
        if (!normalized.accepted) {
            return Failure(ErrorClass::kValidation, normalized.reason);
        }
        stdin_data = normalized.normalized;
    }

    if (code.normalized.empty()) {
        ExecutionResult result;
        result.success = true;
        result.exit_code = 0;
        return result;
    }
    if (request.cancel && request.cancel->IsCancelled()) {
        return Failure(ErrorClass::kCancelled, "Execution cancelled");
    }

    try {
        return Execute(profile, request, code.normalized, stdin_data);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "runner", "execution failed",
                   {{"language", profile.id}, {"error", ex.what()}});
        return Failure(ErrorClass::kProvisioning, std::string("Failed to create sandbox: ") + ex.what());
    }
}

ExecutionResult BatchRunner::Execute(const config::LanguageProfile& profile,
                                     const ExecutionRequest& request,
                                     const std::string& code,
                                     const std::string& stdin_data) const {
    auto ticket = gate_.TryAcquireFor(options_.admission_wait);
    if (!ticket.Valid()) {
        utils::Log(utils::LogLevel::kWarn, "runner", "admission refused",
                   {{"language", profile.id}, {"in_use", std::to_string(gate_.InUse())}});
        return Failure(ErrorClass::kProvisioning, "Sandbox capacity exhausted, try again later");
    }

    const auto sandbox_id = runtime::NewSandboxId();
    const auto spec = runtime::BuildBatchSpec(profile, sandbox_id);
    const auto timeout = config::ClampTimeout(profile, request.timeout);

    std::unique_ptr<runtime::SandboxLease> lease;
    std::unique_ptr<runtime::AttachedStream> attached;
    try {
        const auto container_id = runtime_.Create(spec);
        lease = std::make_unique<runtime::SandboxLease>(runtime_, container_id, spec.name, options_.remove_grace);

        runtime::TarArchive archive;
        archive.AddFile(profile.SourceFileName(), code);
        runtime_.PutArchive(container_id, config::kSourceDir, archive.Finish());
        attached = runtime_.Attach(container_id);
        runtime_.Start(container_id);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kError, "runner", "sandbox provisioning failed",
                   {{"name", spec.name}, {"kind", runtime::ToString(ex.Kind())}, {"error", ex.what()}});
        auto result = Failure(ErrorClass::kProvisioning, runtime::DescribeForUser(ex, profile.image));
        result.sandbox_id = sandbox_id;
        return result;
    }

    const auto& container_id = lease->ContainerId();
    auto* stream_ptr = attached.get();
    const auto started = utils::Now();
    utils::Log(utils::LogLevel::kDebug, "runner", "sandbox started",
               {{"name", spec.name}, {"timeout_ms", std::to_string(timeout.count())}});

    auto kill_sandbox = [this, &container_id, stream_ptr, &spec](const char* why) {
        try {
            runtime_.Kill(container_id);
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "runner", "kill failed",
                       {{"name", spec.name}, {"reason", why}, {"error", ex.what()}});
        }
        stream_ptr->Close();
    };

    std::atomic<bool> cancelled{false};
    Watchdog watchdog(timeout, [&kill_sandbox] { kill_sandbox("timeout"); });
    CancelRegistration cancel_registration(request.cancel, [&cancelled, &kill_sandbox] {
        cancelled = true;
        kill_sandbox("cancel");
    });

    std::thread writer([stream_ptr, &stdin_data, &spec] {
        try {
            if (!stdin_data.empty()) {
                stream_ptr->Write(stdin_data);
            }
            stream_ptr->CloseWrite();
        } catch (const std::exception& ex) {
            // Programs that never read stdin may exit before the write completes.
            utils::Log(utils::LogLevel::kWarn, "runner", "stdin write failed",
                       {{"name", spec.name}, {"error", ex.what()}});
        }
    });
    ThreadJoiner writer_joiner(writer);

    stream::TranscodeOptions transcode_options;
    transcode_options.line_endings = stream::LineEndings::kCrlfToLf;
    stream::StreamTranscoder stdout_transcoder(transcode_options);
    stream::StreamTranscoder stderr_transcoder(transcode_options);
    stream::FrameDemuxer demuxer;
    Capture out;
    Capture err;
    const auto capture_limit = options_.max_output_bytes + kCaptureSlack;

    std::string buffer(kReadChunk, '\0');
    try {
        while (true) {
            const auto count = stream_ptr->Read(buffer.data(), buffer.size());
            if (count == 0) {
                break;
            }
            for (const auto& frame : demuxer.Feed(std::string_view(buffer.data(), count))) {
                if (frame.channel == stream::Channel::kStderr || frame.channel == stream::Channel::kSystem) {
                    err.Append(stderr_transcoder.Feed(frame.payload), capture_limit);
                } else {
                    out.Append(stdout_transcoder.Feed(frame.payload), capture_limit);
                }
            }
        }
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kWarn, "runner", "output stream broke",
                   {{"name", spec.name}, {"error", ex.what()}});
    }
    out.Append(stdout_transcoder.Flush(), capture_limit);
    err.Append(stderr_transcoder.Flush(), capture_limit);
    if (demuxer.HasPartialFrame()) {
        utils::Log(utils::LogLevel::kDebug, "runner", "output ended inside a frame",
                   {{"name", spec.name}, {"pending", std::to_string(demuxer.PendingBytes())}});
    }

    ExecutionResult result;
    result.sandbox_id = sandbox_id;
    try {
        result.exit_code = runtime_.Wait(container_id);
    } catch (const runtime::RuntimeError& ex) {
        result.error_class = ErrorClass::kCrash;
        result.error_message = std::string("Sandbox exited unexpectedly: ") + ex.what();
    }
    watchdog.Disarm();
    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(utils::Now() - started);

    if (watchdog.Expired()) {
        result.timed_out = true;
        result.exit_code = kTimeoutExitCode;
        result.error_class = ErrorClass::kTimeout;
        result.error_message = "Execution timed out";
    } else if (cancelled.load()) {
        result.error_class = ErrorClass::kCancelled;
        result.error_message = "Execution cancelled";
    } else if (result.exit_code == kOomExitCode) {
        try {
            if (runtime_.Inspect(container_id).oom_killed) {
                result.error_message = "Memory limit exceeded";
            }
        } catch (const runtime::RuntimeError& ex) {
            utils::Log(utils::LogLevel::kDebug, "runner", "inspect failed",
                       {{"name", spec.name}, {"error", ex.what()}});
        }
    }

    result.output = Finalize(out, options_.max_output_bytes, result.truncated);
    result.error = Finalize(err, options_.max_output_bytes, result.truncated);
    if (result.timed_out) {
        if (!result.error.empty() && result.error.back() != '\n') {
            result.error += '\n';
        }
        result.error += result.error_message;
    }
    result.stdout_stats = stdout_transcoder.Stats();
    result.stderr_stats = stderr_transcoder.Stats();
    result.success = result.exit_code == 0 && result.error_class == ErrorClass::kNone;

    const auto anomalies = result.stdout_stats.decode_errors + result.stderr_stats.decode_errors;
    if (anomalies > 0) {
        utils::Log(utils::LogLevel::kDebug, "stream", "decode anomalies in output",
                   {{"name", spec.name}, {"count", std::to_string(anomalies)}});
    }
    utils::Log(utils::LogLevel::kInfo, "runner", "execution finished",
               {{"language", profile.id},
                {"name", spec.name},
                {"exit", std::to_string(result.exit_code)},
                {"ms", std::to_string(result.execution_time.count())},
                {"class", ToString(result.error_class)}});
    return result;
}

}  // namespace codejoin::runner
