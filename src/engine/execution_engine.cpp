#include "engine/execution_engine.hpp"

#include <algorithm>

#include "runtime/docker_runtime.hpp"
#include "utils/logging.hpp"

namespace codejoin::engine {
namespace {

runner::BatchRunnerOptions RunnerOptions(const config::Config& config) {
    runner::BatchRunnerOptions options;
    options.max_code_bytes = config.limits.max_code_bytes;
    options.max_stdin_bytes = config.limits.max_stdin_bytes;
    options.max_output_bytes = config.limits.max_output_bytes;
    options.validation = config.input.validation;
    options.admission_wait = std::chrono::milliseconds(config.limits.admission_wait_ms);
    options.remove_grace = std::chrono::milliseconds(config.runtime.remove_grace_ms);
    return options;
}

bus::TerminalEventBus::Options BusOptions(const config::Config& config) {
    bus::TerminalEventBus::Options options;
    options.capacity = config.terminal.event_capacity;
    options.overflow = config.terminal.overflow;
    options.publish_wait = std::chrono::milliseconds(config.terminal.publish_wait_ms);
    return options;
}

terminal::SessionManagerOptions SessionOptions(const config::Config& config) {
    terminal::SessionManagerOptions options;
    options.idle_timeout = std::chrono::seconds(config.terminal.idle_timeout_s);
    options.sweep_interval = std::chrono::seconds(config.terminal.sweep_interval_s);
    options.max_sessions = static_cast<std::size_t>(std::max(1, config.terminal.max_sessions));
    options.max_input_bytes = config.input.max_input_bytes;
    options.validation = config.input.validation;
    options.admission_wait = std::chrono::milliseconds(config.limits.admission_wait_ms);
    options.remove_grace = std::chrono::milliseconds(config.runtime.remove_grace_ms);
    return options;
}

}  // namespace

config::LanguageTable LoadLanguages(const config::Config& config) {
    if (config.languages_file.empty()) {
        return config::LanguageTable::Builtin();
    }
    auto table = config::LanguageTable::LoadFile(config.languages_file);
    utils::Log(utils::LogLevel::kInfo, "config", "language table loaded",
               {{"file", config.languages_file}, {"profiles", std::to_string(table.Size())}});
    return table;
}

std::shared_ptr<runtime::ContainerRuntime> MakeDockerRuntime(const config::Config& config) {
    runtime::DockerRuntime::Options options;
    options.host = config.runtime.host;
    options.api_version = config.runtime.api_version;
    options.request_timeout = std::chrono::milliseconds(config.runtime.request_timeout_ms);
    return std::make_shared<runtime::DockerRuntime>(options);
}

ExecutionEngine::ExecutionEngine(config::Config config)
    : ExecutionEngine(config, LoadLanguages(config), MakeDockerRuntime(config)) {}

ExecutionEngine::ExecutionEngine(config::Config config,
                                 config::LanguageTable languages,
                                 std::shared_ptr<runtime::ContainerRuntime> runtime)
    : config_(std::move(config))
    , languages_(std::move(languages))
    , runtime_(std::move(runtime))
    , gate_(config_.limits.max_concurrent_sandboxes)
    , runner_(*runtime_, pipeline_, gate_, RunnerOptions(config_))
    , events_(BusOptions(config_))
    , sessions_(*runtime_, pipeline_, gate_, events_, SessionOptions(config_)) {
    sessions_.StartSweeper();
}

ExecutionEngine::~ExecutionEngine() {
    sessions_.StopSweeper();
    sessions_.StopAll("shutdown");
}

runner::ExecutionResult ExecutionEngine::RunBatch(const std::string& language,
                                                  const std::string& code,
                                                  const std::string& stdin_data,
                                                  std::optional<std::chrono::milliseconds> timeout,
                                                  std::shared_ptr<runner::CancelToken> cancel) const {
    const auto* profile = languages_.Find(language);
    if (!profile) {
        runner::ExecutionResult result;
        result.error_class = runner::ErrorClass::kValidation;
        result.error_message = "Unsupported language: " + language;
        result.error = result.error_message;
        return result;
    }
    runner::ExecutionRequest request;
    request.language = language;
    request.code = code;
    request.stdin_data = stdin_data;
    request.timeout = timeout;
    request.cancel = std::move(cancel);
    return runner_.Run(*profile, request);
}

terminal::StartResult ExecutionEngine::StartSession(const std::string& language, const std::string& owner) {
    const auto* profile = languages_.Find(language);
    if (!profile) {
        terminal::StartResult result;
        result.error = "Unsupported language: " + language;
        return result;
    }
    return sessions_.Start(*profile, owner);
}

terminal::SessionError ExecutionEngine::SendInput(const std::string& session_id, std::string_view bytes,
                                                  std::string* reason) {
    return sessions_.SendInput(session_id, bytes, reason);
}

terminal::SessionError ExecutionEngine::Resize(const std::string& session_id, int cols, int rows) {
    return sessions_.Resize(session_id, cols, rows);
}

bool ExecutionEngine::StopSession(const std::string& session_id) {
    return sessions_.Stop(session_id);
}

std::size_t ExecutionEngine::DisconnectOwner(const std::string& owner) {
    return sessions_.DisconnectOwner(owner);
}

void ExecutionEngine::Ping() {
    runtime_->Ping();
}

runtime::RuntimeInfo ExecutionEngine::RuntimeInfo() {
    return runtime_->Info();
}

}  // namespace codejoin::engine
