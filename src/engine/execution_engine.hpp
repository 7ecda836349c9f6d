#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "bus/terminal_event_bus.hpp"
#include "config/config_schema.hpp"
#include "config/language_profiles.hpp"
#include "input/input_pipeline.hpp"
#include "runner/admission_gate.hpp"
#include "runner/batch_runner.hpp"
#include "runner/execution_types.hpp"
#include "runtime/container_runtime.hpp"
#include "terminal/session_manager.hpp"

namespace codejoin::engine {

/**
 * Entry point for the transport layer. Resolves language ids against the
 * profile table and routes one-shot requests to the batch runner and
 * interactive requests to the session manager. Both share one admission gate.
 */
class ExecutionEngine {
public:
    // Talks to the container runtime named in config.runtime.
    explicit ExecutionEngine(config::Config config);
    ExecutionEngine(config::Config config,
                    config::LanguageTable languages,
                    std::shared_ptr<runtime::ContainerRuntime> runtime);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    runner::ExecutionResult RunBatch(const std::string& language,
                                     const std::string& code,
                                     const std::string& stdin_data = {},
                                     std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                     std::shared_ptr<runner::CancelToken> cancel = nullptr) const;

    terminal::StartResult StartSession(const std::string& language, const std::string& owner = "");
    terminal::SessionError SendInput(const std::string& session_id, std::string_view bytes,
                                     std::string* reason = nullptr);
    terminal::SessionError Resize(const std::string& session_id, int cols, int rows);
    bool StopSession(const std::string& session_id);
    std::size_t DisconnectOwner(const std::string& owner);

    bus::TerminalEventBus& Events() { return events_; }
    terminal::SessionManager& Sessions() { return sessions_; }
    input::InputPipeline& Pipeline() { return pipeline_; }

    // Throws runtime::RuntimeError when the runtime is unreachable.
    void Ping();
    runtime::RuntimeInfo RuntimeInfo();

    const config::LanguageTable& Languages() const { return languages_; }
    const config::Config& GetConfig() const { return config_; }

private:
    config::Config config_;
    config::LanguageTable languages_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    input::InputPipeline pipeline_;
    runner::AdmissionGate gate_;
    runner::BatchRunner runner_;
    bus::TerminalEventBus events_;
    // Declared last: its teardown publishes to events_.
    terminal::SessionManager sessions_;
};

// Built-in profiles overlaid with config.languages_file when set.
// Throws std::runtime_error if that file cannot be used.
config::LanguageTable LoadLanguages(const config::Config& config);

std::shared_ptr<runtime::ContainerRuntime> MakeDockerRuntime(const config::Config& config);

}  // namespace codejoin::engine
