#pragma once

#include <chrono>
#include <cstddef>

#include "config/language_profiles.hpp"
#include "input/input_pipeline.hpp"
#include "runner/admission_gate.hpp"
#include "runner/execution_types.hpp"
#include "runtime/container_runtime.hpp"

namespace codejoin::runner {

struct BatchRunnerOptions {
    std::size_t max_code_bytes = 1024 * 1024;
    std::size_t max_stdin_bytes = 1024 * 1024;
    std::size_t max_output_bytes = 10000;
    bool validation = true;
    std::chrono::milliseconds admission_wait{2000};
    std::chrono::milliseconds remove_grace{5000};
};

/**
 * One-shot execution: validate, provision a hardened single-use sandbox,
 * inject the source, run with a wall-clock limit, demultiplex output and
 * remove the sandbox on every path. Run() is safe to call concurrently and
 * never throws; every failure is reported in the result.
 */
class BatchRunner {
public:
    BatchRunner(runtime::ContainerRuntime& runtime,
                const input::InputPipeline& pipeline,
                AdmissionGate& gate,
                BatchRunnerOptions options = {});

    ExecutionResult Run(const config::LanguageProfile& profile, const ExecutionRequest& request) const;

    const BatchRunnerOptions& Options() const { return options_; }

private:
    ExecutionResult Execute(const config::LanguageProfile& profile,
                            const ExecutionRequest& request,
                            const std::string& code,
                            const std::string& stdin_data) const;

    runtime::ContainerRuntime& runtime_;
    const input::InputPipeline& pipeline_;
    AdmissionGate& gate_;
    BatchRunnerOptions options_;
};

}  // namespace codejoin::runner
