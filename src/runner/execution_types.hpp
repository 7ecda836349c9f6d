#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "runner/cancel_token.hpp"
#include "stream/stream_transcoder.hpp"

namespace codejoin::runner {

// Exit code reported for a run killed by its wall-clock timeout.
constexpr int kTimeoutExitCode = 124;
constexpr int kNoExitCode = -1;

// Why the platform could not produce an ordinary program result.
enum class ErrorClass {
    kNone,
    kValidation,
    kProvisioning,
    kTimeout,
    kCrash,
    kCancelled
};

inline const char* ToString(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::kNone: return "none";
        case ErrorClass::kValidation: return "validation";
        case ErrorClass::kProvisioning: return "provisioning";
        case ErrorClass::kTimeout: return "timeout";
        case ErrorClass::kCrash: return "crash";
        case ErrorClass::kCancelled: return "cancelled";
    }
    return "unknown";
}

struct ExecutionRequest {
    std::string language;
    std::string code;
    std::string stdin_data;
    // Clamped to the profile maximum; the maximum when absent.
    std::optional<std::chrono::milliseconds> timeout;
    std::shared_ptr<CancelToken> cancel;
};

struct ExecutionResult {
    // Exit code 0 and no platform error.
    bool success = false;
    std::string output;
    std::string error;
    int exit_code = kNoExitCode;
    bool timed_out = false;
    // Output or error was cut at the configured ceiling.
    bool truncated = false;
    std::chrono::milliseconds execution_time{0};
    ErrorClass error_class = ErrorClass::kNone;
    std::string error_message;
    std::string sandbox_id;
    stream::StreamStats stdout_stats;
    stream::StreamStats stderr_stats;
};

}  // namespace codejoin::runner
