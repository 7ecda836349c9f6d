#pragma once

#include <cstddef>
#include <string>

namespace codejoin::config {

constexpr const char* kDefaultRuntimeHost = "unix:///var/run/docker.sock";

struct RuntimeConfig {
    std::string host = kDefaultRuntimeHost;
    std::string api_version = "v1.41";
    int remove_grace_ms = 5000;
    // Socket timeout for control-plane requests (create, start, inspect...).
    int request_timeout_ms = 30000;
};

struct LimitsConfig {
    std::size_t max_code_bytes = 1024 * 1024;
    std::size_t max_stdin_bytes = 1024 * 1024;
    std::size_t max_output_bytes = 10000;
    int max_concurrent_sandboxes = 32;
    int admission_wait_ms = 2000;
};

struct InputConfig {
    bool validation = true;
    std::size_t max_input_bytes = 64 * 1024;
};

enum class OverflowPolicy {
    kBlock,
    kDropOldest
};

struct TerminalConfig {
    int idle_timeout_s = 15 * 60;
    int sweep_interval_s = 30;
    int max_sessions = 50;
    std::size_t event_capacity = 1024;
    OverflowPolicy overflow = OverflowPolicy::kBlock;
    // How long a blocked publisher waits before the oldest event is dropped.
    int publish_wait_ms = 250;
};

struct Config {
    RuntimeConfig runtime;
    LimitsConfig limits;
    InputConfig input;
    TerminalConfig terminal;
    std::string languages_file;
    std::string log_level = "info";
};

}  // namespace codejoin::config
