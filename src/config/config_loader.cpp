#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codejoin::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-numeric value", {{"value", value}});
        return fallback;
    }
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    try {
        const auto parsed = std::stoll(value);
        return parsed > 0 ? static_cast<std::size_t>(parsed) : fallback;
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-numeric value", {{"value", value}});
        return fallback;
    }
}

OverflowPolicy ParseOverflow(const std::string& value, OverflowPolicy fallback) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "block") {
        return OverflowPolicy::kBlock;
    }
    if (lowered == "dropoldest" || lowered == "drop_oldest" || lowered == "drop-oldest") {
        return OverflowPolicy::kDropOldest;
    }
    utils::Log(utils::LogLevel::kWarn, "config", "unknown overflow policy", {{"value", value}});
    return fallback;
}

void ReadSize(const nlohmann::json& source, const char* key, std::size_t& target) {
    if (source.contains(key) && source[key].is_number_integer() && source[key].get<long long>() > 0) {
        target = source[key].get<std::size_t>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".codejoin" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("runtime") && data["runtime"].is_object()) {
        const auto& runtime = data["runtime"];
        if (runtime.contains("host") && runtime["host"].is_string()) {
            config.runtime.host = runtime["host"].get<std::string>();
        }
        if (runtime.contains("apiVersion") && runtime["apiVersion"].is_string()) {
            config.runtime.api_version = runtime["apiVersion"].get<std::string>();
        }
        ReadInt(runtime, "removeGraceMs", config.runtime.remove_grace_ms);
        ReadInt(runtime, "requestTimeoutMs", config.runtime.request_timeout_ms);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ReadSize(limits, "maxCodeBytes", config.limits.max_code_bytes);
        ReadSize(limits, "maxStdinBytes", config.limits.max_stdin_bytes);
        ReadSize(limits, "maxOutputBytes", config.limits.max_output_bytes);
        ReadInt(limits, "maxConcurrentSandboxes", config.limits.max_concurrent_sandboxes);
        ReadInt(limits, "admissionWaitMs", config.limits.admission_wait_ms);
    }

    if (data.contains("input") && data["input"].is_object()) {
        const auto& input = data["input"];
        if (input.contains("validation") && input["validation"].is_boolean()) {
            config.input.validation = input["validation"].get<bool>();
        }
        ReadSize(input, "maxInputBytes", config.input.max_input_bytes);
    }

    if (data.contains("terminal") && data["terminal"].is_object()) {
        const auto& terminal = data["terminal"];
        ReadInt(terminal, "idleTimeoutS", config.terminal.idle_timeout_s);
        ReadInt(terminal, "sweepIntervalS", config.terminal.sweep_interval_s);
        ReadInt(terminal, "maxSessions", config.terminal.max_sessions);
        ReadSize(terminal, "eventCapacity", config.terminal.event_capacity);
        ReadInt(terminal, "publishWaitMs", config.terminal.publish_wait_ms);
        if (terminal.contains("overflow") && terminal["overflow"].is_string()) {
            config.terminal.overflow = ParseOverflow(terminal["overflow"].get<std::string>(),
                                                     config.terminal.overflow);
        }
    }

    if (data.contains("languagesFile") && data["languagesFile"].is_string()) {
        config.languages_file = data["languagesFile"].get<std::string>();
    }
    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        config.log_level = data["logLevel"].get<std::string>();
    }
}

void ApplyEnvironment(Config& config) {
    const auto host = GetEnvFallback("CODEJOIN_RUNTIME__HOST", "DOCKER_HOST");
    if (!host.empty()) {
        config.runtime.host = host;
    }

    const auto api_version = GetEnv("CODEJOIN_RUNTIME__API_VERSION");
    if (!api_version.empty()) {
        config.runtime.api_version = api_version;
    }

    const auto remove_grace = GetEnv("CODEJOIN_RUNTIME__REMOVE_GRACE_MS");
    if (!remove_grace.empty()) {
        config.runtime.remove_grace_ms = ParseInt(remove_grace, config.runtime.remove_grace_ms);
    }

    const auto request_timeout = GetEnv("CODEJOIN_RUNTIME__REQUEST_TIMEOUT_MS");
    if (!request_timeout.empty()) {
        config.runtime.request_timeout_ms = ParseInt(request_timeout, config.runtime.request_timeout_ms);
    }

    const auto max_code = GetEnv("CODEJOIN_LIMITS__MAX_CODE_BYTES");
    if (!max_code.empty()) {
        config.limits.max_code_bytes = ParseSize(max_code, config.limits.max_code_bytes);
    }

    const auto max_stdin = GetEnv("CODEJOIN_LIMITS__MAX_STDIN_BYTES");
    if (!max_stdin.empty()) {
        config.limits.max_stdin_bytes = ParseSize(max_stdin, config.limits.max_stdin_bytes);
    }

    const auto max_output = GetEnv("CODEJOIN_LIMITS__MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        config.limits.max_output_bytes = ParseSize(max_output, config.limits.max_output_bytes);
    }

    const auto max_sandboxes = GetEnv("CODEJOIN_LIMITS__MAX_CONCURRENT_SANDBOXES");
    if (!max_sandboxes.empty()) {
        config.limits.max_concurrent_sandboxes = ParseInt(
            max_sandboxes,
            config.limits.max_concurrent_sandboxes);
    }

    const auto admission_wait = GetEnv("CODEJOIN_LIMITS__ADMISSION_WAIT_MS");
    if (!admission_wait.empty()) {
        config.limits.admission_wait_ms = ParseInt(admission_wait, config.limits.admission_wait_ms);
    }

    const auto validation = GetEnv("CODEJOIN_INPUT__VALIDATION");
    if (!validation.empty()) {
        config.input.validation = ParseBool(validation);
    }

    const auto idle_timeout = GetEnv("CODEJOIN_TERMINAL__IDLE_TIMEOUT_S");
    if (!idle_timeout.empty()) {
        config.terminal.idle_timeout_s = ParseInt(idle_timeout, config.terminal.idle_timeout_s);
    }

    const auto sweep_interval = GetEnv("CODEJOIN_TERMINAL__SWEEP_INTERVAL_S");
    if (!sweep_interval.empty()) {
        config.terminal.sweep_interval_s = ParseInt(sweep_interval, config.terminal.sweep_interval_s);
    }

    const auto max_sessions = GetEnv("CODEJOIN_TERMINAL__MAX_SESSIONS");
    if (!max_sessions.empty()) {
        config.terminal.max_sessions = ParseInt(max_sessions, config.terminal.max_sessions);
    }

    const auto event_capacity = GetEnv("CODEJOIN_TERMINAL__EVENT_CAPACITY");
    if (!event_capacity.empty()) {
        config.terminal.event_capacity = ParseSize(event_capacity, config.terminal.event_capacity);
    }

    const auto overflow = GetEnv("CODEJOIN_TERMINAL__OVERFLOW");
    if (!overflow.empty()) {
        config.terminal.overflow = ParseOverflow(overflow, config.terminal.overflow);
    }

    const auto languages_file = GetEnv("CODEJOIN_LANGUAGES_FILE");
    if (!languages_file.empty()) {
        config.languages_file = languages_file;
    }

    const auto log_level = GetEnv("CODEJOIN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "keeping defaults, config file is invalid",
                       {{"path", path.string()}, {"error", ex.what()}});
        }
    }

    ApplyEnvironment(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace codejoin::config
