#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "config/config_loader.hpp"

using codejoin::config::Config;
using codejoin::config::LoadConfigFrom;
using codejoin::config::OverflowPolicy;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("codejoin-config-" + std::to_string(::getpid()) + ".json");
        ::unsetenv("DOCKER_HOST");
    }

    void TearDown() override {
        std::error_code ignored;
        std::filesystem::remove(path_, ignored);
        for (const auto* name : {"CODEJOIN_LIMITS__MAX_OUTPUT_BYTES", "CODEJOIN_INPUT__VALIDATION",
                                 "CODEJOIN_TERMINAL__OVERFLOW", "CODEJOIN_RUNTIME__HOST",
                                 "CODEJOIN_TERMINAL__MAX_SESSIONS"}) {
            ::unsetenv(name);
        }
    }

    void WriteFile(const std::string& text) {
        std::ofstream output(path_);
        output << text;
    }

    std::filesystem::path path_;
};

}  // namespace

TEST_F(ConfigLoaderTest, missing_file_keeps_defaults) {
    const auto config = LoadConfigFrom(path_);
    EXPECT_EQ(config.limits.max_output_bytes, 10000u);
    EXPECT_EQ(config.terminal.idle_timeout_s, 15 * 60);
    EXPECT_EQ(config.terminal.overflow, OverflowPolicy::kBlock);
    EXPECT_TRUE(config.input.validation);
}

TEST_F(ConfigLoaderTest, file_values_override_defaults) {
    WriteFile(R"({
        "runtime": {"host": "tcp://127.0.0.1:2375", "removeGraceMs": 1000},
        "limits": {"maxOutputBytes": 2048, "maxConcurrentSandboxes": 4},
        "input": {"validation": false},
        "terminal": {"idleTimeoutS": 60, "overflow": "dropOldest", "eventCapacity": 16},
        "languagesFile": "/etc/codejoin/languages.json",
        "logLevel": "debug"
    })");
    const auto config = LoadConfigFrom(path_);
    EXPECT_EQ(config.runtime.host, "tcp://127.0.0.1:2375");
    EXPECT_EQ(config.runtime.remove_grace_ms, 1000);
    EXPECT_EQ(config.limits.max_output_bytes, 2048u);
    EXPECT_EQ(config.limits.max_concurrent_sandboxes, 4);
    EXPECT_FALSE(config.input.validation);
    EXPECT_EQ(config.terminal.idle_timeout_s, 60);
    EXPECT_EQ(config.terminal.overflow, OverflowPolicy::kDropOldest);
    EXPECT_EQ(config.terminal.event_capacity, 16u);
    EXPECT_EQ(config.languages_file, "/etc/codejoin/languages.json");
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigLoaderTest, invalid_json_keeps_defaults) {
    WriteFile("{ \"limits\": ");
    const auto config = LoadConfigFrom(path_);
    EXPECT_EQ(config.limits.max_output_bytes, 10000u);
}

TEST_F(ConfigLoaderTest, wrong_types_and_non_positive_sizes_are_ignored) {
    WriteFile(R"({"limits": {"maxOutputBytes": -1, "maxCodeBytes": "big"}, "terminal": {"maxSessions": "x"}})");
    const auto config = LoadConfigFrom(path_);
    const Config defaults{};
    EXPECT_EQ(config.limits.max_output_bytes, defaults.limits.max_output_bytes);
    EXPECT_EQ(config.limits.max_code_bytes, defaults.limits.max_code_bytes);
    EXPECT_EQ(config.terminal.max_sessions, defaults.terminal.max_sessions);
}

TEST_F(ConfigLoaderTest, environment_overrides_file) {
    WriteFile(R"({"limits": {"maxOutputBytes": 2048}, "terminal": {"maxSessions": 5}})");
    ::setenv("CODEJOIN_LIMITS__MAX_OUTPUT_BYTES", "4096", 1);
    ::setenv("CODEJOIN_INPUT__VALIDATION", "off", 1);
    ::setenv("CODEJOIN_TERMINAL__OVERFLOW", "drop_oldest", 1);
    ::setenv("CODEJOIN_RUNTIME__HOST", "unix:///tmp/docker.sock", 1);
    ::setenv("CODEJOIN_TERMINAL__MAX_SESSIONS", "many", 1);

    const auto config = LoadConfigFrom(path_);
    EXPECT_EQ(config.limits.max_output_bytes, 4096u);
    EXPECT_FALSE(config.input.validation);
    EXPECT_EQ(config.terminal.overflow, OverflowPolicy::kDropOldest);
    EXPECT_EQ(config.runtime.host, "unix:///tmp/docker.sock");
    // Non-numeric override falls back to the file value.
    EXPECT_EQ(config.terminal.max_sessions, 5);
}
