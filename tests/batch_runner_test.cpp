#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/language_profiles.hpp"
#include "fake_runtime.hpp"
#include "input/input_pipeline.hpp"
#include "runner/batch_runner.hpp"
#include "stream/frame_demuxer.hpp"

using codejoin::config::LanguageTable;
using codejoin::runner::AdmissionGate;
using codejoin::runner::BatchRunner;
using codejoin::runner::BatchRunnerOptions;
using codejoin::runner::CancelToken;
using codejoin::runner::ErrorClass;
using codejoin::runner::ExecutionRequest;
using codejoin::stream::Channel;
using codejoin::stream::EncodeFrame;
using codejoin::testing::FakeRuntime;
using codejoin::testing::FakeScript;
using std::chrono::milliseconds;

namespace {

class BatchRunnerTest : public ::testing::Test {
protected:
    BatchRunnerTest()
        : languages_(LanguageTable::Builtin())
        , gate_(4) {}

    BatchRunner Runner(BatchRunnerOptions options = {}) {
        options.remove_grace = milliseconds(0);
        return BatchRunner(runtime_, pipeline_, gate_, options);
    }

    ExecutionRequest Request(const std::string& language, const std::string& code) {
        ExecutionRequest request;
        request.language = language;
        request.code = code;
        return request;
    }

    const codejoin::config::LanguageProfile& Profile(const std::string& id) {
        return *languages_.Find(id);
    }

    LanguageTable languages_;
    FakeRuntime runtime_;
    codejoin::input::InputPipeline pipeline_;
    AdmissionGate gate_;
};

}  // namespace

TEST_F(BatchRunnerTest, hello_world_is_captured_and_sandbox_removed) {
    FakeScript script;
    script.output = {EncodeFrame(Channel::kStdout, "Hello, World!\r\n")};
    runtime_.SetScript(script);

    const auto result = Runner().Run(Profile("python"), Request("python", "print('Hello, World!')"));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_EQ(result.error, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.error_class, ErrorClass::kNone);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.sandbox_id.size(), 32u);

    const auto container = runtime_.Last();
    ASSERT_NE(container, nullptr);
    EXPECT_EQ(container->archive_path, "/sandbox");
    EXPECT_EQ(container->archive.substr(0, 7), "code.py");
    EXPECT_EQ(container->spec.name, "code-exec-" + result.sandbox_id);
    EXPECT_EQ(runtime_.Live(), 0u);
    EXPECT_EQ(gate_.InUse(), 0);
}

TEST_F(BatchRunnerTest, stdin_is_delivered_to_the_program) {
    FakeScript script;
    script.hang = true;
    script.exit_on_eof = true;
    script.respond = [](const std::string& input) {
        return EncodeFrame(Channel::kStdout, "Hi " + input);
    };
    runtime_.SetScript(script);

    auto request = Request("python", "print('Hi', input())");
    request.stdin_data = "Ann";
    const auto result = Runner().Run(Profile("python"), request);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "Hi Ann\n");
    EXPECT_EQ(runtime_.Last()->stdin_data, "Ann\n");
}

TEST_F(BatchRunnerTest, stdout_and_stderr_are_separated) {
    FakeScript script;
    script.output = {EncodeFrame(Channel::kStdout, "partial\n"),
                     EncodeFrame(Channel::kStderr, "Traceback: boom\n")};
    script.exit_code = 1;
    runtime_.SetScript(script);

    const auto result = Runner().Run(Profile("python"), Request("python", "raise SystemExit(1)"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.output, "partial\n");
    EXPECT_EQ(result.error, "Traceback: boom\n");
    EXPECT_EQ(result.error_class, ErrorClass::kNone);
}

TEST_F(BatchRunnerTest, timeout_kills_and_removes_the_sandbox) {
    FakeScript script;
    script.hang = true;
    script.output = {EncodeFrame(Channel::kStdout, "working\n")};
    runtime_.SetScript(script);

    auto request = Request("python", "while True: pass");
    request.timeout = milliseconds(100);
    const auto started = std::chrono::steady_clock::now();
    const auto result = Runner().Run(Profile("python"), request);

    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(2000));
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.error_class, ErrorClass::kTimeout);
    EXPECT_GE(result.execution_time, milliseconds(100));
    EXPECT_LT(result.execution_time, milliseconds(1000));
    EXPECT_EQ(result.output, "working\n");
    EXPECT_NE(result.error.find("Execution timed out"), std::string::npos);
    EXPECT_GE(runtime_.Killed(), 1);
    EXPECT_EQ(runtime_.Live(), 0u);
}

TEST_F(BatchRunnerTest, rejected_code_never_reaches_the_runtime) {
    const auto result = Runner().Run(Profile("shell"), Request("shell", "rm -rf /"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_class, ErrorClass::kValidation);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_EQ(runtime_.Created(), 0);
}

TEST_F(BatchRunnerTest, oversized_stdin_is_rejected) {
    BatchRunnerOptions options;
    options.max_stdin_bytes = 4;
    auto request = Request("python", "print(input())");
    request.stdin_data = "too long";
    const auto result = Runner(options).Run(Profile("python"), request);
    EXPECT_EQ(result.error_class, ErrorClass::kValidation);
    EXPECT_EQ(runtime_.Created(), 0);
}

TEST_F(BatchRunnerTest, empty_code_succeeds_without_a_sandbox) {
    const auto result = Runner().Run(Profile("python"), Request("python", ""));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(runtime_.Created(), 0);
}

TEST_F(BatchRunnerTest, missing_image_is_reported_as_provisioning_failure) {
    runtime_.FailCreate(codejoin::runtime::ErrorKind::kNotFound);
    const auto result = Runner().Run(Profile("python"), Request("python", "print(1)"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_class, ErrorClass::kProvisioning);
    EXPECT_EQ(result.error_message, "Image 'python:3.11-alpine' not found. Please pull the required images.");
    EXPECT_EQ(gate_.InUse(), 0);
}

TEST_F(BatchRunnerTest, failed_start_still_removes_the_container) {
    runtime_.FailStart(codejoin::runtime::ErrorKind::kUnavailable);
    const auto result = Runner().Run(Profile("python"), Request("python", "print(1)"));
    EXPECT_EQ(result.error_class, ErrorClass::kProvisioning);
    EXPECT_EQ(result.error_message, "Container runtime is not running or not accessible");
    EXPECT_EQ(runtime_.Created(), 1);
    EXPECT_EQ(runtime_.Live(), 0u);
}

TEST_F(BatchRunnerTest, exhausted_capacity_is_refused) {
    AdmissionGate full(1);
    auto held = full.TryAcquireFor(milliseconds(0));
    BatchRunnerOptions options;
    options.admission_wait = milliseconds(10);
    BatchRunner runner(runtime_, pipeline_, full, options);
    const auto result = runner.Run(Profile("python"), Request("python", "print(1)"));
    EXPECT_EQ(result.error_class, ErrorClass::kProvisioning);
    EXPECT_EQ(result.error_message, "Sandbox capacity exhausted, try again later");
    EXPECT_EQ(runtime_.Created(), 0);
}

TEST_F(BatchRunnerTest, output_is_truncated_at_the_ceiling) {
    FakeScript script;
    // 4 x "é" (2 bytes each): a 7 byte ceiling must not split a character.
    script.output = {EncodeFrame(Channel::kStdout, "\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9")};
    runtime_.SetScript(script);

    BatchRunnerOptions options;
    options.max_output_bytes = 7;
    const auto result = Runner(options).Run(Profile("python"), Request("python", "print('é' * 4)"));
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.output, "\xc3\xa9\xc3\xa9\xc3\xa9");
}

TEST_F(BatchRunnerTest, oom_kill_is_explained) {
    FakeScript script;
    script.exit_code = 137;
    script.oom_killed = true;
    runtime_.SetScript(script);

    const auto result = Runner().Run(Profile("python"), Request("python", "x = ' ' * 10**10"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 137);
    EXPECT_EQ(result.error_message, "Memory limit exceeded");
}

TEST_F(BatchRunnerTest, cancellation_stops_a_running_program) {
    FakeScript script;
    script.hang = true;
    runtime_.SetScript(script);

    auto request = Request("python", "import time; time.sleep(60)");
    request.cancel = std::make_shared<CancelToken>();
    std::thread canceller([&request, this] {
        FakeRuntime::WaitFor([this] { return runtime_.Created() == 1; });
        std::this_thread::sleep_for(milliseconds(50));
        request.cancel->Cancel();
    });
    const auto result = Runner().Run(Profile("python"), request);
    canceller.join();

    EXPECT_EQ(result.error_class, ErrorClass::kCancelled);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(runtime_.Live(), 0u);
}

TEST_F(BatchRunnerTest, cancelled_before_start_creates_nothing) {
    auto request = Request("python", "print(1)");
    request.cancel = std::make_shared<CancelToken>();
    request.cancel->Cancel();
    const auto result = Runner().Run(Profile("python"), request);
    EXPECT_EQ(result.error_class, ErrorClass::kCancelled);
    EXPECT_EQ(runtime_.Created(), 0);
}

TEST_F(BatchRunnerTest, concurrent_runs_leave_no_containers_behind) {
    FakeScript script;
    script.output = {EncodeFrame(Channel::kStdout, "ok\n")};
    runtime_.SetScript(script);

    const auto runner = Runner();
    std::vector<std::thread> workers;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 12; ++i) {
        workers.emplace_back([&] {
            if (runner.Run(Profile("python"), Request("python", "print('ok')")).success) {
                ++succeeded;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(succeeded.load(), 12);
    EXPECT_EQ(runtime_.Created(), 12);
    EXPECT_EQ(runtime_.Live(), 0u);
    EXPECT_EQ(gate_.InUse(), 0);
}
