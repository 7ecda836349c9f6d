#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "runtime/container_runtime.hpp"

namespace codejoin::testing {

// Behavior of the next containers the fake creates.
struct FakeScript {
    // Chunks handed to the attached reader once the container starts.
    std::vector<std::string> output;
    int exit_code = 0;
    // Keep running until killed or removed instead of exiting after the output.
    bool hang = false;
    // With hang: exit once stdin is closed, like a program reading to EOF.
    bool exit_on_eof = false;
    bool oom_killed = false;
    // Called for every stdin write; the return value is appended to the output.
    std::function<std::string(const std::string&)> respond;
};

struct FakeContainer {
    std::string id;
    runtime::SandboxSpec spec;
    FakeScript script;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> pending;
    bool started = false;
    bool exited = false;
    bool stream_closed = false;
    bool stdin_closed = false;
    bool removed = false;
    bool killed = false;
    int exit_code = 0;
    std::string archive_path;
    std::string archive;
    std::string stdin_data;
    std::vector<std::pair<int, int>> resizes;
};

class FakeStream : public runtime::AttachedStream {
public:
    explicit FakeStream(std::shared_ptr<FakeContainer> container)
        : container_(std::move(container)) {}

    std::size_t Read(char* buffer, std::size_t size) override {
        std::unique_lock<std::mutex> lock(container_->mutex);
        container_->cv.wait(lock, [this] {
            return !container_->pending.empty() || container_->stream_closed ||
                   (container_->started && container_->exited);
        });
        if (container_->stream_closed || container_->pending.empty()) {
            return 0;
        }
        auto& chunk = container_->pending.front();
        const auto count = std::min(size, chunk.size());
        std::memcpy(buffer, chunk.data(), count);
        chunk.erase(0, count);
        if (chunk.empty()) {
            container_->pending.pop_front();
        }
        return count;
    }

    void Write(std::string_view data) override {
        std::lock_guard<std::mutex> lock(container_->mutex);
        if (container_->stream_closed || container_->stdin_closed || container_->exited) {
            throw runtime::RuntimeError(runtime::ErrorKind::kUnavailable, "attach stream is closed for writing");
        }
        container_->stdin_data.append(data.data(), data.size());
        if (container_->script.respond) {
            auto reply = container_->script.respond(std::string(data));
            if (!reply.empty()) {
                container_->pending.push_back(std::move(reply));
            }
        }
        container_->cv.notify_all();
    }

    void CloseWrite() override {
        std::lock_guard<std::mutex> lock(container_->mutex);
        container_->stdin_closed = true;
        if (container_->script.exit_on_eof && !container_->exited) {
            container_->exited = true;
            container_->exit_code = container_->script.exit_code;
            container_->cv.notify_all();
        }
    }

    void Close() override {
        std::lock_guard<std::mutex> lock(container_->mutex);
        container_->stream_closed = true;
        container_->cv.notify_all();
    }

private:
    std::shared_ptr<FakeContainer> container_;
};

/**
 * In-process ContainerRuntime. Containers follow the current FakeScript;
 * failures can be injected per primitive.
 */
class FakeRuntime : public runtime::ContainerRuntime {
public:
    void SetScript(FakeScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_ = std::move(script);
    }

    void FailCreate(runtime::ErrorKind kind) { fail_create_ = kind; }
    void FailStart(runtime::ErrorKind kind) { fail_start_ = kind; }
    void SetReachable(bool reachable) { reachable_ = reachable; }

    void Ping() override {
        if (!reachable_) {
            throw runtime::RuntimeError(runtime::ErrorKind::kUnavailable, "connect: no such file or directory");
        }
    }

    runtime::RuntimeInfo Info() override {
        Ping();
        runtime::RuntimeInfo info;
        info.server_version = "fake";
        info.containers = static_cast<int>(Live());
        info.containers_running = info.containers;
        info.cpus = 4;
        info.memory_bytes = 8LL * 1024 * 1024 * 1024;
        return info;
    }

    std::string Create(const runtime::SandboxSpec& spec) override {
        if (fail_create_) {
            throw runtime::RuntimeError(*fail_create_, "create failed", 404);
        }
        auto container = std::make_shared<FakeContainer>();
        std::lock_guard<std::mutex> lock(mutex_);
        container->id = "fake-" + std::to_string(++created_);
        container->spec = spec;
        container->script = script_;
        containers_[container->id] = container;
        specs_.push_back(spec);
        return container->id;
    }

    void PutArchive(const std::string& id, const std::string& path, const std::string& archive) override {
        auto container = Get(id);
        std::lock_guard<std::mutex> lock(container->mutex);
        container->archive_path = path;
        container->archive = archive;
    }

    std::unique_ptr<runtime::AttachedStream> Attach(const std::string& id) override {
        return std::make_unique<FakeStream>(Get(id));
    }

    void Start(const std::string& id) override {
        if (fail_start_) {
            throw runtime::RuntimeError(*fail_start_, "start failed", 500);
        }
        auto container = Get(id);
        std::lock_guard<std::mutex> lock(container->mutex);
        container->started = true;
        for (const auto& chunk : container->script.output) {
            container->pending.push_back(chunk);
        }
        if (!container->script.hang) {
            container->exited = true;
            container->exit_code = container->script.exit_code;
        }
        container->cv.notify_all();
    }

    int Wait(const std::string& id) override {
        auto container = Get(id);
        std::unique_lock<std::mutex> lock(container->mutex);
        container->cv.wait(lock, [&container] { return container->exited; });
        return container->exit_code;
    }

    void Kill(const std::string& id) override {
        ++killed_;
        auto container = Get(id);
        std::lock_guard<std::mutex> lock(container->mutex);
        if (!container->exited) {
            container->exited = true;
            container->killed = true;
            container->exit_code = 137;
        }
        container->cv.notify_all();
    }

    void Remove(const std::string& id, std::chrono::milliseconds) override {
        auto container = Get(id);
        {
            std::lock_guard<std::mutex> lock(container->mutex);
            if (container->removed) {
                return;
            }
            container->removed = true;
            if (!container->exited) {
                container->exited = true;
                container->exit_code = 137;
            }
            container->cv.notify_all();
        }
        ++removed_;
    }

    void Resize(const std::string& id, int cols, int rows) override {
        auto container = Get(id);
        std::lock_guard<std::mutex> lock(container->mutex);
        container->resizes.emplace_back(cols, rows);
    }

    runtime::ContainerState Inspect(const std::string& id) override {
        auto container = Get(id);
        std::lock_guard<std::mutex> lock(container->mutex);
        runtime::ContainerState state;
        state.running = container->started && !container->exited;
        state.exit_code = container->exit_code;
        state.oom_killed = container->script.oom_killed;
        return state;
    }

    std::shared_ptr<FakeContainer> Get(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(id);
        if (it == containers_.end()) {
            throw runtime::RuntimeError(runtime::ErrorKind::kNotFound, "no such container: " + id, 404);
        }
        return it->second;
    }

    std::shared_ptr<FakeContainer> Last() {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_ == 0 ? nullptr : containers_["fake-" + std::to_string(created_)];
    }

    std::vector<runtime::SandboxSpec> Specs() {
        std::lock_guard<std::mutex> lock(mutex_);
        return specs_;
    }

    int Created() const { return created_.load(); }
    int Removed() const { return removed_.load(); }
    int Killed() const { return killed_.load(); }
    std::size_t Live() const { return static_cast<std::size_t>(created_.load() - removed_.load()); }

    // Polls until cond holds or the deadline passes.
    static bool WaitFor(const std::function<bool()>& cond,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cond()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return cond();
    }

private:
    std::mutex mutex_;
    FakeScript script_;
    std::map<std::string, std::shared_ptr<FakeContainer>> containers_;
    std::vector<runtime::SandboxSpec> specs_;
    std::atomic<int> created_{0};
    std::atomic<int> removed_{0};
    std::atomic<int> killed_{0};
    std::optional<runtime::ErrorKind> fail_create_;
    std::optional<runtime::ErrorKind> fail_start_;
    bool reachable_ = true;
};

}  // namespace codejoin::testing
