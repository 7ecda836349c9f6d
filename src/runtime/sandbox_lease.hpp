#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "runtime/container_runtime.hpp"

namespace codejoin::runtime {

/**
 * Owns one created container and removes it when the lease ends, on every
 * exit path. Release() may be called from several threads; only the first
 * call talks to the runtime.
 */
class SandboxLease {
public:
    SandboxLease(ContainerRuntime& runtime,
                 std::string container_id,
                 std::string name,
                 std::chrono::milliseconds grace);
    ~SandboxLease();

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    // Returns false if removal failed; the failure is logged.
    bool Release();

    bool Released() const { return released_.load(); }
    const std::string& ContainerId() const { return container_id_; }
    const std::string& Name() const { return name_; }

private:
    ContainerRuntime& runtime_;
    std::string container_id_;
    std::string name_;
    std::chrono::milliseconds grace_;
    std::atomic<bool> released_{false};
};

}  // namespace codejoin::runtime
