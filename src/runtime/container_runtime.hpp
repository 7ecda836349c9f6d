#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "runtime/runtime_error.hpp"

namespace codejoin::runtime {

struct Ulimit {
    std::string name;
    std::int64_t soft = 0;
    std::int64_t hard = 0;
};

// Everything needed to create one isolated container.
struct SandboxSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::vector<std::string> env;
    std::string working_dir = "/tmp";
    std::string user = "nobody";
    bool tty = false;
    // Close the container's stdin once the attached client closes its side.
    bool stdin_once = true;

    std::int64_t memory_bytes = 0;
    double cpu_limit = 0.0;
    int pids_limit = 0;
    bool network_disabled = true;
    bool read_only_rootfs = true;
    std::vector<std::string> cap_drop{"ALL"};
    std::vector<std::string> security_opt{"no-new-privileges:true"};
    // Mount point -> tmpfs options.
    std::map<std::string, std::string> tmpfs;
    // Anonymous volumes, removed together with the container.
    std::vector<std::string> volumes;
    std::vector<Ulimit> ulimits;
    std::map<std::string, std::string> labels;
};

struct ContainerState {
    bool running = false;
    int exit_code = 0;
    bool oom_killed = false;
};

struct RuntimeInfo {
    std::string server_version;
    int containers = 0;
    int containers_running = 0;
    int cpus = 0;
    std::int64_t memory_bytes = 0;
};

/**
 * Bidirectional byte stream attached to a container's stdio. Read() and
 * Write() may run on different threads; Close() may be called from any
 * thread and wakes a blocked Read().
 */
class AttachedStream {
public:
    virtual ~AttachedStream() = default;

    // Blocks until data arrives; returns 0 at end of stream.
    virtual std::size_t Read(char* buffer, std::size_t size) = 0;
    virtual void Write(std::string_view data) = 0;
    // Half-close: the container sees EOF on stdin.
    virtual void CloseWrite() = 0;
    virtual void Close() = 0;
};

// Control plane of the isolation runtime. Failures throw RuntimeError.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual void Ping() = 0;
    virtual RuntimeInfo Info() = 0;

    // Returns the runtime's container id.
    virtual std::string Create(const SandboxSpec& spec) = 0;
    // Extracts a tar archive into path inside the container.
    virtual void PutArchive(const std::string& id, const std::string& path, const std::string& archive) = 0;
    // Must be called before Start() so no early output is lost.
    virtual std::unique_ptr<AttachedStream> Attach(const std::string& id) = 0;
    virtual void Start(const std::string& id) = 0;
    // Blocks until the container exits; returns its exit code.
    virtual int Wait(const std::string& id) = 0;
    virtual void Kill(const std::string& id) = 0;
    virtual void Remove(const std::string& id, std::chrono::milliseconds grace) = 0;
    virtual void Resize(const std::string& id, int cols, int rows) = 0;
    virtual ContainerState Inspect(const std::string& id) = 0;
};

}  // namespace codejoin::runtime
