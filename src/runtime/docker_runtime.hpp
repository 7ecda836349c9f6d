#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include <boost/beast/http/verb.hpp>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "runtime/container_runtime.hpp"

namespace codejoin::runtime {

struct DockerEndpoint {
    enum class Kind {
        kUnix,
        kTcp
    };

    Kind kind = Kind::kUnix;
    std::string path;
    std::string host;
    std::string port;

    std::string ToString() const;
};

// Accepts unix://path, tcp://host[:port], http://host[:port] or a bare socket path.
// Throws std::invalid_argument for anything else.
DockerEndpoint ParseDockerHost(const std::string& host);

// Body of POST /containers/create for a sandbox spec.
nlohmann::json BuildCreateBody(const SandboxSpec& spec);

/**
 * Docker Engine API client over a unix or tcp socket using Boost.Beast.
 * Every control call opens its own connection, so one instance is safe to
 * share between threads. Attach() hijacks a connection for raw stdio.
 */
class DockerRuntime : public ContainerRuntime {
public:
    struct Options {
        std::string host = config::kDefaultRuntimeHost;
        std::string api_version = "v1.41";
        std::chrono::milliseconds request_timeout{30000};
    };

    explicit DockerRuntime(Options options);

    // Falls back to the default local socket once when a custom endpoint is unreachable.
    void Ping() override;
    RuntimeInfo Info() override;
    std::string Create(const SandboxSpec& spec) override;
    void PutArchive(const std::string& id, const std::string& path, const std::string& archive) override;
    std::unique_ptr<AttachedStream> Attach(const std::string& id) override;
    void Start(const std::string& id) override;
    int Wait(const std::string& id) override;
    void Kill(const std::string& id) override;
    void Remove(const std::string& id, std::chrono::milliseconds grace) override;
    void Resize(const std::string& id, int cols, int rows) override;
    ContainerState Inspect(const std::string& id) override;

    DockerEndpoint Endpoint() const;

private:
    struct Reply {
        unsigned status = 0;
        std::string body;
    };

    Reply Call(boost::beast::http::verb verb,
               const std::string& target,
               const std::string& body = {},
               const std::string& content_type = "application/json",
               std::chrono::milliseconds timeout = std::chrono::milliseconds(-1));
    std::string Versioned(const std::string& path) const;
    bool SwitchToDefaultEndpoint();

    Options options_;
    mutable std::mutex mutex_;
    DockerEndpoint endpoint_;
    bool fallback_used_ = false;
};

}  // namespace codejoin::runtime
