#include "runtime/docker_runtime.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <stdexcept>

#include <sys/socket.h>
#include <sys/time.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "utils/logging.hpp"

namespace codejoin::runtime {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

using GenericSocket = asio::generic::stream_protocol::socket;

constexpr std::size_t kMaxReplyBytes = 64 * 1024 * 1024;

void SetSocketTimeouts(GenericSocket& socket, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return;
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(socket.native_handle(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        utils::Log(utils::LogLevel::kWarn, "docker", "cannot set socket timeout",
                   {{"error", std::strerror(errno)}});
    }
}

void Connect(GenericSocket& socket, asio::io_context& ioc, const DockerEndpoint& endpoint) {
    try {
        if (endpoint.kind == DockerEndpoint::Kind::kUnix) {
            socket.connect(asio::generic::stream_protocol::endpoint(
                asio::local::stream_protocol::endpoint(endpoint.path)));
            return;
        }
        asio::ip::tcp::resolver resolver(ioc);
        const auto results = resolver.resolve(endpoint.host, endpoint.port);
        boost::system::error_code last = asio::error::host_not_found;
        for (const auto& entry : results) {
            boost::system::error_code ec;
            if (socket.is_open()) {
                socket.close(ec);
            }
            socket.connect(asio::generic::stream_protocol::endpoint(entry.endpoint()), ec);
            if (!ec) {
                return;
            }
            last = ec;
        }
        throw boost::system::system_error(last);
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == asio::error::access_denied) {
            throw RuntimeError(ErrorKind::kPermissionDenied,
                               "permission denied connecting to " + endpoint.ToString());
        }
        throw RuntimeError(ErrorKind::kUnavailable,
                           "cannot connect to " + endpoint.ToString() + ": " + ex.code().message());
    }
}

std::string ErrorMessage(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object() && json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    return body;
}

ErrorKind KindForStatus(unsigned status) {
    switch (status) {
        case 404: return ErrorKind::kNotFound;
        case 409: return ErrorKind::kConflict;
        default: break;
    }
    return status >= 500 ? ErrorKind::kServer : ErrorKind::kProtocol;
}

nlohmann::json ParseJson(const std::string& body, const std::string& what) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw RuntimeError(ErrorKind::kProtocol, what + ": malformed JSON reply");
    }
    return json;
}

class DockerAttachedStream : public AttachedStream {
public:
    DockerAttachedStream() : socket_(ioc_) {}

    ~DockerAttachedStream() override {
        Close();
    }

    void Open(const DockerEndpoint& endpoint, const std::string& target) {
        Connect(socket_, ioc_, endpoint);
        http::request<http::empty_body> request{http::verb::post, target, 11};
        request.set(http::field::host, "docker");
        request.set(http::field::user_agent, "codejoin-sandbox");
        request.set(http::field::connection, "Upgrade");
        request.set(http::field::upgrade, "tcp");

        beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        try {
            http::write(socket_, request);
            http::read_header(socket_, buffer, parser);
        } catch (const boost::system::system_error& ex) {
            throw RuntimeError(ErrorKind::kUnavailable, "attach handshake failed: " + ex.code().message());
        }
        const auto status = parser.get().result_int();
        if (status != 101 && status != 200) {
            throw RuntimeError(KindForStatus(status),
                               "attach rejected with status " + std::to_string(status), static_cast<int>(status));
        }
        // Bytes read past the header already belong to the raw stream.
        pending_ = beast::buffers_to_string(buffer.data());
    }

    std::size_t Read(char* data, std::size_t size) override {
        if (!pending_.empty()) {
            const auto count = std::min(size, pending_.size());
            std::memcpy(data, pending_.data(), count);
            pending_.erase(0, count);
            return count;
        }
        if (closed_.load()) {
            return 0;
        }
        boost::system::error_code ec;
        const auto count = socket_.read_some(asio::buffer(data, size), ec);
        if (ec) {
            if (ec == asio::error::eof || closed_.load()) {
                return 0;
            }
            throw RuntimeError(ErrorKind::kUnavailable, "attach read failed: " + ec.message());
        }
        return count;
    }

    void Write(std::string_view data) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_.load() || write_closed_) {
            throw RuntimeError(ErrorKind::kUnavailable, "attach stream is closed for writing");
        }
        boost::system::error_code ec;
        asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
        if (ec) {
            throw RuntimeError(ErrorKind::kUnavailable, "attach write failed: " + ec.message());
        }
    }

    void CloseWrite() override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (write_closed_ || closed_.load()) {
            return;
        }
        write_closed_ = true;
        if (::shutdown(socket_.native_handle(), SHUT_WR) != 0) {
            throw RuntimeError(ErrorKind::kUnavailable, std::string("attach half-close failed: ") + std::strerror(errno));
        }
    }

    void Close() override {
        if (closed_.exchange(true)) {
            return;
        }
        // shutdown(2) wakes a reader blocked in recv; the descriptor itself is
        // closed by the socket destructor once no thread uses it any more.
        if (socket_.is_open() && ::shutdown(socket_.native_handle(), SHUT_RDWR) != 0 && errno != ENOTCONN) {
            utils::Log(utils::LogLevel::kDebug, "docker", "attach shutdown failed", {{"error", std::strerror(errno)}});
        }
    }

private:
    asio::io_context ioc_;
    GenericSocket socket_;
    std::string pending_;
    std::mutex write_mutex_;
    bool write_closed_ = false;
    std::atomic<bool> closed_{false};
};

}  // namespace

std::string DockerEndpoint::ToString() const {
    if (kind == Kind::kUnix) {
        return "unix://" + path;
    }
    return "tcp://" + host + ":" + port;
}

DockerEndpoint ParseDockerHost(const std::string& host) {
    DockerEndpoint endpoint{};
    if (host.rfind("unix://", 0) == 0) {
        endpoint.kind = DockerEndpoint::Kind::kUnix;
        endpoint.path = host.substr(7);
    } else if (!host.empty() && host.front() == '/') {
        endpoint.kind = DockerEndpoint::Kind::kUnix;
        endpoint.path = host;
    } else if (host.rfind("tcp://", 0) == 0 || host.rfind("http://", 0) == 0) {
        auto rest = host.substr(host.find("://") + 3);
        const auto slash = rest.find('/');
        if (slash != std::string::npos) {
            rest.erase(slash);
        }
        endpoint.kind = DockerEndpoint::Kind::kTcp;
        const auto colon = rest.rfind(':');
        if (colon == std::string::npos) {
            endpoint.host = rest;
            endpoint.port = "2375";
        } else {
            endpoint.host = rest.substr(0, colon);
            endpoint.port = rest.substr(colon + 1);
        }
        if (endpoint.host.empty() || endpoint.port.empty()) {
            throw std::invalid_argument("invalid runtime host: " + host);
        }
    } else {
        throw std::invalid_argument("unsupported runtime host: " + host);
    }
    if (endpoint.kind == DockerEndpoint::Kind::kUnix && endpoint.path.empty()) {
        throw std::invalid_argument("invalid runtime host: " + host);
    }
    return endpoint;
}

nlohmann::json BuildCreateBody(const SandboxSpec& spec) {
    nlohmann::json body = nlohmann::json::object();
    body["Image"] = spec.image;
    body["Cmd"] = spec.command;
    body["Env"] = spec.env;
    body["WorkingDir"] = spec.working_dir;
    body["User"] = spec.user;
    body["Tty"] = spec.tty;
    body["OpenStdin"] = true;
    body["StdinOnce"] = spec.stdin_once;
    body["AttachStdin"] = true;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["NetworkDisabled"] = spec.network_disabled;
    body["Labels"] = spec.labels;
    nlohmann::json volumes = nlohmann::json::object();
    for (const auto& volume : spec.volumes) {
        volumes[volume] = nlohmann::json::object();
    }
    body["Volumes"] = volumes;

    nlohmann::json host = nlohmann::json::object();
    host["NetworkMode"] = spec.network_disabled ? "none" : "default";
    host["Privileged"] = false;
    host["ReadonlyRootfs"] = spec.read_only_rootfs;
    host["CapDrop"] = spec.cap_drop;
    host["SecurityOpt"] = spec.security_opt;
    host["Tmpfs"] = spec.tmpfs;
    if (spec.memory_bytes > 0) {
        host["Memory"] = spec.memory_bytes;
        // Equal to Memory: no swap on top of the limit.
        host["MemorySwap"] = spec.memory_bytes;
    }
    if (spec.cpu_limit > 0.0) {
        host["CpuPeriod"] = 100000;
        host["CpuQuota"] = static_cast<std::int64_t>(std::llround(spec.cpu_limit * 100000));
    }
    if (spec.pids_limit > 0) {
        host["PidsLimit"] = spec.pids_limit;
    }
    nlohmann::json ulimits = nlohmann::json::array();
    for (const auto& limit : spec.ulimits) {
        ulimits.push_back({{"Name", limit.name}, {"Soft", limit.soft}, {"Hard", limit.hard}});
    }
    host["Ulimits"] = ulimits;
    host["AutoRemove"] = false;
    body["HostConfig"] = host;
    return body;
}

DockerRuntime::DockerRuntime(Options options)
    : options_(std::move(options)) {
    try {
        endpoint_ = ParseDockerHost(options_.host);
    } catch (const std::invalid_argument& ex) {
        utils::Log(utils::LogLevel::kWarn, "docker", "using default socket",
                   {{"host", options_.host}, {"error", ex.what()}});
        endpoint_ = ParseDockerHost(config::kDefaultRuntimeHost);
    }
}

DockerEndpoint DockerRuntime::Endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoint_;
}

bool DockerRuntime::SwitchToDefaultEndpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto fallback = ParseDockerHost(config::kDefaultRuntimeHost);
    if (fallback_used_ || endpoint_.ToString() == fallback.ToString()) {
        return false;
    }
    utils::Log(utils::LogLevel::kWarn, "docker", "endpoint unreachable, falling back",
               {{"from", endpoint_.ToString()}, {"to", fallback.ToString()}});
    endpoint_ = fallback;
    fallback_used_ = true;
    return true;
}

std::string DockerRuntime::Versioned(const std::string& path) const {
    return "/" + options_.api_version + path;
}

DockerRuntime::Reply DockerRuntime::Call(http::verb verb,
                                         const std::string& target,
                                         const std::string& body,
                                         const std::string& content_type,
                                         std::chrono::milliseconds timeout) {
    if (timeout.count() < 0) {
        timeout = options_.request_timeout;
    }
    const auto endpoint = Endpoint();
    asio::io_context ioc;
    GenericSocket socket(ioc);
    Connect(socket, ioc, endpoint);
    SetSocketTimeouts(socket, timeout);

    http::request<http::string_body> request{verb, target, 11};
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, "codejoin-sandbox");
    request.keep_alive(false);
    if (!body.empty()) {
        request.set(http::field::content_type, content_type);
        request.body() = body;
    }
    request.prepare_payload();

    Reply reply{};
    try {
        http::write(socket, request);
        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(kMaxReplyBytes);
        http::read(socket, buffer, parser);
        reply.status = parser.get().result_int();
        reply.body = parser.get().body();
    } catch (const boost::system::system_error& ex) {
        throw RuntimeError(ErrorKind::kUnavailable,
                           std::string(http::to_string(verb)) + " " + target + " failed: " + ex.code().message());
    }
    boost::system::error_code ignored;
    socket.shutdown(asio::socket_base::shutdown_both, ignored);
    utils::Log(utils::LogLevel::kDebug, "docker", "call",
               {{"target", target}, {"status", std::to_string(reply.status)}});
    return reply;
}

void DockerRuntime::Ping() {
    auto ping = [this]() {
        const auto reply = Call(http::verb::get, "/_ping");
        if (reply.status != 200) {
            throw RuntimeError(KindForStatus(reply.status), "ping failed: " + ErrorMessage(reply.body),
                               static_cast<int>(reply.status));
        }
    };
    try {
        ping();
    } catch (const RuntimeError& ex) {
        if (ex.Kind() != ErrorKind::kUnavailable || !SwitchToDefaultEndpoint()) {
            throw;
        }
        ping();
    }
}

RuntimeInfo DockerRuntime::Info() {
    const auto reply = Call(http::verb::get, Versioned("/info"));
    if (reply.status != 200) {
        throw RuntimeError(KindForStatus(reply.status), "info failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
    const auto json = ParseJson(reply.body, "info");
    RuntimeInfo info{};
    info.server_version = json.value("ServerVersion", "");
    info.containers = json.value("Containers", 0);
    info.containers_running = json.value("ContainersRunning", 0);
    info.cpus = json.value("NCPU", 0);
    info.memory_bytes = json.value("MemTotal", static_cast<std::int64_t>(0));
    return info;
}

std::string DockerRuntime::Create(const SandboxSpec& spec) {
    const auto reply = Call(http::verb::post, Versioned("/containers/create?name=" + spec.name),
                            BuildCreateBody(spec).dump());
    if (reply.status != 201 && reply.status != 200) {
        throw RuntimeError(KindForStatus(reply.status),
                           "create " + spec.name + " failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
    const auto json = ParseJson(reply.body, "create");
    const auto id = json.value("Id", "");
    if (id.empty()) {
        throw RuntimeError(ErrorKind::kProtocol, "create " + spec.name + " returned no id");
    }
    for (const auto& warning : json.value("Warnings", nlohmann::json::array())) {
        if (warning.is_string()) {
            utils::Log(utils::LogLevel::kWarn, "docker", "create warning",
                       {{"name", spec.name}, {"warning", warning.get<std::string>()}});
        }
    }
    return id;
}

void DockerRuntime::PutArchive(const std::string& id, const std::string& path, const std::string& archive) {
    const auto reply = Call(http::verb::put, Versioned("/containers/" + id + "/archive?path=" + path),
                            archive, "application/x-tar");
    if (reply.status != 200) {
        throw RuntimeError(KindForStatus(reply.status), "archive upload failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
}

std::unique_ptr<AttachedStream> DockerRuntime::Attach(const std::string& id) {
    auto stream = std::make_unique<DockerAttachedStream>();
    stream->Open(Endpoint(), Versioned("/containers/" + id + "/attach?stream=1&stdin=1&stdout=1&stderr=1"));
    return stream;
}

void DockerRuntime::Start(const std::string& id) {
    const auto reply = Call(http::verb::post, Versioned("/containers/" + id + "/start"));
    // 304: already started.
    if (reply.status != 204 && reply.status != 304) {
        throw RuntimeError(KindForStatus(reply.status), "start failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
}

int DockerRuntime::Wait(const std::string& id) {
    // No socket timeout: the caller bounds the container's lifetime with Kill().
    const auto reply = Call(http::verb::post, Versioned("/containers/" + id + "/wait"), {}, "application/json",
                            std::chrono::milliseconds(0));
    if (reply.status != 200) {
        throw RuntimeError(KindForStatus(reply.status), "wait failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
    return ParseJson(reply.body, "wait").value("StatusCode", -1);
}

void DockerRuntime::Kill(const std::string& id) {
    const auto reply = Call(http::verb::post, Versioned("/containers/" + id + "/kill?signal=SIGKILL"));
    // 404 and 409 mean the container is already gone or not running.
    if (reply.status != 204 && reply.status != 404 && reply.status != 409) {
        throw RuntimeError(KindForStatus(reply.status), "kill failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
}

void DockerRuntime::Remove(const std::string& id, std::chrono::milliseconds grace) {
    const auto reply = Call(http::verb::delete_, Versioned("/containers/" + id + "?force=true&v=true"),
                            {}, "application/json", grace);
    // 409: a removal is already in progress.
    if (reply.status != 204 && reply.status != 404 && reply.status != 409) {
        throw RuntimeError(KindForStatus(reply.status), "remove failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
}

void DockerRuntime::Resize(const std::string& id, int cols, int rows) {
    const auto reply = Call(http::verb::post,
                            Versioned("/containers/" + id + "/resize?h=" + std::to_string(rows) +
                                      "&w=" + std::to_string(cols)));
    if (reply.status != 200 && reply.status != 204) {
        throw RuntimeError(KindForStatus(reply.status), "resize failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
}

ContainerState DockerRuntime::Inspect(const std::string& id) {
    const auto reply = Call(http::verb::get, Versioned("/containers/" + id + "/json"));
    if (reply.status != 200) {
        throw RuntimeError(KindForStatus(reply.status), "inspect failed: " + ErrorMessage(reply.body),
                           static_cast<int>(reply.status));
    }
    const auto json = ParseJson(reply.body, "inspect");
    ContainerState state{};
    if (json.contains("State") && json["State"].is_object()) {
        const auto& s = json["State"];
        state.running = s.value("Running", false);
        state.exit_code = s.value("ExitCode", 0);
        state.oom_killed = s.value("OOMKilled", false);
    }
    return state;
}

}  // namespace codejoin::runtime
