#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "engine/execution_engine.hpp"
#include "nlohmann/json.hpp"
#include "runtime/runtime_error.hpp"
#include "utils/logging.hpp"

namespace {

constexpr char kDetachKey = '\x1d';  // Ctrl-]

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;
volatile std::sig_atomic_t g_resized = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void HandleResize(int) {
    g_resized = 1;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    struct sigaction resize {};
    resize.sa_handler = HandleResize;
    sigemptyset(&resize.sa_mask);
    resize.sa_flags = SA_RESTART;
    sigaction(SIGWINCH, &resize, nullptr);
}

std::optional<std::string> ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

nlohmann::json BuildStatsJson(const codejoin::stream::StreamStats& stats) {
    return {
        {"chunks", stats.chunks_processed},
        {"bytes", stats.bytes_processed},
        {"controlChars", stats.control_chars},
        {"ansiSequences", stats.ansi_sequences},
        {"decodeErrors", stats.decode_errors}
    };
}

nlohmann::json BuildResultJson(const codejoin::runner::ExecutionResult& result) {
    nlohmann::json json = {
        {"success", result.success},
        {"output", result.output},
        {"error", result.error},
        {"exitCode", result.exit_code},
        {"timedOut", result.timed_out},
        {"truncated", result.truncated},
        {"executionTime", result.execution_time.count()},
        {"errorClass", codejoin::runner::ToString(result.error_class)},
        {"stdoutStats", BuildStatsJson(result.stdout_stats)},
        {"stderrStats", BuildStatsJson(result.stderr_stats)}
    };
    json["errorMessage"] = result.error_message.empty() ? nlohmann::json(nullptr)
                                                        : nlohmann::json(result.error_message);
    json["sandboxId"] = result.sandbox_id.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.sandbox_id);
    return json;
}

int ListLanguages(const codejoin::config::LanguageTable& languages) {
    for (const auto& id : languages.Ids()) {
        const auto* profile = languages.Find(id);
        std::cout << id << "\t" << profile->image << "\t" << profile->timeout.count() << "ms";
        if (profile->compile_command) {
            std::cout << "\tcompiled";
        }
        std::cout << std::endl;
    }
    return 0;
}

int Ping(codejoin::engine::ExecutionEngine& engine) {
    try {
        engine.Ping();
        const auto info = engine.RuntimeInfo();
        std::cout << "runtime ok: version=" << info.server_version
                  << " containers=" << info.containers
                  << " running=" << info.containers_running
                  << " cpus=" << info.cpus
                  << " memory=" << info.memory_bytes << std::endl;
        return 0;
    } catch (const codejoin::runtime::RuntimeError& ex) {
        std::cout << codejoin::runtime::DescribeForUser(ex, "") << ": " << ex.what() << std::endl;
        return 1;
    }
}

int RunBatch(codejoin::engine::ExecutionEngine& engine, int argc, char** argv) {
    if (argc < 4) {
        std::cout << "Usage: codejoin_cli run <language> <file> [--stdin <file>] [--timeout <ms>]" << std::endl;
        return 1;
    }
    const std::string language = argv[2];
    const auto code = ReadFile(argv[3]);
    if (!code) {
        std::cout << "Cannot read " << argv[3] << std::endl;
        return 1;
    }
    std::string stdin_data;
    std::optional<std::chrono::milliseconds> timeout;
    for (int i = 4; i + 1 < argc; i += 2) {
        const std::string flag = argv[i];
        if (flag == "--stdin") {
            const auto data = ReadFile(argv[i + 1]);
            if (!data) {
                std::cout << "Cannot read " << argv[i + 1] << std::endl;
                return 1;
            }
            stdin_data = *data;
        } else if (flag == "--timeout") {
            try {
                timeout = std::chrono::milliseconds(std::stoll(argv[i + 1]));
            } catch (const std::exception&) {
                std::cout << "Invalid timeout: " << argv[i + 1] << std::endl;
                return 1;
            }
        } else {
            std::cout << "Unknown option: " << flag << std::endl;
            return 1;
        }
    }

    auto cancel = std::make_shared<codejoin::runner::CancelToken>();
    std::thread watcher([&cancel] {
        while (g_running.load()) {
            if (g_signal != 0) {
                cancel->Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    const auto result = engine.RunBatch(language, *code, stdin_data, timeout, cancel);
    g_running.store(false);
    watcher.join();

    std::cout << BuildResultJson(result).dump(2) << std::endl;
    return result.success ? 0 : 1;
}

class RawTerminal {
public:
    RawTerminal() {
        if (!::isatty(STDIN_FILENO) || ::tcgetattr(STDIN_FILENO, &saved_) != 0) {
            return;
        }
        termios raw = saved_;
        ::cfmakeraw(&raw);
        active_ = ::tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
    }

    ~RawTerminal() {
        if (active_ && ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_) != 0) {
            std::cerr << "[cli] failed to restore terminal: " << std::strerror(errno) << std::endl;
        }
    }

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

private:
    termios saved_{};
    bool active_ = false;
};

void PropagateWindowSize(codejoin::engine::ExecutionEngine& engine, const std::string& session_id) {
    winsize size {};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col == 0 || size.ws_row == 0) {
        return;
    }
    const auto error = engine.Resize(session_id, size.ws_col, size.ws_row);
    if (error != codejoin::terminal::SessionError::kNone) {
        codejoin::utils::Log(codejoin::utils::LogLevel::kDebug, "cli", "resize failed",
                             {{"error", codejoin::terminal::ToString(error)}});
    }
}

int RunShell(codejoin::engine::ExecutionEngine& engine, int argc, char** argv) {
    if (argc < 3) {
        std::cout << "Usage: codejoin_cli shell <language>" << std::endl;
        return 1;
    }
    const auto started = engine.StartSession(argv[2], "cli");
    if (!started.ok) {
        std::cout << started.error << std::endl;
        return 1;
    }
    const auto session_id = started.session_id;
    std::cout << "Session " << session_id << " started. Press Ctrl-] to stop." << std::endl;

    std::atomic<bool> closed{false};
    std::optional<int> exit_code;
    std::string close_reason;
    std::thread printer([&] {
        codejoin::bus::TerminalEvent event;
        while (!closed.load()) {
            if (!engine.Events().TryConsume(event, std::chrono::milliseconds(200))) {
                continue;
            }
            if (event.session_id != session_id) {
                continue;
            }
            if (event.kind == codejoin::bus::EventKind::kClosed) {
                close_reason = event.reason;
                exit_code = event.exit_code;
                closed.store(true);
                break;
            }
            std::cout.write(event.data.data(), static_cast<std::streamsize>(event.data.size()));
            std::cout.flush();
        }
    });

    {
        RawTerminal raw;
        PropagateWindowSize(engine, session_id);
        char buffer[1024];
        while (!closed.load() && g_signal == 0) {
            if (g_resized != 0) {
                g_resized = 0;
                PropagateWindowSize(engine, session_id);
            }
            pollfd fd {STDIN_FILENO, POLLIN, 0};
            const int ready = ::poll(&fd, 1, 200);
            if (ready < 0 && errno != EINTR) {
                break;
            }
            if (ready <= 0) {
                continue;
            }
            const auto count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
            if (count <= 0) {
                break;
            }
            const std::string_view bytes(buffer, static_cast<std::size_t>(count));
            const auto detach = bytes.find(kDetachKey);
            if (detach != std::string_view::npos) {
                if (detach > 0 &&
                    engine.SendInput(session_id, bytes.substr(0, detach)) != codejoin::terminal::SessionError::kNone) {
                    codejoin::utils::Log(codejoin::utils::LogLevel::kDebug, "cli", "input before detach was not delivered");
                }
                break;
            }
            std::string reason;
            const auto error = engine.SendInput(session_id, bytes, &reason);
            if (error == codejoin::terminal::SessionError::kRejected) {
                std::cout << "\r\n[input rejected] " << reason << "\r\n" << std::flush;
            } else if (error != codejoin::terminal::SessionError::kNone) {
                break;
            }
        }
    }

    engine.StopSession(session_id);
    // The close event is always published, so the printer terminates.
    printer.join();
    std::cout << "\nSession closed: " << (close_reason.empty() ? "stopped" : close_reason);
    if (exit_code) {
        std::cout << " (exit " << *exit_code << ")";
    }
    std::cout << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: codejoin_cli languages | ping | run <language> <file> [--stdin <file>] [--timeout <ms>]"
                     " | shell <language>" << std::endl;
        return 1;
    }
    const std::string command = argv[1];

    auto config = codejoin::config::LoadConfig();
    codejoin::utils::LogConfig log_config;
    log_config.min_level = codejoin::utils::ParseLogLevel(config.log_level);
    codejoin::utils::SetLogConfig(log_config);
    InstallSignalHandlers();

    try {
        if (command == "languages") {
            return ListLanguages(codejoin::engine::LoadLanguages(config));
        }
        codejoin::engine::ExecutionEngine engine(config);
        if (command == "ping") {
            return Ping(engine);
        }
        if (command == "run") {
            return RunBatch(engine, argc, argv);
        }
        if (command == "shell") {
            return RunShell(engine, argc, argv);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        return 1;
    }
    std::cout << "Unknown command: " << command << std::endl;
    return 1;
}
