#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace codejoin::config {

// Directory inside the sandbox that receives the injected source file.
constexpr const char* kSourceDir = "/sandbox";
constexpr const char* kFilePlaceholder = "{file}";

struct LanguageProfile {
    std::string id;
    std::string name;
    std::string image;
    std::string file_extension;
    // Fixed source file name (e.g. Main.java); "code" + extension otherwise.
    std::string file_name;
    std::string run_command;
    std::optional<std::string> compile_command;
    std::string interactive_command = "/bin/sh -l";
    // Key into the input handler registry; defaults to id.
    std::string input_handler;
    std::chrono::milliseconds timeout{10000};
    std::int64_t memory_bytes = 128LL * 1024 * 1024;
    double cpu_limit = 0.5;
    int process_limit = 64;

    std::string SourceFileName() const;
    std::string SourcePath() const;
    std::string HandlerName() const { return input_handler.empty() ? id : input_handler; }
    // "compile && run" or "run <file>", as one shell command line.
    std::string BatchCommand() const;
};

/**
 * Immutable lookup table of language profiles. Built from the compiled-in
 * defaults and optionally overlaid with a JSON document of the form
 * {"python": {"image": ..., "fileExtension": ..., "runCommand": ...}, ...}.
 */
class LanguageTable {
public:
    static LanguageTable Builtin();
    // Throws std::runtime_error on an unreadable file or invalid entry.
    static LanguageTable LoadFile(const std::filesystem::path& path, bool include_builtin = true);
    static LanguageTable FromJson(const nlohmann::json& data, bool include_builtin = true);

    const LanguageProfile* Find(const std::string& id) const;
    bool Contains(const std::string& id) const { return Find(id) != nullptr; }
    std::vector<std::string> Ids() const;
    std::size_t Size() const { return profiles_.size(); }

    void Upsert(LanguageProfile profile);

private:
    std::map<std::string, LanguageProfile> profiles_;
};

// Accepts plain bytes or a k/m/g suffix ("128m"). Throws std::invalid_argument.
std::int64_t ParseMemoryLimit(const std::string& limit);

// Requested timeout clamped to (0, profile maximum]; the maximum when absent.
std::chrono::milliseconds ClampTimeout(const LanguageProfile& profile,
                                       std::optional<std::chrono::milliseconds> requested);

LanguageProfile ProfileFromJson(const std::string& id, const nlohmann::json& source,
                                const LanguageProfile* base = nullptr);

}  // namespace codejoin::config
