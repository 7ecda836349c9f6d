#include "config/language_profiles.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

#include "utils/common.hpp"

namespace codejoin::config {
namespace {

LanguageProfile MakeProfile(std::string id,
                            std::string name,
                            std::string image,
                            std::string extension,
                            std::string run_command,
                            std::chrono::milliseconds timeout,
                            const std::string& memory,
                            double cpu) {
    LanguageProfile profile{};
    profile.id = std::move(id);
    profile.name = std::move(name);
    profile.image = std::move(image);
    profile.file_extension = std::move(extension);
    profile.run_command = std::move(run_command);
    profile.timeout = timeout;
    profile.memory_bytes = ParseMemoryLimit(memory);
    profile.cpu_limit = cpu;
    return profile;
}

std::vector<LanguageProfile> BuiltinProfiles() {
    using std::chrono::milliseconds;
    std::vector<LanguageProfile> profiles;

    auto javascript = MakeProfile("javascript", "JavaScript", "node:18-alpine", ".js", "node",
                                  milliseconds(10000), "128m", 0.5);
    javascript.interactive_command = "node";
    profiles.push_back(javascript);

    auto python = MakeProfile("python", "Python", "python:3.11-alpine", ".py", "python",
                              milliseconds(10000), "128m", 0.5);
    python.interactive_command = "python";
    profiles.push_back(python);

    auto ruby = MakeProfile("ruby", "Ruby", "ruby:3.2-alpine", ".rb", "ruby",
                            milliseconds(10000), "128m", 0.5);
    ruby.interactive_command = "irb";
    profiles.push_back(ruby);

    auto php = MakeProfile("php", "PHP", "php:8.2-cli-alpine", ".php", "php",
                           milliseconds(10000), "128m", 0.5);
    php.interactive_command = "php -a";
    profiles.push_back(php);

    auto perl = MakeProfile("perl", "Perl", "perl:5.38-alpine", ".pl", "perl",
                            milliseconds(10000), "128m", 0.5);
    profiles.push_back(perl);

    auto shell = MakeProfile("shell", "Shell", "alpine:latest", ".sh", "sh",
                             milliseconds(5000), "64m", 0.25);
    shell.input_handler = "bash";
    profiles.push_back(shell);

    auto bash = MakeProfile("bash", "Bash", "bash:5.2", ".sh", "bash",
                            milliseconds(5000), "64m", 0.25);
    bash.interactive_command = "bash";
    profiles.push_back(bash);

    auto cpp = MakeProfile("cpp", "C++", "gcc:latest", ".cpp", "/tmp/program",
                           milliseconds(15000), "256m", 0.75);
    cpp.compile_command = "g++ -std=c++17 -O2 -o /tmp/program {file}";
    profiles.push_back(cpp);

    auto c = MakeProfile("c", "C", "gcc:latest", ".c", "/tmp/program",
                         milliseconds(15000), "256m", 0.75);
    c.compile_command = "gcc -O2 -o /tmp/program {file}";
    profiles.push_back(c);

    auto java = MakeProfile("java", "Java", "eclipse-temurin:17-jdk-alpine", ".java",
                            "java -cp /tmp Main", milliseconds(20000), "512m", 1.0);
    java.file_name = "Main.java";
    java.compile_command = "javac -d /tmp {file}";
    java.interactive_command = "jshell";
    profiles.push_back(java);

    auto go = MakeProfile("go", "Go", "golang:1.21-alpine", ".go", "/tmp/program",
                          milliseconds(15000), "256m", 0.75);
    go.compile_command = "go build -o /tmp/program {file}";
    go.process_limit = 128;
    profiles.push_back(go);

    auto rust = MakeProfile("rust", "Rust", "rust:1.75-alpine", ".rs", "/tmp/program",
                            milliseconds(20000), "512m", 1.0);
    rust.compile_command = "rustc -o /tmp/program {file}";
    profiles.push_back(rust);

    auto typescript = MakeProfile("typescript", "TypeScript", "node:18-alpine", ".ts",
                                  "node /tmp/code.js", milliseconds(15000), "256m", 0.75);
    typescript.compile_command = "npx tsc {file} --outDir /tmp --target es2020";
    typescript.input_handler = "javascript";
    profiles.push_back(typescript);

    auto kotlin = MakeProfile("kotlin", "Kotlin", "zenika/kotlin:1.9-jdk17-alpine", ".kt",
                              "java -jar /tmp/program.jar", milliseconds(20000), "512m", 1.0);
    kotlin.compile_command = "kotlinc {file} -include-runtime -d /tmp/program.jar";
    profiles.push_back(kotlin);

    auto haskell = MakeProfile("haskell", "Haskell", "haskell:9.4", ".hs", "/tmp/program",
                               milliseconds(20000), "512m", 1.0);
    haskell.compile_command = "ghc -outputdir /tmp -o /tmp/program {file}";
    profiles.push_back(haskell);

    auto elixir = MakeProfile("elixir", "Elixir", "elixir:1.15-alpine", ".exs", "elixir",
                              milliseconds(15000), "256m", 0.75);
    elixir.interactive_command = "iex";
    profiles.push_back(elixir);

    auto r = MakeProfile("r", "R", "r-base:4.3.2", ".r", "Rscript",
                         milliseconds(15000), "256m", 0.75);
    r.interactive_command = "R --quiet";
    profiles.push_back(r);

    return profiles;
}

std::string RequireString(const nlohmann::json& source, const char* key, const std::string& id) {
    if (!source.contains(key) || !source[key].is_string() || source[key].get<std::string>().empty()) {
        throw std::runtime_error("language '" + id + "' is missing required field '" + key + "'");
    }
    return source[key].get<std::string>();
}

}  // namespace

std::string LanguageProfile::SourceFileName() const {
    if (!file_name.empty()) {
        return file_name;
    }
    return "code" + file_extension;
}

std::string LanguageProfile::SourcePath() const {
    return std::string(kSourceDir) + "/" + SourceFileName();
}

std::string LanguageProfile::BatchCommand() const {
    const auto path = SourcePath();
    std::string run = run_command;
    if (run.find(kFilePlaceholder) != std::string::npos) {
        run = utils::ReplaceAll(run, kFilePlaceholder, path);
    } else if (!compile_command.has_value()) {
        run += " " + path;
    }
    if (compile_command.has_value() && !compile_command->empty()) {
        return utils::ReplaceAll(*compile_command, kFilePlaceholder, path) + " && " + run;
    }
    return run;
}

LanguageTable LanguageTable::Builtin() {
    LanguageTable table;
    for (auto& profile : BuiltinProfiles()) {
        table.Upsert(std::move(profile));
    }
    return table;
}

LanguageTable LanguageTable::LoadFile(const std::filesystem::path& path, bool include_builtin) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open language table: " + path.string());
    }
    nlohmann::json data;
    try {
        input >> data;
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("invalid language table " + path.string() + ": " + ex.what());
    }
    return FromJson(data, include_builtin);
}

LanguageTable LanguageTable::FromJson(const nlohmann::json& data, bool include_builtin) {
    if (!data.is_object()) {
        throw std::runtime_error("language table must be a JSON object keyed by language id");
    }
    LanguageTable table = include_builtin ? Builtin() : LanguageTable{};
    for (const auto& item : data.items()) {
        const auto id = utils::ToLower(item.key());
        table.Upsert(ProfileFromJson(id, item.value(), table.Find(id)));
    }
    return table;
}

const LanguageProfile* LanguageTable::Find(const std::string& id) const {
    auto it = profiles_.find(utils::ToLower(id));
    if (it == profiles_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> LanguageTable::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(profiles_.size());
    for (const auto& [id, _] : profiles_) {
        ids.push_back(id);
    }
    return ids;
}

void LanguageTable::Upsert(LanguageProfile profile) {
    auto id = utils::ToLower(profile.id);
    profile.id = id;
    profiles_.insert_or_assign(std::move(id), std::move(profile));
}

std::int64_t ParseMemoryLimit(const std::string& limit) {
    if (limit.empty()) {
        throw std::invalid_argument("empty memory limit");
    }
    std::int64_t multiplier = 1;
    std::string digits = limit;
    const auto unit = static_cast<char>(std::tolower(static_cast<unsigned char>(limit.back())));
    switch (unit) {
        case 'k': multiplier = 1024LL; break;
        case 'm': multiplier = 1024LL * 1024; break;
        case 'g': multiplier = 1024LL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1 || unit == 'b') {
        digits.pop_back();
    }
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid memory limit: " + limit);
    }
    return std::stoll(digits) * multiplier;
}

std::chrono::milliseconds ClampTimeout(const LanguageProfile& profile,
                                       std::optional<std::chrono::milliseconds> requested) {
    if (!requested.has_value() || requested->count() <= 0) {
        return profile.timeout;
    }
    return std::min(*requested, profile.timeout);
}

LanguageProfile ProfileFromJson(const std::string& id, const nlohmann::json& source,
                                const LanguageProfile* base) {
    if (!source.is_object()) {
        throw std::runtime_error("language '" + id + "' must be a JSON object");
    }
    LanguageProfile profile = base ? *base : LanguageProfile{};
    profile.id = id;
    if (!base) {
        profile.name = id;
        profile.image = RequireString(source, "image", id);
        profile.file_extension = RequireString(source, "fileExtension", id);
        profile.run_command = RequireString(source, "runCommand", id);
    }
    if (source.contains("name") && source["name"].is_string()) {
        profile.name = source["name"].get<std::string>();
    }
    if (source.contains("image") && source["image"].is_string()) {
        profile.image = source["image"].get<std::string>();
    }
    if (source.contains("fileExtension") && source["fileExtension"].is_string()) {
        profile.file_extension = source["fileExtension"].get<std::string>();
    }
    if (source.contains("fileName") && source["fileName"].is_string()) {
        profile.file_name = source["fileName"].get<std::string>();
    }
    if (source.contains("runCommand") && source["runCommand"].is_string()) {
        profile.run_command = source["runCommand"].get<std::string>();
    }
    if (source.contains("compileCommand")) {
        if (source["compileCommand"].is_string()) {
            profile.compile_command = source["compileCommand"].get<std::string>();
        } else if (source["compileCommand"].is_null()) {
            profile.compile_command.reset();
        }
    }
    if (source.contains("interactiveCommand") && source["interactiveCommand"].is_string()) {
        profile.interactive_command = source["interactiveCommand"].get<std::string>();
    }
    if (source.contains("inputHandler") && source["inputHandler"].is_string()) {
        profile.input_handler = source["inputHandler"].get<std::string>();
    }
    if (source.contains("timeoutMs") && source["timeoutMs"].is_number_integer()) {
        profile.timeout = std::chrono::milliseconds(source["timeoutMs"].get<long long>());
    }
    if (source.contains("memoryLimit")) {
        const auto& memory = source["memoryLimit"];
        if (memory.is_string()) {
            profile.memory_bytes = ParseMemoryLimit(memory.get<std::string>());
        } else if (memory.is_number_integer()) {
            profile.memory_bytes = memory.get<std::int64_t>();
        }
    }
    if (source.contains("cpuLimit") && source["cpuLimit"].is_number()) {
        profile.cpu_limit = source["cpuLimit"].get<double>();
    }
    if (source.contains("processLimit") && source["processLimit"].is_number_integer()) {
        profile.process_limit = source["processLimit"].get<int>();
    }
    if (profile.timeout.count() <= 0 || profile.memory_bytes <= 0 || profile.cpu_limit <= 0.0 ||
        profile.process_limit <= 0) {
        throw std::runtime_error("language '" + id + "' has a non-positive resource limit");
    }
    return profile;
}

}  // namespace codejoin::config
