#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codejoin::input {

// Which dangerous-pattern rules apply to a language's input.
enum class ShellDialect {
    kPosixShell,
    kGeneric
};

enum class InputMode {
    // Whole source file for a batch run.
    kSource,
    // Program stdin for a batch run.
    kStdin,
    // Keystrokes for an interactive session; control and escape bytes pass untouched.
    kTerminal
};

struct LanguageHandler {
    using Preprocess = std::function<std::string(std::string_view input, InputMode mode)>;
    // Returns a rejection reason, or nullopt when the input is acceptable.
    using Validate = std::function<std::optional<std::string>(std::string_view input, InputMode mode)>;

    std::string name;
    std::string display_name;
    ShellDialect dialect = ShellDialect::kGeneric;
    Preprocess preprocess;
    Validate validate;
    // Matched against the last non-empty input line; a match means the REPL
    // will wait for a continuation line.
    std::vector<std::regex> multiline_patterns;
    std::vector<std::pair<std::string, std::regex>> special_commands;
    std::optional<std::regex> primary_prompt;
    std::optional<std::regex> secondary_prompt;
};

using HandlerPtr = std::shared_ptr<const LanguageHandler>;

// Runtime-extensible map from language name to handler. Safe for concurrent use.
class HandlerRegistry {
public:
    void Register(LanguageHandler handler);
    bool Unregister(const std::string& name);
    HandlerPtr Find(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::vector<std::string> List() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, HandlerPtr> handlers_;
};

LanguageHandler MakePythonHandler();
LanguageHandler MakeJavaScriptHandler();
LanguageHandler MakeJavaHandler();
LanguageHandler MakeBashHandler();

void RegisterBuiltinHandlers(HandlerRegistry& registry);

// Renames the first public top-level class to Main so it matches Main.java.
std::string RenamePublicClassToMain(std::string_view source);

}  // namespace codejoin::input
