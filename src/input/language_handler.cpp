#include "input/language_handler.hpp"

#include <algorithm>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codejoin::input {
namespace {

std::vector<std::regex> Patterns(std::initializer_list<const char*> sources) {
    std::vector<std::regex> patterns;
    patterns.reserve(sources.size());
    for (const auto* source : sources) {
        patterns.emplace_back(source);
    }
    return patterns;
}

bool IsLineBreak(char ch) {
    return ch == '\n' || ch == '\r';
}

// A pasted block whose last line is indented needs a blank line before the
// Python REPL executes it.
std::string TerminatePythonBlock(std::string_view input, InputMode mode) {
    std::string text(input);
    if (mode != InputMode::kTerminal || text.empty() || !IsLineBreak(text.back())) {
        return text;
    }
    const auto terminator = text.back();
    std::size_t end = text.size();
    while (end > 0 && IsLineBreak(text[end - 1])) {
        --end;
    }
    if (end == 0 || end + 1 < text.size()) {
        // Already ends with a blank line.
        return text;
    }
    const auto line_start = text.find_last_of("\r\n", end - 1);
    if (line_start == std::string::npos) {
        return text;
    }
    const auto first = text[line_start + 1];
    if (first == ' ' || first == '\t') {
        text.push_back(terminator);
    }
    return text;
}

}  // namespace

void HandlerRegistry::Register(LanguageHandler handler) {
    auto name = utils::ToLower(handler.name);
    handler.name = name;
    auto shared = std::make_shared<const LanguageHandler>(std::move(handler));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.insert_or_assign(name, std::move(shared));
    }
    utils::Log(utils::LogLevel::kInfo, "input", "language handler registered", {{"name", name}});
}

bool HandlerRegistry::Unregister(const std::string& name) {
    const auto key = utils::ToLower(name);
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = handlers_.erase(key) > 0;
    }
    if (removed) {
        utils::Log(utils::LogLevel::kInfo, "input", "language handler removed", {{"name", key}});
    }
    return removed;
}

HandlerPtr HandlerRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(utils::ToLower(name));
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool HandlerRegistry::Has(const std::string& name) const {
    return Find(name) != nullptr;
}

std::vector<std::string> HandlerRegistry::List() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(handlers_.size());
        for (const auto& [name, _] : handlers_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

LanguageHandler MakePythonHandler() {
    LanguageHandler handler{};
    handler.name = "python";
    handler.display_name = "Python";
    handler.preprocess = TerminatePythonBlock;
    handler.multiline_patterns = Patterns({
        R"(:\s*$)",
        R"(^\s*@\w+)",
        R"(\\\s*$)",
        R"([\(\[\{]\s*$)"
    });
    handler.special_commands = {
        {"help", std::regex(R"(^help(\s|\(|$))")},
        {"exit", std::regex(R"(^(exit|quit)(\s|\(|$))")},
        {"import", std::regex(R"(^(import\s+|from\s+\S+\s+import\s+))")}
    };
    handler.primary_prompt = std::regex(R"(>>> ?$)");
    handler.secondary_prompt = std::regex(R"(\.\.\. ?$)");
    return handler;
}

LanguageHandler MakeJavaScriptHandler() {
    LanguageHandler handler{};
    handler.name = "javascript";
    handler.display_name = "JavaScript";
    handler.multiline_patterns = Patterns({
        R"(\{\s*$)",
        R"(\(\s*$)",
        R"(\[\s*$)",
        R"(=>\s*$)",
        R"(,\s*$)"
    });
    handler.special_commands = {
        {"help", std::regex(R"(^\.help(\s|$))")},
        {"exit", std::regex(R"(^\.exit\s*$)")},
        {"clear", std::regex(R"(^\.clear\s*$)")},
        {"load", std::regex(R"(^\.load\s+)")},
        {"save", std::regex(R"(^\.save\s+)")}
    };
    handler.primary_prompt = std::regex(R"((^|\n)> ?$)");
    handler.secondary_prompt = std::regex(R"(\.\.\. ?$)");
    return handler;
}

LanguageHandler MakeJavaHandler() {
    LanguageHandler handler{};
    handler.name = "java";
    handler.display_name = "Java";
    handler.preprocess = [](std::string_view input, InputMode mode) {
        if (mode == InputMode::kSource) {
            return RenamePublicClassToMain(input);
        }
        return std::string(input);
    };
    handler.multiline_patterns = Patterns({
        R"(\{\s*$)",
        R"(\(\s*$)",
        R"(^\s*(if|for|while|catch)\s*\(.*\)\s*$)"
    });
    handler.special_commands = {
        {"exit", std::regex(R"(^/exit\s*$)")},
        {"list", std::regex(R"(^/list(\s|$))")},
        {"vars", std::regex(R"(^/vars\s*$)")},
        {"methods", std::regex(R"(^/methods\s*$)")},
        {"types", std::regex(R"(^/types\s*$)")},
        {"imports", std::regex(R"(^/imports\s*$)")},
        {"reset", std::regex(R"(^/reset\s*$)")}
    };
    handler.primary_prompt = std::regex(R"(jshell> ?$)");
    handler.secondary_prompt = std::regex(R"(\.\.\.> ?$)");
    return handler;
}

LanguageHandler MakeBashHandler() {
    LanguageHandler handler{};
    handler.name = "bash";
    handler.display_name = "Bash";
    handler.dialect = ShellDialect::kPosixShell;
    handler.multiline_patterns = Patterns({
        R"(\{\s*$)",
        R"(\(\s*$)",
        R"(\bdo\s*$)",
        R"(\bthen\s*$)",
        R"(\belse\s*$)",
        R"(\\\s*$)",
        R"((\|\||&&|\|)\s*$)"
    });
    handler.special_commands = {
        {"exit", std::regex(R"(^exit(\s|$))")},
        {"clear", std::regex(R"(^clear\s*$)")},
        {"history", std::regex(R"(^history(\s|$))")},
        {"export", std::regex(R"(^export\s+)")},
        {"alias", std::regex(R"(^alias\s+)")}
    };
    handler.primary_prompt = std::regex(R"([$#] ?$)");
    handler.secondary_prompt = std::regex(R"((^|\n)> ?$)");
    return handler;
}

void RegisterBuiltinHandlers(HandlerRegistry& registry) {
    registry.Register(MakePythonHandler());
    registry.Register(MakeJavaScriptHandler());
    registry.Register(MakeJavaHandler());
    registry.Register(MakeBashHandler());
}

std::string RenamePublicClassToMain(std::string_view source) {
    static const std::regex kPublicClass(R"(public\s+(?:(?:final|abstract)\s+)*class\s+([A-Za-z_][A-Za-z0-9_]*))");
    std::string text(source);
    std::smatch match;
    if (!std::regex_search(text, match, kPublicClass)) {
        return text;
    }
    const auto name = match[1].str();
    if (name == "Main") {
        return text;
    }
    const std::regex reference("\\b" + name + "\\b");
    return std::regex_replace(text, reference, "Main");
}

}  // namespace codejoin::input
