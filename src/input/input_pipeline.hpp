#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "input/dangerous_patterns.hpp"
#include "input/language_handler.hpp"
#include "stream/stream_transcoder.hpp"

namespace codejoin::input {

struct InputOptions {
    InputMode mode = InputMode::kSource;
    bool enable_validation = true;
    // Opaque bytes: size check and transcoder accounting only.
    bool binary = false;
    std::size_t max_bytes = 1024 * 1024;
    std::string session_id;
};

struct InputResult {
    bool accepted = false;
    std::string normalized;
    std::string reason;
    // The handler expects a continuation line before the REPL evaluates.
    bool multiline_pending = false;
    std::string special_command;
    stream::StreamStats stats;
};

struct LanguageInfo {
    std::string name;
    bool supported = false;
    bool multiline = false;
    bool special_commands = false;
    bool preprocessing = false;
    bool validation = false;
};

/**
 * Validates and normalizes user input before it reaches a sandbox.
 *
 * Order of checks: size ceiling, dangerous patterns for the handler's
 * dialect, then the handler's own preprocess/validate hooks and multiline
 * detection. Every accepted payload is run through a transcoder so the
 * caller gets byte and control-character accounting.
 */
class InputPipeline {
public:
    InputPipeline();
    InputPipeline(DangerousPatternSet patterns, bool with_builtin_handlers);

    // With a transcoder the normalized bytes are what the transcoder emitted;
    // a partial trailing unit stays in its tail for the next call.
    InputResult Process(std::string_view input,
                        const std::string& language,
                        const InputOptions& options,
                        stream::StreamTranscoder* transcoder = nullptr) const;

    HandlerRegistry& Handlers() { return handlers_; }
    const HandlerRegistry& Handlers() const { return handlers_; }
    const DangerousPatternSet& Patterns() const { return patterns_; }

    LanguageInfo Info(const std::string& language) const;
    std::vector<std::string> SupportedLanguages() const;

private:
    DangerousPatternSet patterns_;
    HandlerRegistry handlers_;
};

// CRLF and lone CR become LF; non-empty text gains a trailing newline.
std::string NormalizeStdin(std::string_view stdin_data);

}  // namespace codejoin::input
