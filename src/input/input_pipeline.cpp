#include "input/input_pipeline.hpp"

#include "utils/logging.hpp"

namespace codejoin::input {
namespace {

constexpr std::string_view kUtf8Bom = "\xef\xbb\xbf";

std::string_view LastLine(std::string_view text) {
    auto end = text.find_last_not_of("\r\n");
    if (end == std::string_view::npos) {
        return {};
    }
    const auto start = text.find_last_of("\r\n", end);
    const auto begin = start == std::string_view::npos ? 0 : start + 1;
    return text.substr(begin, end + 1 - begin);
}

std::string_view FirstLine(std::string_view text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_first_of("\r\n", begin);
    return text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
}

InputResult Reject(std::string reason, const std::string& language, const InputOptions& options) {
    utils::Log(utils::LogLevel::kWarn, "input", "input rejected",
               {{"language", language}, {"reason", reason}, {"session", options.session_id}});
    InputResult result{};
    result.accepted = false;
    result.reason = std::move(reason);
    return result;
}

}  // namespace

InputPipeline::InputPipeline()
    : InputPipeline(DangerousPatternSet::Default(), true) {}

InputPipeline::InputPipeline(DangerousPatternSet patterns, bool with_builtin_handlers)
    : patterns_(std::move(patterns)) {
    if (with_builtin_handlers) {
        RegisterBuiltinHandlers(handlers_);
    }
}

InputResult InputPipeline::Process(std::string_view input,
                                   const std::string& language,
                                   const InputOptions& options,
                                   stream::StreamTranscoder* transcoder) const {
    if (input.size() > options.max_bytes) {
        return Reject("Input too large: " + std::to_string(input.size()) + " bytes exceeds the " +
                          std::to_string(options.max_bytes) + " byte limit",
                      language, options);
    }

    InputResult result{};
    std::string text(input);
    if (!options.binary && options.mode == InputMode::kStdin) {
        text = NormalizeStdin(text);
    } else if (!options.binary) {
        if (options.mode == InputMode::kSource && text.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
            text.erase(0, kUtf8Bom.size());
        }
        const auto handler = handlers_.Find(language);
        const auto dialect = handler ? handler->dialect : ShellDialect::kGeneric;
        if (options.enable_validation) {
            const auto scanned = options.mode == InputMode::kTerminal ? PrintableText(text) : text;
            if (const auto hit = patterns_.Match(scanned, dialect)) {
                return Reject("Input contains potentially dangerous commands (" + *hit + ")", language, options);
            }
        }
        if (handler) {
            if (handler->preprocess) {
                text = handler->preprocess(text, options.mode);
            }
            if (options.enable_validation && handler->validate) {
                if (auto reason = handler->validate(text, options.mode)) {
                    return Reject(std::move(*reason), language, options);
                }
            }
            const auto visible = options.mode == InputMode::kTerminal ? PrintableText(text) : text;
            const auto last = std::string(LastLine(visible));
            for (const auto& pattern : handler->multiline_patterns) {
                if (!last.empty() && std::regex_search(last, pattern)) {
                    result.multiline_pending = true;
                    break;
                }
            }
            const auto first = std::string(FirstLine(visible));
            for (const auto& [name, pattern] : handler->special_commands) {
                if (!first.empty() && std::regex_search(first, pattern)) {
                    result.special_command = name;
                    break;
                }
            }
        }
    }

    if (transcoder) {
        result.normalized = transcoder->Feed(text);
        result.stats = transcoder->Stats();
    } else {
        stream::StreamTranscoder local;
        result.normalized = local.Feed(text);
        result.normalized += local.Flush();
        result.stats = local.Stats();
    }
    result.accepted = true;
    return result;
}

LanguageInfo InputPipeline::Info(const std::string& language) const {
    LanguageInfo info{};
    const auto handler = handlers_.Find(language);
    if (!handler) {
        info.name = language;
        return info;
    }
    info.name = handler->display_name.empty() ? handler->name : handler->display_name;
    info.supported = true;
    info.multiline = !handler->multiline_patterns.empty();
    info.special_commands = !handler->special_commands.empty();
    info.preprocessing = static_cast<bool>(handler->preprocess);
    info.validation = static_cast<bool>(handler->validate);
    return info;
}

std::vector<std::string> InputPipeline::SupportedLanguages() const {
    return handlers_.List();
}

std::string NormalizeStdin(std::string_view stdin_data) {
    std::string out;
    out.reserve(stdin_data.size() + 1);
    for (std::size_t i = 0; i < stdin_data.size(); ++i) {
        const char ch = stdin_data[i];
        if (ch == '\r') {
            out.push_back('\n');
            if (i + 1 < stdin_data.size() && stdin_data[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        out.push_back(ch);
    }
    if (!out.empty() && out.back() != '\n') {
        out.push_back('\n');
    }
    return out;
}

}  // namespace codejoin::input
