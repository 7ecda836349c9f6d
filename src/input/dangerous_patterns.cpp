#include "input/dangerous_patterns.hpp"

#include "stream/stream_transcoder.hpp"

namespace codejoin::input {
namespace {

constexpr std::size_t kScanWindow = 4096;
constexpr std::size_t kScanOverlap = 256;

bool SearchLine(const std::regex& regex, std::string_view line) {
    if (line.size() <= kScanWindow) {
        return std::regex_search(line.begin(), line.end(), regex);
    }
    for (std::size_t offset = 0; offset < line.size(); offset += kScanWindow - kScanOverlap) {
        const auto window = line.substr(offset, kScanWindow);
        if (std::regex_search(window.begin(), window.end(), regex)) {
            return true;
        }
        if (offset + kScanWindow >= line.size()) {
            break;
        }
    }
    return false;
}

void EraseLastCharacter(std::string& out) {
    while (!out.empty() && (static_cast<unsigned char>(out.back()) & 0xc0) == 0x80) {
        out.pop_back();
    }
    if (!out.empty() && out.back() != '\n') {
        out.pop_back();
    }
}

}  // namespace

DangerousPatternSet DangerousPatternSet::Default() {
    DangerousPatternSet set;
    // Any dialect: these only make sense as attacks.
    set.Add("fork bomb", R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&)", false);
    set.Add("recursive delete of the filesystem root",
            R"(\brm\s+(?:-[A-Za-z-]+\s+)+(?:/\*?|~/?|\$HOME/?|/(?:bin|boot|dev|etc|home|lib|opt|root|sbin|srv|usr|var)/?)(?=\s|$|[;&|)'"]))",
            false);

    set.Add("named fork bomb", R"(\b(\w+)\s*\(\s*\)\s*\{\s*\1\s*\|\s*\1\s*&)");
    set.Add("raw disk write", R"(\bdd\s+if=)");
    set.Add("filesystem format", R"(\bmkfs(\.\w+)?\b)");
    set.Add("partition editing", R"(\b(fdisk|parted|sfdisk)\b)");
    set.Add("block device overwrite", R"(>\s*/dev/(sd[a-z]|hd[a-z]|nvme\d|xvd[a-z]|mem\b|kmem\b))");
    set.Add("piped shell execution", R"(\|\s*(sh|bash|dash|zsh)\s+-c\b)");
    set.Add("piped eval", R"(\|\s*(eval|exec)\b)");
    set.Add("remote script execution", R"(\b(curl|wget)\b[^|]*\|\s*(sudo\s+)?(sh|bash|dash|zsh)\b)");
    set.Add("infinite loop", R"(\bwhile\s+(true|:|\[\s*1\s*\])\s*;?\s*do\b)");
    set.Add("infinite loop", R"(\bfor\s*\(\(\s*;\s*;\s*\)\))");
    return set;
}

void DangerousPatternSet::Add(std::string description, const std::string& pattern, bool posix_only) {
    DangerousPattern entry{};
    entry.description = std::move(description);
    entry.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    entry.posix_only = posix_only;
    patterns_.push_back(std::move(entry));
}

std::optional<std::string> DangerousPatternSet::Match(std::string_view text, ShellDialect dialect) const {
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find_first_of("\r\n", start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const auto line = text.substr(start, end - start);
        if (!line.empty()) {
            for (const auto& pattern : patterns_) {
                if (pattern.posix_only && dialect != ShellDialect::kPosixShell) {
                    continue;
                }
                if (SearchLine(pattern.regex, line)) {
                    return pattern.description;
                }
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::string PrintableText(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        const char ch = input[i];
        if (ch == stream::control::kEscape) {
            ++i;
            if (i < input.size() && input[i] == '[') {
                ++i;
                while (i < input.size() && !(input[i] >= 0x40 && input[i] <= 0x7e)) {
                    ++i;
                }
                ++i;
            } else if (i < input.size() && input[i] == ']') {
                while (i < input.size() && input[i] != '\a' &&
                       !(input[i] == stream::control::kEscape && i + 1 < input.size() && input[i + 1] == '\\')) {
                    ++i;
                }
                i += (i < input.size() && input[i] == '\a') ? 1 : 2;
            } else {
                ++i;
            }
            continue;
        }
        if (ch == stream::control::kBackspace || ch == stream::control::kDelete) {
            EraseLastCharacter(out);
        } else if (ch == stream::control::kCarriageReturn) {
            out.push_back('\n');
        } else if (ch == '\n' || ch == '\t' || static_cast<unsigned char>(ch) >= 0x20) {
            out.push_back(ch);
        }
        ++i;
    }
    return out;
}

}  // namespace codejoin::input
