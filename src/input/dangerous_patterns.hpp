#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "input/language_handler.hpp"

namespace codejoin::input {

struct DangerousPattern {
    std::string description;
    std::regex regex;
    // Applies to every dialect when false.
    bool posix_only = true;
};

/**
 * Best-effort denylist of destructive shell idioms. Scanning is line based:
 * every pattern describes something that fits on a single line, and long
 * lines are scanned in overlapping windows so that regex evaluation stays
 * bounded on adversarial input.
 */
class DangerousPatternSet {
public:
    static DangerousPatternSet Default();

    void Add(std::string description, const std::string& pattern, bool posix_only = true);

    // Description of the first matching pattern, or nullopt.
    std::optional<std::string> Match(std::string_view text, ShellDialect dialect) const;

    std::size_t Size() const { return patterns_.size(); }

private:
    std::vector<DangerousPattern> patterns_;
};

// Drops control bytes and escape sequences so keystroke input can be scanned as text.
std::string PrintableText(std::string_view input);

}  // namespace codejoin::input
