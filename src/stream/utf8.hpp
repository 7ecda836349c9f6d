#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace codejoin::stream {

// Expected length of the sequence introduced by lead, 0 when lead cannot start one.
std::size_t Utf8SequenceLength(unsigned char lead);

bool IsValidContinuation(unsigned char lead, std::size_t index, unsigned char byte);

bool IsValidUtf8(std::string_view text);

// Largest prefix length <= max_bytes that does not split a code point.
std::size_t Utf8BoundaryAtOrBefore(std::string_view text, std::size_t max_bytes);

std::string TruncateUtf8(std::string_view text, std::size_t max_bytes, bool* truncated = nullptr);

// Drops NUL and C0/DEL control bytes except TAB, LF, CR and ESC.
std::string StripUnsafeControls(std::string_view text);

}  // namespace codejoin::stream
