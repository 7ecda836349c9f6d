#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace codejoin::stream {

namespace control {
constexpr char kInterrupt = '\x03';
constexpr char kEndOfFile = '\x04';
constexpr char kBackspace = '\x08';
constexpr char kTab = '\x09';
constexpr char kLineFeed = '\x0a';
constexpr char kCarriageReturn = '\x0d';
constexpr char kEscape = '\x1b';
constexpr char kDelete = '\x7f';
}  // namespace control

enum class LineEndings {
    kPreserve,
    kCrlfToLf,
    kAllToLf
};

struct StreamStats {
    std::uint64_t chunks_processed = 0;
    std::uint64_t bytes_processed = 0;
    std::uint64_t control_chars = 0;
    std::uint64_t ansi_sequences = 0;
    std::uint64_t decode_errors = 0;

    StreamStats& operator+=(const StreamStats& other);
};

struct TranscodeOptions {
    LineEndings line_endings = LineEndings::kPreserve;
    // A trailing ESC with nothing after it is held as a partial sequence. Keyboard
    // input turns this off so that a lone Escape key press is not delayed.
    bool hold_trailing_escape = true;
    // Unterminated string sequences (OSC, DCS) longer than this are passed through.
    std::size_t max_pending_bytes = 4096;
};

struct TranscodeResult {
    std::string emitted;
    std::string tail;
    StreamStats stats;
};

/**
 * Scans previous_tail + chunk and emits only complete units: whole UTF-8
 * code points, control bytes and terminated escape sequences. A trailing
 * partial unit is returned in tail and must be handed back with the next chunk.
 * Malformed bytes are counted and emitted verbatim.
 */
TranscodeResult Transcode(std::string_view chunk,
                          std::string_view previous_tail,
                          const TranscodeOptions& options = {});

// Stateful wrapper that owns the tail between chunks and accumulates statistics.
class StreamTranscoder {
public:
    StreamTranscoder() = default;
    explicit StreamTranscoder(TranscodeOptions options);

    std::string Feed(std::string_view chunk);
    // Emits whatever is still buffered; incomplete sequences count as decode errors.
    std::string Flush();

    const StreamStats& Stats() const { return stats_; }
    std::size_t PendingBytes() const { return tail_.size(); }
    const TranscodeOptions& Options() const { return options_; }

private:
    TranscodeOptions options_;
    std::string tail_;
    StreamStats stats_;
};

}  // namespace codejoin::stream
