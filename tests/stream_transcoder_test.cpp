#include <gtest/gtest.h>

#include <string>

#include "stream/stream_transcoder.hpp"
#include "stream/utf8.hpp"

using codejoin::stream::LineEndings;
using codejoin::stream::StreamTranscoder;
using codejoin::stream::Transcode;
using codejoin::stream::TranscodeOptions;

namespace {

// U+1F600 (4 bytes), a CSI color sequence, an OSC title and U+4E2D (3 bytes).
const std::string kMixed =
    "a\xf0\x9f\x98\x80\x1b[1;31mred\x1b[0m\x1b]0;title\x07\xe4\xb8\xad\r\nb";

}  // namespace

TEST(StreamTranscoder, every_two_chunk_split_reassembles_the_input) {
    for (std::size_t split = 0; split <= kMixed.size(); ++split) {
        StreamTranscoder transcoder;
        std::string out = transcoder.Feed(kMixed.substr(0, split));
        out += transcoder.Feed(kMixed.substr(split));
        out += transcoder.Flush();
        EXPECT_EQ(out, kMixed) << "split at " << split;
        EXPECT_EQ(transcoder.Stats().decode_errors, 0u) << "split at " << split;
        EXPECT_EQ(transcoder.Stats().ansi_sequences, 3u) << "split at " << split;
    }
}

TEST(StreamTranscoder, emitted_text_never_ends_inside_a_code_point) {
    for (std::size_t split = 0; split <= kMixed.size(); ++split) {
        const auto result = Transcode(kMixed.substr(0, split), "");
        EXPECT_TRUE(codejoin::stream::IsValidUtf8(result.emitted)) << "split at " << split;
        EXPECT_EQ(result.emitted + result.tail, kMixed.substr(0, split));
    }
}

TEST(StreamTranscoder, holds_partial_escape_sequence_until_terminated) {
    StreamTranscoder transcoder;
    EXPECT_EQ(transcoder.Feed("ok\x1b[3"), "ok");
    EXPECT_EQ(transcoder.PendingBytes(), 3u);
    EXPECT_EQ(transcoder.Feed("2mgreen"), "\x1b[32mgreen");
    EXPECT_EQ(transcoder.PendingBytes(), 0u);
    EXPECT_EQ(transcoder.Stats().ansi_sequences, 1u);
}

TEST(StreamTranscoder, counts_control_characters) {
    const auto result = Transcode("\x03\x04\x08\tx\x7f", "");
    EXPECT_EQ(result.emitted, "\x03\x04\x08\tx\x7f");
    EXPECT_EQ(result.stats.control_chars, 5u);
    EXPECT_EQ(result.stats.bytes_processed, 6u);
    EXPECT_EQ(result.stats.chunks_processed, 1u);
}

TEST(StreamTranscoder, malformed_bytes_pass_through_and_are_counted) {
    StreamTranscoder transcoder;
    EXPECT_EQ(transcoder.Feed("a\xff" "b\xc3(c"), "a\xff" "b\xc3(c");
    EXPECT_EQ(transcoder.Stats().decode_errors, 2u);
}

TEST(StreamTranscoder, flush_emits_truncated_sequence_verbatim) {
    StreamTranscoder transcoder;
    EXPECT_EQ(transcoder.Feed("x\xe4\xb8"), "x");
    EXPECT_EQ(transcoder.Flush(), "\xe4\xb8");
    EXPECT_EQ(transcoder.Stats().decode_errors, 1u);
    EXPECT_EQ(transcoder.Flush(), "");
}

TEST(StreamTranscoder, crlf_normalization_spans_chunks) {
    TranscodeOptions options;
    options.line_endings = LineEndings::kCrlfToLf;
    StreamTranscoder transcoder(options);
    EXPECT_EQ(transcoder.Feed("one\r"), "one");
    EXPECT_EQ(transcoder.Feed("\ntwo\rthree"), "\ntwo\rthree");
    EXPECT_EQ(transcoder.Flush(), "");
}

TEST(StreamTranscoder, line_endings_are_not_rewritten_inside_escape_sequences) {
    TranscodeOptions options;
    options.line_endings = LineEndings::kAllToLf;
    const auto result = Transcode("\x1b]0;a\rb\x07x\ry", "", options);
    EXPECT_EQ(result.emitted, "\x1b]0;a\rb\x07x\ny");
}

TEST(StreamTranscoder, lone_escape_key_is_not_delayed_for_keyboard_input) {
    TranscodeOptions options;
    options.hold_trailing_escape = false;
    StreamTranscoder transcoder(options);
    EXPECT_EQ(transcoder.Feed("\x1b"), "\x1b");
    EXPECT_EQ(transcoder.PendingBytes(), 0u);

    StreamTranscoder holding;
    EXPECT_EQ(holding.Feed("\x1b"), "");
    EXPECT_EQ(holding.Feed("[A"), "\x1b[A");
}

TEST(StreamTranscoder, unterminated_string_sequence_is_released_after_limit) {
    TranscodeOptions options;
    options.max_pending_bytes = 16;
    const std::string osc = "\x1b]0;" + std::string(32, 'x');
    const auto result = Transcode(osc, "", options);
    EXPECT_EQ(result.emitted, osc);
    EXPECT_TRUE(result.tail.empty());
    EXPECT_EQ(result.stats.decode_errors, 1u);
}

TEST(Utf8, truncation_respects_character_boundaries) {
    bool truncated = false;
    EXPECT_EQ(codejoin::stream::TruncateUtf8("a\xc3\xa9", 2, &truncated), "a");
    EXPECT_TRUE(truncated);
    EXPECT_EQ(codejoin::stream::TruncateUtf8("\xf0\x9f\x98\x80z", 4, &truncated), "\xf0\x9f\x98\x80");
    EXPECT_TRUE(truncated);
    EXPECT_EQ(codejoin::stream::TruncateUtf8("short", 10, &truncated), "short");
    EXPECT_FALSE(truncated);
}

TEST(Utf8, strip_unsafe_controls_keeps_layout_and_color) {
    EXPECT_EQ(codejoin::stream::StripUnsafeControls(std::string("a\0b\x07\t\x1b[1mc\r\n", 12)),
              "ab\t\x1b[1mc\r\n");
}
