#include "stream/stream_transcoder.hpp"

#include <algorithm>
#include <cstdio>

#include "stream/utf8.hpp"
#include "utils/logging.hpp"

namespace codejoin::stream {
namespace {

enum class ScanStatus {
    kComplete,
    kIncomplete,
    kMalformed,
    kLoneEscape
};

struct EscapeScan {
    ScanStatus status = ScanStatus::kIncomplete;
    std::size_t length = 0;
};

bool InRange(unsigned char byte, unsigned char low, unsigned char high) {
    return byte >= low && byte <= high;
}

EscapeScan ScanStringSequence(std::string_view data, std::size_t start) {
    // OSC/DCS/SOS/PM/APC payloads end with BEL or ST (ESC \).
    for (std::size_t j = start + 2; j < data.size(); ++j) {
        const auto byte = static_cast<unsigned char>(data[j]);
        if (byte == 0x07) {
            return {ScanStatus::kComplete, j - start + 1};
        }
        if (byte == 0x1b) {
            if (j + 1 >= data.size()) {
                return {ScanStatus::kIncomplete, 0};
            }
            if (data[j + 1] == '\\') {
                return {ScanStatus::kComplete, j - start + 2};
            }
            return {ScanStatus::kMalformed, j - start};
        }
    }
    return {ScanStatus::kIncomplete, 0};
}

EscapeScan ScanEscapeBody(std::string_view data, std::size_t start) {
    const auto n = data.size();
    if (start + 1 >= n) {
        return {ScanStatus::kIncomplete, 0};
    }
    const auto kind = static_cast<unsigned char>(data[start + 1]);
    switch (kind) {
        case '[': {
            std::size_t j = start + 2;
            while (j < n && InRange(static_cast<unsigned char>(data[j]), 0x20, 0x3f)) {
                ++j;
            }
            if (j >= n) {
                return {ScanStatus::kIncomplete, 0};
            }
            if (InRange(static_cast<unsigned char>(data[j]), 0x40, 0x7e)) {
                return {ScanStatus::kComplete, j - start + 1};
            }
            return {ScanStatus::kMalformed, j - start};
        }
        case ']':
        case 'P':
        case 'X':
        case '^':
        case '_':
            return ScanStringSequence(data, start);
        case 'O': {
            if (start + 2 >= n) {
                return {ScanStatus::kIncomplete, 0};
            }
            if (InRange(static_cast<unsigned char>(data[start + 2]), 0x40, 0x7e)) {
                return {ScanStatus::kComplete, 3};
            }
            return {ScanStatus::kMalformed, 2};
        }
        default:
            break;
    }
    if (InRange(kind, 0x20, 0x2f)) {
        std::size_t j = start + 1;
        while (j < n && InRange(static_cast<unsigned char>(data[j]), 0x20, 0x2f)) {
            ++j;
        }
        if (j >= n) {
            return {ScanStatus::kIncomplete, 0};
        }
        if (InRange(static_cast<unsigned char>(data[j]), 0x30, 0x7e)) {
            return {ScanStatus::kComplete, j - start + 1};
        }
        return {ScanStatus::kMalformed, j - start};
    }
    if (InRange(kind, 0x30, 0x7e)) {
        return {ScanStatus::kComplete, 2};
    }
    return {ScanStatus::kLoneEscape, 1};
}

EscapeScan ScanEscape(std::string_view data, std::size_t start, const TranscodeOptions& options) {
    auto scan = ScanEscapeBody(data, start);
    if (scan.status == ScanStatus::kIncomplete && data.size() - start > options.max_pending_bytes) {
        scan.status = ScanStatus::kMalformed;
        scan.length = data.size() - start;
    }
    return scan;
}

void ReportAnomaly(std::size_t offset, unsigned char byte) {
    if (!utils::IsEnabled(utils::LogLevel::kDebug)) {
        return;
    }
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02x", byte);
    utils::Log(utils::LogLevel::kDebug, "stream", "decode anomaly passed through",
               {{"offset", std::to_string(offset)}, {"byte", hex}});
}

}  // namespace

StreamStats& StreamStats::operator+=(const StreamStats& other) {
    chunks_processed += other.chunks_processed;
    bytes_processed += other.bytes_processed;
    control_chars += other.control_chars;
    ansi_sequences += other.ansi_sequences;
    decode_errors += other.decode_errors;
    return *this;
}

TranscodeResult Transcode(std::string_view chunk,
                          std::string_view previous_tail,
                          const TranscodeOptions& options) {
    TranscodeResult result{};
    result.stats.chunks_processed = 1;
    result.stats.bytes_processed = chunk.size();

    std::string data;
    data.reserve(previous_tail.size() + chunk.size());
    data.append(previous_tail);
    data.append(chunk);
    const std::string_view view(data);
    const auto n = data.size();
    result.emitted.reserve(n);

    std::size_t i = 0;
    while (i < n) {
        const auto byte = static_cast<unsigned char>(data[i]);

        if (byte == 0x1b) {
            const auto scan = ScanEscape(view, i, options);
            switch (scan.status) {
                case ScanStatus::kComplete:
                    ++result.stats.ansi_sequences;
                    result.emitted.append(data, i, scan.length);
                    i += scan.length;
                    break;
                case ScanStatus::kIncomplete:
                    if (!options.hold_trailing_escape && i + 1 == n) {
                        ++result.stats.control_chars;
                        result.emitted.push_back(control::kEscape);
                        ++i;
                    } else {
                        result.tail = data.substr(i);
                        i = n;
                    }
                    break;
                case ScanStatus::kMalformed:
                    ++result.stats.decode_errors;
                    ReportAnomaly(i, byte);
                    result.emitted.append(data, i, scan.length);
                    i += scan.length;
                    break;
                case ScanStatus::kLoneEscape:
                    ++result.stats.control_chars;
                    result.emitted.push_back(control::kEscape);
                    ++i;
                    break;
            }
            continue;
        }

        if (byte == 0x0d && options.line_endings != LineEndings::kPreserve) {
            if (i + 1 >= n) {
                // Could be the first half of CRLF.
                result.tail = data.substr(i);
                break;
            }
            ++result.stats.control_chars;
            if (data[i + 1] == control::kLineFeed) {
                ++result.stats.control_chars;
                result.emitted.push_back(control::kLineFeed);
                i += 2;
                continue;
            }
            result.emitted.push_back(options.line_endings == LineEndings::kAllToLf
                                         ? control::kLineFeed
                                         : control::kCarriageReturn);
            ++i;
            continue;
        }

        if (byte < 0x20 || byte == 0x7f) {
            ++result.stats.control_chars;
            result.emitted.push_back(static_cast<char>(byte));
            ++i;
            continue;
        }

        if (byte < 0x80) {
            result.emitted.push_back(static_cast<char>(byte));
            ++i;
            continue;
        }

        const auto length = Utf8SequenceLength(byte);
        if (length == 0) {
            ++result.stats.decode_errors;
            ReportAnomaly(i, byte);
            result.emitted.push_back(static_cast<char>(byte));
            ++i;
            continue;
        }
        const auto available = std::min(length, n - i);
        bool valid = true;
        for (std::size_t k = 1; k < available; ++k) {
            if (!IsValidContinuation(byte, k, static_cast<unsigned char>(data[i + k]))) {
                valid = false;
                break;
            }
        }
        if (!valid) {
            ++result.stats.decode_errors;
            ReportAnomaly(i, byte);
            result.emitted.push_back(static_cast<char>(byte));
            ++i;
            continue;
        }
        if (available < length) {
            result.tail = data.substr(i);
            break;
        }
        result.emitted.append(data, i, length);
        i += length;
    }
    return result;
}

StreamTranscoder::StreamTranscoder(TranscodeOptions options)
    : options_(options) {}

std::string StreamTranscoder::Feed(std::string_view chunk) {
    auto result = Transcode(chunk, tail_, options_);
    tail_ = std::move(result.tail);
    stats_ += result.stats;
    return std::move(result.emitted);
}

std::string StreamTranscoder::Flush() {
    if (tail_.empty()) {
        return {};
    }
    std::string out;
    if (tail_ == "\r") {
        ++stats_.control_chars;
        out = options_.line_endings == LineEndings::kAllToLf ? "\n" : "\r";
    } else if (tail_.size() == 1 && tail_[0] == control::kEscape) {
        ++stats_.control_chars;
        out = tail_;
    } else {
        ++stats_.decode_errors;
        ReportAnomaly(0, static_cast<unsigned char>(tail_[0]));
        out = tail_;
    }
    tail_.clear();
    return out;
}

}  // namespace codejoin::stream
