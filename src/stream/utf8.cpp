#include "stream/utf8.hpp"

namespace codejoin::stream {

std::size_t Utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xc2 && lead <= 0xdf) {
        return 2;
    }
    if (lead >= 0xe0 && lead <= 0xef) {
        return 3;
    }
    if (lead >= 0xf0 && lead <= 0xf4) {
        return 4;
    }
    return 0;
}

bool IsValidContinuation(unsigned char lead, std::size_t index, unsigned char byte) {
    if ((byte & 0xc0) != 0x80) {
        return false;
    }
    if (index != 1) {
        return true;
    }
    // Rejects overlong forms, surrogates and code points above U+10FFFF.
    switch (lead) {
        case 0xe0: return byte >= 0xa0;
        case 0xed: return byte <= 0x9f;
        case 0xf0: return byte >= 0x90;
        case 0xf4: return byte <= 0x8f;
        default: return true;
    }
}

bool IsValidUtf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        const auto length = Utf8SequenceLength(lead);
        if (length == 0 || i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            if (!IsValidContinuation(lead, k, static_cast<unsigned char>(text[i + k]))) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

std::size_t Utf8BoundaryAtOrBefore(std::string_view text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text.size();
    }
    std::size_t cut = max_bytes;
    std::size_t steps = 0;
    while (cut > 0 && steps < 3 && (static_cast<unsigned char>(text[cut]) & 0xc0) == 0x80) {
        --cut;
        ++steps;
    }
    if ((static_cast<unsigned char>(text[cut]) & 0xc0) == 0x80) {
        // Not UTF-8 at this position; a byte cut is all we can do.
        return max_bytes;
    }
    return cut;
}

std::string TruncateUtf8(std::string_view text, std::size_t max_bytes, bool* truncated) {
    const auto cut = Utf8BoundaryAtOrBefore(text, max_bytes);
    if (truncated) {
        *truncated = cut < text.size();
    }
    return std::string(text.substr(0, cut));
}

std::string StripUnsafeControls(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        const auto byte = static_cast<unsigned char>(ch);
        const bool control = byte < 0x20 || byte == 0x7f;
        if (control && ch != '\t' && ch != '\n' && ch != '\r' && ch != '\x1b') {
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

}  // namespace codejoin::stream
