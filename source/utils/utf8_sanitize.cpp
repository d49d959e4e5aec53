#include "utils/utf8_sanitize.hpp"

#include <cstdint>

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD
const char kTruncationMarker[] = "\n...[truncated]";

bool in_range(unsigned char byte, unsigned char low, unsigned char high) {
    return byte >= low && byte <= high;
}

// Length of the well-formed UTF-8 sequence starting at text[offset], or 0 when
// the bytes there do not form one. Follows the Unicode table of well-formed
// byte sequences, so overlong forms and surrogates are rejected.
size_t sequence_length(const std::string &text, size_t offset) {
    const unsigned char lead = static_cast<unsigned char>(text[offset]);
    const size_t remaining = text.size() - offset;

    if (lead < 0x80u) {
        return 1;
    }

    auto byte_at = [&](size_t index) { return static_cast<unsigned char>(text[offset + index]); };

    if (in_range(lead, 0xC2u, 0xDFu)) {
        return (remaining >= 2 && in_range(byte_at(1), 0x80u, 0xBFu)) ? 2 : 0;
    }

    if (in_range(lead, 0xE0u, 0xEFu)) {
        if (remaining < 3) {
            return 0;
        }
        unsigned char low = 0x80u;
        unsigned char high = 0xBFu;
        if (lead == 0xE0u) {
            low = 0xA0u;
        } else if (lead == 0xEDu) {
            high = 0x9Fu;
        }
        return (in_range(byte_at(1), low, high) && in_range(byte_at(2), 0x80u, 0xBFu)) ? 3 : 0;
    }

    if (in_range(lead, 0xF0u, 0xF4u)) {
        if (remaining < 4) {
            return 0;
        }
        unsigned char low = 0x80u;
        unsigned char high = 0xBFu;
        if (lead == 0xF0u) {
            low = 0x90u;
        } else if (lead == 0xF4u) {
            high = 0x8Fu;
        }
        return (in_range(byte_at(1), low, high) && in_range(byte_at(2), 0x80u, 0xBFu) &&
                in_range(byte_at(3), 0x80u, 0xBFu)) ? 4 : 0;
    }

    return 0;
}

} // namespace

void sanitize(std::string &text) {
    std::string result;
    result.reserve(text.size());

    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = sequence_length(text, offset);
        if (length == 0) {
            result.append(kReplacement);
            ++offset;
            continue;
        }
        result.append(text, offset, length);
        offset += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

std::string truncate(const std::string &text, size_t maximum_bytes) {
    if (text.size() <= maximum_bytes) {
        return text;
    }

    // Back up over continuation bytes so the cut lands on a sequence boundary.
    size_t cut = maximum_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    return text.substr(0, cut) + kTruncationMarker;
}

} // namespace utf8_sanitize
