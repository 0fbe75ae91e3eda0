#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at position, or 0.
// Rejects overlong forms and surrogates, not just bad continuation bytes.
size_t sequence_length(const std::string &text, size_t position) {
    unsigned char lead = static_cast<unsigned char>(text[position]);
    size_t remaining = text.size() - position;

    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;
    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu;
    } else if (lead >= 0xE1u && lead <= 0xEFu) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu;
    } else if (lead >= 0xF1u && lead <= 0xF3u) {
        length = 4;
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }
    unsigned char second = static_cast<unsigned char>(text[position + 1]);
    if (second < second_low || second > second_high) {
        return 0;
    }
    for (size_t offset = 2; offset < length; ++offset) {
        unsigned char continuation = static_cast<unsigned char>(text[position + offset]);
        if ((continuation & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

std::string sanitize(const std::string &text) {
    std::string result;
    result.reserve(text.size());

    size_t position = 0;
    while (position < text.size()) {
        size_t length = sequence_length(text, position);
        if (length == 0) {
            result += kReplacement;
            ++position;
            continue;
        }
        result.append(text, position, length);
        position += length;
    }
    return result;
}

bool is_valid(const std::string &text) {
    size_t position = 0;
    while (position < text.size()) {
        size_t length = sequence_length(text, position);
        if (length == 0) {
            return false;
        }
        position += length;
    }
    return true;
}

} // namespace utf8_sanitize
