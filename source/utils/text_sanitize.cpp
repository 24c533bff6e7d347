#include "utils/text_sanitize.hpp"

#include <cstdio>

namespace text_sanitize {

namespace {

const char kReplacementCharacter[] = "\xEF\xBF\xBD"; // U+FFFD
const char kTruncationMarker[] = "...";

bool in_range(unsigned char byte, unsigned char low, unsigned char high) {
    return byte >= low && byte <= high;
}

// Length in bytes of the well-formed UTF-8 sequence starting at offset,
// or 0 if the bytes there do not form one.
size_t valid_sequence_length(const std::string &text, size_t offset) {
    const unsigned char lead = static_cast<unsigned char>(text[offset]);
    const size_t remaining = text.size() - offset;

    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;

    if (in_range(lead, 0xC2u, 0xDFu)) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (in_range(lead, 0xE1u, 0xECu) || in_range(lead, 0xEEu, 0xEFu)) {
        length = 3;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu; // excludes UTF-16 surrogates
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (in_range(lead, 0xF1u, 0xF3u)) {
        length = 4;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu; // caps at U+10FFFF
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }
    if (!in_range(static_cast<unsigned char>(text[offset + 1]), second_low, second_high)) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if (!in_range(static_cast<unsigned char>(text[offset + index]), 0x80u, 0xBFu)) {
            return 0;
        }
    }
    return length;
}

void append_escaped_control(std::string &output, unsigned char byte) {
    if (byte == '\n') {
        output += "\\n";
    } else if (byte == '\r') {
        output += "\\r";
    } else {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\x%02X", static_cast<unsigned int>(byte));
        output += escaped;
    }
}

} // namespace

bool is_valid_utf8(const std::string &text) {
    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = valid_sequence_length(text, offset);
        if (length == 0) {
            return false;
        }
        offset += length;
    }
    return true;
}

std::string printable_excerpt(const std::string &raw, size_t maximum_length) {
    std::string output;
    output.reserve(raw.size() < maximum_length ? raw.size() : maximum_length);

    size_t offset = 0;
    while (offset < raw.size()) {
        size_t length = valid_sequence_length(raw, offset);
        std::string piece;

        if (length == 0) {
            piece = kReplacementCharacter;
            length = 1;
        } else if (length == 1) {
            unsigned char byte = static_cast<unsigned char>(raw[offset]);
            if ((byte < 0x20u && byte != '\t') || byte == 0x7Fu) {
                append_escaped_control(piece, byte);
            } else {
                piece.assign(1, static_cast<char>(byte));
            }
        } else {
            piece = raw.substr(offset, length);
        }

        if (output.size() + piece.size() > maximum_length) {
            output += kTruncationMarker;
            return output;
        }
        output += piece;
        offset += length;
    }

    return output;
}

} // namespace text_sanitize
