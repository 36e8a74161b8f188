#include "EscapeCodec.hpp"

#include "../types/PropertiesError.hpp"
#include "../utils/utf8.hpp"

namespace {

int hexValue(char32_t c) {
    if (c >= '0' && c <= '9') return static_cast<int>(c - '0');
    if (c >= 'a' && c <= 'f') return 10 + static_cast<int>(c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + static_cast<int>(c - 'A');
    return -1;
}

const char32_t hexDigit[] = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'
};

} // namespace

char32_t EscapeCodec::toHex(int nibble) {
    return hexDigit[nibble & 0xF];
}

void EscapeCodec::appendUnicodeEscape(std::u32string& out, char32_t unit) {
    out += U'\\';
    out += U'u';
    out += toHex(static_cast<int>(unit >> 12));
    out += toHex(static_cast<int>(unit >> 8));
    out += toHex(static_cast<int>(unit >> 4));
    out += toHex(static_cast<int>(unit));
}

// ----------------------------------------------------
// Decode
// ----------------------------------------------------
std::u32string EscapeCodec::loadConvert(const std::u32string& in,
                                        std::size_t off,
                                        std::size_t len)
{
    convtBuf.clear();
    if (convtBuf.capacity() < len)
        convtBuf.reserve(len * 2);

    std::size_t end = off + len;

    while (off < end) {
        char32_t c = in[off++];
        if (c != '\\') {
            convtBuf.push_back(c);
            continue;
        }

        if (off == end) {
            convtBuf.push_back('\\');
            break;
        }

        c = in[off++];
        if (c == 'u') {
            char32_t value = 0;
            for (int i = 0; i < 4; i++) {
                if (off == end)
                    throw MalformedUnicodeEscape();
                int digit = hexValue(in[off++]);
                if (digit < 0)
                    throw MalformedUnicodeEscape();
                value = (value << 4) + static_cast<char32_t>(digit);
            }

            if (isLowSurrogate(value) && !convtBuf.empty() && isHighSurrogate(convtBuf.back()))
                convtBuf.back() = combineSurrogates(convtBuf.back(), value);
            else
                convtBuf.push_back(value);
            continue;
        }

        switch (c) {
        case 't': c = '\t'; break;
        case 'r': c = '\r'; break;
        case 'n': c = '\n'; break;
        case 'f': c = '\f'; break;
        default: break;
        }
        convtBuf.push_back(c);
    }

    return convtBuf;
}

// ----------------------------------------------------
// Encode
// ----------------------------------------------------
std::u32string EscapeCodec::saveConvert(const std::u32string& text,
                                        bool escapeSpace,
                                        bool escapeUnicode)
{
    std::u32string out;
    out.reserve(text.size() * 2);

    for (std::size_t x = 0; x < text.size(); x++) {
        char32_t c = text[x];

        // Common case first: '>' .. '~' needs no escape except the backslash.
        if (c > 61 && c < 127) {
            if (c == '\\')
                out += U"\\\\";
            else
                out += c;
            continue;
        }

        switch (c) {
        case ' ':
            if (x == 0 || escapeSpace)
                out += U'\\';
            out += U' ';
            break;
        case '\t': out += U"\\t"; break;
        case '\n': out += U"\\n"; break;
        case '\r': out += U"\\r"; break;
        case '\f': out += U"\\f"; break;
        case '=':
        case ':':
        case '#':
        case '!':
            out += U'\\';
            out += c;
            break;
        default:
            if ((c < 0x0020 || c > 0x007E) && escapeUnicode) {
                if (c > 0xFFFF) {
                    // Outside the BMP: written as a UTF-16 surrogate pair.
                    char32_t v = c - 0x10000;
                    appendUnicodeEscape(out, 0xD800 + (v >> 10));
                    appendUnicodeEscape(out, 0xDC00 + (v & 0x3FF));
                } else {
                    appendUnicodeEscape(out, c);
                }
            } else {
                out += c;
            }
        }
    }

    return out;
}
