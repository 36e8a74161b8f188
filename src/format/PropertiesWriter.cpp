#include "PropertiesWriter.hpp"

#include "EscapeCodec.hpp"
#include "../utils/utf8.hpp"

void PropertiesWriter::writeComments(TextSink& sink, const std::u32string& comments) {
    sink.write(U"#");

    std::size_t len = comments.size();
    std::size_t current = 0;
    std::size_t last = 0;

    while (current < len) {
        char32_t c = comments[current];
        if (c > 0xFF || c == '\n' || c == '\r') {
            if (last != current)
                sink.write(comments.substr(last, current - last));

            if (c > 0xFF) {
                std::u32string escaped;
                if (c > 0xFFFF) {
                    char32_t v = c - 0x10000;
                    EscapeCodec::appendUnicodeEscape(escaped, 0xD800 + (v >> 10));
                    EscapeCodec::appendUnicodeEscape(escaped, 0xDC00 + (v & 0x3FF));
                } else {
                    EscapeCodec::appendUnicodeEscape(escaped, c);
                }
                sink.write(escaped);
            } else {
                sink.newLine();
                if (c == '\r' && current != len - 1 && comments[current + 1] == '\n')
                    current++;
                if (current == len - 1 ||
                    (comments[current + 1] != '#' && comments[current + 1] != '!'))
                    sink.write(U"#");
            }
            last = current + 1;
        }
        current++;
    }

    if (last != current)
        sink.write(comments.substr(last, current - last));
    sink.newLine();
}

void PropertiesWriter::store(const PropertyMap& source,
                             TextSink& sink,
                             const std::optional<std::string>& comments,
                             bool escapeUnicode,
                             const std::string& dateLine)
{
    if (comments)
        writeComments(sink, toCodePoints(*comments));

    sink.write(U"#" + toCodePoints(dateLine));
    sink.newLine();

    for (const auto& key : source.keys()) {
        auto value = source.get(key);
        if (!value)
            continue;

        // Keys escape every space; values only a leading one.
        std::u32string line = EscapeCodec::saveConvert(toCodePoints(key), true, escapeUnicode);
        line += U'=';
        line += EscapeCodec::saveConvert(toCodePoints(*value), false, escapeUnicode);
        sink.write(line);
        sink.newLine();
    }

    sink.flush();
}
