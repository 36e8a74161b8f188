#include "TextSink.hpp"

#include "../types/PropertiesError.hpp"
#include "../utils/utf8.hpp"

StreamSink::StreamSink(std::ostream& out, Encoding encoding)
    : out(out),
      encoding(encoding)
{
}

void StreamSink::write(const std::u32string& text) {
    bytes.clear();
    for (char32_t c : text) {
        if (encoding == Encoding::UTF8)
            appendUtf8(bytes, c);
        else
            bytes.push_back(c <= 0xFF ? static_cast<char>(c) : '?');
    }

    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    check();
}

void StreamSink::flush() {
    out.flush();
    check();
}

void StreamSink::check() {
    if (!out)
        throw IoFailure("write to output stream failed");
}
