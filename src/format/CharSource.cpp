#include "CharSource.hpp"

#include <cstring>

#include "../utils/stream.hpp"
#include "../utils/utf8.hpp"

// ----------------------------------------------------
// ByteBuffer
// ----------------------------------------------------
ByteBuffer::ByteBuffer(std::istream& in, std::size_t chunkSize)
    : in(in),
      chunkSize(chunkSize)
{
    buf.resize(chunkSize);
}

bool ByteBuffer::fill() {
    if (eof)
        return false;

    // Keep unread bytes, append the next chunk behind them.
    std::size_t unread = limit - offset;
    if (unread > 0 && offset > 0)
        std::memmove(buf.data(), buf.data() + offset, unread);
    offset = 0;
    limit = unread;

    if (buf.size() < limit + chunkSize)
        buf.resize(limit + chunkSize);

    std::size_t got = readBytes(in, buf.data() + limit, chunkSize);
    if (got == 0) {
        eof = true;
        return false;
    }
    limit += got;
    return true;
}

std::size_t ByteBuffer::ensure(std::size_t wanted) {
    while (limit - offset < wanted) {
        if (!fill())
            break;
    }
    return limit - offset;
}

// ----------------------------------------------------
// Latin1Source
// ----------------------------------------------------
Latin1Source::Latin1Source(std::istream& in) : bytes(in) {}

bool Latin1Source::next(char32_t& c) {
    if (bytes.ensure(1) == 0)
        return false;
    c = static_cast<unsigned char>(*bytes.data());
    bytes.consume(1);
    return true;
}

// ----------------------------------------------------
// Utf8Source
// ----------------------------------------------------
Utf8Source::Utf8Source(std::istream& in) : bytes(in) {}

bool Utf8Source::next(char32_t& c) {
    // A sequence is at most 4 bytes; make sure a whole one is buffered.
    std::size_t available = bytes.ensure(4);
    if (available == 0)
        return false;

    std::size_t used = 0;
    decodeUtf8At(bytes.data(), available, used, c);
    bytes.consume(used);
    return true;
}

std::unique_ptr<CharSource> makeCharSource(std::istream& in, Encoding encoding) {
    if (encoding == Encoding::UTF8)
        return std::make_unique<Utf8Source>(in);
    return std::make_unique<Latin1Source>(in);
}
