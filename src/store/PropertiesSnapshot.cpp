#include "PropertiesSnapshot.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "../types/PropertiesError.hpp"
#include "../utils/stream.hpp"

namespace {

const char MAGIC[4] = {'O', 'P', 'R', 'S'};

enum class OrderingTag : std::uint8_t {INSERTION = 0, COMPARATOR = 1};

// ----------------------------------------------------
// Encoding helpers
// ----------------------------------------------------
void putU8(std::string& out, std::uint8_t v) {
    out.push_back(static_cast<char>(v));
}

void putU32(std::string& out, std::uint32_t v) {
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

void putString(std::string& out, const std::string& s) {
    putU32(out, static_cast<std::uint32_t>(s.size()));
    out += s;
}

// ----------------------------------------------------
// Decoding helpers
// ----------------------------------------------------
void readExact(std::istream& in, char* dst, std::size_t n) {
    std::size_t got = 0;
    while (got < n) {
        std::size_t step = readBytes(in, dst + got, n - got);
        if (step == 0)
            throw InvalidRestoredState("snapshot data is truncated");
        got += step;
    }
}

std::uint8_t getU8(std::istream& in) {
    char c = 0;
    readExact(in, &c, 1);
    return static_cast<std::uint8_t>(c);
}

std::uint32_t getU32(std::istream& in) {
    char b[4];
    readExact(in, b, 4);
    return (static_cast<std::uint32_t>(static_cast<unsigned char>(b[0])) << 24) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(b[1])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(b[2])) << 8) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(b[3]));
}

std::string getString(std::istream& in) {
    std::uint32_t len = getU32(in);
    std::string s;
    // Grow in chunks so a corrupt length cannot force one huge allocation.
    const std::size_t chunk = 64 * 1024;
    while (s.size() < len) {
        std::size_t n = std::min<std::size_t>(chunk, len - s.size());
        std::size_t at = s.size();
        s.resize(at + n);
        readExact(in, &s[at], n);
    }
    return s;
}

} // namespace

void PropertiesSnapshot::write(const OrderedProperties& props, std::ostream& out) {
    std::string buf;
    buf.append(MAGIC, sizeof(MAGIC));
    putU8(buf, VERSION);
    putU8(buf, static_cast<std::uint8_t>(props.hasCustomOrdering() ? OrderingTag::COMPARATOR
                                                                    : OrderingTag::INSERTION));
    putU8(buf, props.suppressesDate() ? 1 : 0);

    auto entries = props.entries();
    putU32(buf, static_cast<std::uint32_t>(entries.size()));
    for (const auto& [key, value] : entries) {
        putString(buf, key);
        putString(buf, value);
    }

    out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
    out.flush();
    if (!out)
        throw IoFailure("write to snapshot stream failed");
}

OrderedProperties PropertiesSnapshot::read(std::istream& in, KeyComparator comparator) {
    if (!hasMoreBytes(in))
        throw InvalidRestoredState("stream data required");

    char magic[4];
    std::size_t got = readBytes(in, magic, sizeof(magic));
    if (got != sizeof(magic) || !std::equal(magic, magic + 4, MAGIC))
        throw InvalidRestoredState("not a properties snapshot");

    std::uint8_t version = getU8(in);
    if (version != VERSION)
        throw InvalidRestoredState("unsupported snapshot version " + std::to_string(version));

    std::uint8_t ordering = getU8(in);
    std::uint8_t suppressDate = getU8(in);
    if (ordering > static_cast<std::uint8_t>(OrderingTag::COMPARATOR))
        throw InvalidRestoredState("unknown ordering tag " + std::to_string(ordering));
    if (suppressDate > 1)
        throw InvalidRestoredState("invalid suppress-date flag");

    OrderedPropertiesBuilder builder;
    builder.withSuppressDateInComment(suppressDate == 1);
    if (ordering == static_cast<std::uint8_t>(OrderingTag::COMPARATOR)) {
        if (!comparator)
            throw InvalidRestoredState("snapshot uses a custom ordering but no comparator was given");
        builder.withOrdering(std::move(comparator));
    }

    OrderedProperties props = builder.build();
    std::uint32_t count = getU32(in);
    for (std::uint32_t i = 0; i < count; i++) {
        std::string key = getString(in);
        std::string value = getString(in);
        props.set(key, value);
    }
    if (hasMoreBytes(in))
        throw InvalidRestoredState("unexpected data after the last entry");
    return props;
}
