#pragma once

#include <cstddef>
#include <string>

#include "LineReader.hpp"
#include "PropertyMap.hpp"

// Where a logical line splits into key and value.
struct KeyValueSplit {
    std::size_t keyLen;      // key occupies [0, keyLen)
    std::size_t valueStart;  // value occupies [valueStart, line.size())
};

class PropertiesParser {
public:
    /**
     * Finds the key/value boundary of one logical line.
     *
     * The key ends at the first unescaped '=', ':', space, tab or form-feed.
     * After it, whitespace is skipped, at most one separator is consumed,
     * and whitespace is skipped again. So all of
     *     key=value   key:value   key value   key = value   key
     * split the same way (the last one with an empty value).
     */
    static KeyValueSplit splitLine(const std::u32string& line);

    /**
     * Reads every logical line and puts the decoded pair into `target`.
     * A later duplicate key overwrites the earlier value.
     *
     * Throws MalformedUnicodeEscape from the decoder; entries put before
     * the failing line stay in `target`.
     */
    static void load(LineReader& reader, PropertyMap& target);
};
