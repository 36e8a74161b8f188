#pragma once

#include <optional>
#include <string>

#include "PropertyMap.hpp"
#include "TextSink.hpp"

/**
 * PropertiesWriter
 * ----------------
 * Serializes a PropertyMap in the properties text format:
 *
 *     #<comments>            (only when comments are given)
 *     #<dateLine>
 *     key=value              (one per entry, in the map's key order)
 *
 * The date line is always produced here; callers that want it gone wrap
 * the sink in a DateSuppressingWriter.
 */
class PropertiesWriter {
public:
    static void store(const PropertyMap& source,
                      TextSink& sink,
                      const std::optional<std::string>& comments,
                      bool escapeUnicode,
                      const std::string& dateLine);

    /**
     * Writes comment text as one or more '#' lines.
     * Characters above U+00FF become \uXXXX; "\n", "\r" and "\r\n" start a
     * new comment line, which gets its own '#' unless the text already
     * continues with '#' or '!'.
     */
    static void writeComments(TextSink& sink, const std::u32string& comments);
};
