#pragma once

#include <cstdint>
#include <istream>
#include <ostream>

#include "OrderedProperties.hpp"

/*
------------------------------------------------------------------------------
  SNAPSHOT FORMAT (version 1)
------------------------------------------------------------------------------

Binary image of a store, integers big-endian:

    "OPRS"               magic, 4 bytes
    u8   version         = 1
    u8   ordering        0 = insertion order, 1 = custom comparator
    u8   suppressDate    0 / 1
    u32  count
    count × { u32 keyLen, key bytes, u32 valueLen, value bytes }

Entries are written in iteration order, so an insertion-ordered store
comes back in the same order. A comparator cannot be written; reading a
comparator-ordered snapshot needs the caller to supply one again.
The snapshot must be the whole remaining stream: bytes after the last
entry are rejected.
------------------------------------------------------------------------------
*/
class PropertiesSnapshot {
public:
    static constexpr std::uint8_t VERSION = 1;

    // Throws IoFailure if the stream goes bad.
    static void write(const OrderedProperties& props, std::ostream& out);

    /**
     * Rebuilds a store from a snapshot.
     *
     * Throws InvalidRestoredState on empty input, a wrong magic or version,
     * truncated or trailing data, or a comparator-ordered snapshot read
     * without a comparator.
     */
    static OrderedProperties read(std::istream& in, KeyComparator comparator = nullptr);
};
