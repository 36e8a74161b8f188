#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "LinkedEntries.hpp"
#include "SortedEntries.hpp"
#include "../types/Encoding.hpp"
#include "../types/Entry.hpp"

class OrderedPropertiesBuilder;

/*
------------------------------------------------------------------------------
  ORDERED PROPERTIES
------------------------------------------------------------------------------

String → string configuration store that reads and writes the ".properties"
text format and iterates its entries in a well-defined order:

  • insertion order (default): the order keys were first added, either by
    set() or top-to-bottom while loading a file
  • comparator order: sorted by a KeyComparator given to the builder

The ordering mode and the suppress-date flag are fixed at construction.

Equality is order sensitive: two stores are equal only if their entry
sequences match element by element.

Not synchronized. Concurrent mutation needs external locking; concurrent
readers without a writer are fine.
------------------------------------------------------------------------------
*/
class OrderedProperties {
public:
    // Insertion order, timestamp comment written on store.
    OrderedProperties();

    // Copies share the source's comparator, if it has one.
    OrderedProperties(const OrderedProperties&) = default;
    OrderedProperties& operator=(const OrderedProperties&) = default;
    OrderedProperties(OrderedProperties&&) = default;
    OrderedProperties& operator=(OrderedProperties&&) = default;

    // --- Entry API ---

    std::optional<std::string> get(const std::string& key) const;
    std::string getOrDefault(const std::string& key, const std::string& defaultValue) const;

    // Returns the previous value of key, if there was one.
    std::optional<std::string> set(const std::string& key, const std::string& value);
    std::optional<std::string> remove(const std::string& key);

    bool contains(const std::string& key) const;
    int size() const;
    bool isEmpty() const;
    void clear();

    std::vector<std::string> keys() const;
    std::vector<Entry> entries() const;

    // --- Behaviour ---

    bool hasCustomOrdering() const;

    // nullptr for insertion-ordered stores.
    const KeyComparator* comparator() const;

    bool suppressesDate() const { return suppressDate; }

    // --- Text format ---

    /**
     * Reads properties text and adds every entry, in file order.
     * LATIN1 reads one byte per character, UTF8 decodes UTF-8 text.
     *
     * Throws MalformedUnicodeEscape or IoFailure; entries read before the
     * failure remain.
     */
    void load(std::istream& in, Encoding encoding = Encoding::LATIN1);

    /**
     * Writes the optional comment block, the timestamp comment (unless this
     * store suppresses it) and one key=value line per entry, in order.
     *
     * LATIN1 escapes every non-ASCII character as \uXXXX; UTF8 writes
     * them as-is. Throws IoFailure.
     */
    void store(std::ostream& out,
               const std::optional<std::string>& comments,
               Encoding encoding = Encoding::LATIN1) const;

    // Debug listing; values longer than 40 characters are shortened.
    void list(std::ostream& out) const;

    // --- Conversion ---

    std::unordered_map<std::string, std::string> toUnorderedMap() const;

    // "{k1=v1, k2=v2}"
    std::string toString() const;

    std::size_t hashCode() const;

    bool operator==(const OrderedProperties& other) const;
    bool operator!=(const OrderedProperties& other) const { return !(*this == other); }

private:
    friend class OrderedPropertiesBuilder;

    OrderedProperties(KeyComparator comparator, bool suppressDate);

    std::variant<LinkedEntries, SortedEntries> properties;
    bool suppressDate;

    template <typename Fn>
    void forEachEntry(Fn&& fn) const {
        std::visit([&](const auto& map) { map.forEach(fn); }, properties);
    }
};

/**
 * Builder for OrderedProperties with non-default behaviour.
 *
 *   auto props = OrderedPropertiesBuilder()
 *                    .withOrdering(std::greater<std::string>())
 *                    .withSuppressDateInComment(true)
 *                    .build();
 */
class OrderedPropertiesBuilder {
public:
    // An empty comparator keeps insertion order.
    OrderedPropertiesBuilder& withOrdering(KeyComparator comparator);
    OrderedPropertiesBuilder& withSuppressDateInComment(bool suppressDate);

    OrderedProperties build() const;

private:
    KeyComparator comparator;
    bool suppressDate = false;
};

namespace std {

template <>
struct hash<OrderedProperties> {
    std::size_t operator()(const OrderedProperties& props) const {
        return props.hashCode();
    }
};

} // namespace std
