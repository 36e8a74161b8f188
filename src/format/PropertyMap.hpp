#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * PropertyMap
 * -----------
 * The narrow view of a store that the parser and the serializer work
 * against: look up, insert/overwrite, and enumerate keys in order.
 *
 * Neither side knows which container sits behind it.
 */
class PropertyMap {
public:
    virtual ~PropertyMap() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;

    // Inserts or overwrites. Returns the previous value, if any.
    virtual std::optional<std::string> put(const std::string& key, const std::string& value) = 0;

    // Keys in the store's iteration order.
    virtual std::vector<std::string> keys() const = 0;
};
