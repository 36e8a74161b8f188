#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "../types/Entry.hpp"

/*
------------------------------------------------------------------------------
  SORTED ENTRIES (comparator order)
------------------------------------------------------------------------------

A std::map whose ordering is a caller-supplied KeyComparator. Iteration is
always sorted by that comparator, whatever the insertion sequence.

The comparator lives behind a shared_ptr: copies of a store share the same
callable instead of cloning it.
------------------------------------------------------------------------------
*/
class SortedEntries {
public:
    explicit SortedEntries(KeyComparator comparator);

    const std::string* find(const std::string& key) const;
    std::optional<std::string> put(const std::string& key, const std::string& value);
    std::optional<std::string> erase(const std::string& key);
    std::size_t size() const { return entries.size(); }
    void clear() { entries.clear(); }

    const KeyComparator& comparator() const { return *entries.key_comp().compare; }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (const auto& e : entries)
            fn(e.first, e.second);
    }

private:
    struct KeyLess {
        std::shared_ptr<const KeyComparator> compare;

        bool operator()(const std::string& a, const std::string& b) const {
            return (*compare)(a, b);
        }
    };

    std::map<std::string, std::string, KeyLess> entries;
};
