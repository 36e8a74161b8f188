#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

#include "../types/Entry.hpp"

/*
------------------------------------------------------------------------------
  LINKED ENTRIES (insertion order)
------------------------------------------------------------------------------

entries: list of Entry in first-insertion order
index:   key → iterator into entries, for O(1) lookup / update / erase

Overwriting a key keeps its slot. Erasing and re-inserting a key moves it
to the back.
------------------------------------------------------------------------------
*/
class LinkedEntries {
public:
    LinkedEntries() = default;
    LinkedEntries(const LinkedEntries& other);
    LinkedEntries& operator=(const LinkedEntries& other);
    LinkedEntries(LinkedEntries&&) = default;
    LinkedEntries& operator=(LinkedEntries&&) = default;

    const std::string* find(const std::string& key) const;
    std::optional<std::string> put(const std::string& key, const std::string& value);
    std::optional<std::string> erase(const std::string& key);
    std::size_t size() const { return entries.size(); }
    void clear();

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (const auto& e : entries)
            fn(e.first, e.second);
    }

private:
    std::list<Entry> entries;
    std::unordered_map<std::string, std::list<Entry>::iterator> index;

    void rebuildIndex();
};
