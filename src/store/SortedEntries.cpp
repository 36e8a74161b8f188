#include "SortedEntries.hpp"

#include <utility>

SortedEntries::SortedEntries(KeyComparator comparator)
    : entries(KeyLess{std::make_shared<const KeyComparator>(std::move(comparator))})
{
}

const std::string* SortedEntries::find(const std::string& key) const {
    auto it = entries.find(key);
    if (it == entries.end())
        return nullptr;
    return &it->second;
}

std::optional<std::string> SortedEntries::put(const std::string& key, const std::string& value) {
    auto it = entries.find(key);
    if (it != entries.end()) {
        std::string previous = std::move(it->second);
        it->second = value;
        return previous;
    }

    entries.emplace(key, value);
    return std::nullopt;
}

std::optional<std::string> SortedEntries::erase(const std::string& key) {
    auto it = entries.find(key);
    if (it == entries.end())
        return std::nullopt;

    std::string previous = std::move(it->second);
    entries.erase(it);
    return previous;
}
