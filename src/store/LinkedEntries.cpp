#include "LinkedEntries.hpp"

#include <utility>

LinkedEntries::LinkedEntries(const LinkedEntries& other)
    : entries(other.entries)
{
    rebuildIndex();
}

LinkedEntries& LinkedEntries::operator=(const LinkedEntries& other) {
    if (this != &other) {
        entries = other.entries;
        rebuildIndex();
    }
    return *this;
}

void LinkedEntries::rebuildIndex() {
    index.clear();
    index.reserve(entries.size());
    for (auto it = entries.begin(); it != entries.end(); ++it)
        index.emplace(it->first, it);
}

const std::string* LinkedEntries::find(const std::string& key) const {
    auto it = index.find(key);
    if (it == index.end())
        return nullptr;
    return &it->second->second;
}

std::optional<std::string> LinkedEntries::put(const std::string& key, const std::string& value) {
    auto it = index.find(key);
    if (it != index.end()) {
        std::string previous = std::move(it->second->second);
        it->second->second = value;
        return previous;
    }

    entries.emplace_back(key, value);
    index.emplace(key, std::prev(entries.end()));
    return std::nullopt;
}

std::optional<std::string> LinkedEntries::erase(const std::string& key) {
    auto it = index.find(key);
    if (it == index.end())
        return std::nullopt;

    std::string previous = std::move(it->second->second);
    entries.erase(it->second);
    index.erase(it);
    return previous;
}

void LinkedEntries::clear() {
    entries.clear();
    index.clear();
}
