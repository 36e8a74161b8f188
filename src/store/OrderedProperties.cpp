#include "OrderedProperties.hpp"

#include <utility>

#include "PropertiesAdapter.hpp"
#include "../format/CharSource.hpp"
#include "../format/DateSuppressingWriter.hpp"
#include "../format/LineReader.hpp"
#include "../format/PropertiesParser.hpp"
#include "../format/PropertiesWriter.hpp"
#include "../format/TextSink.hpp"
#include "../utils/time.hpp"
#include "../utils/utf8.hpp"

// ----------------------------------------------------
// Construction
// ----------------------------------------------------
OrderedProperties::OrderedProperties()
    : properties(LinkedEntries{}),
      suppressDate(false)
{
}

OrderedProperties::OrderedProperties(KeyComparator comparator, bool suppressDate)
    : properties(LinkedEntries{}),
      suppressDate(suppressDate)
{
    if (comparator)
        properties = SortedEntries(std::move(comparator));
}

// ----------------------------------------------------
// Entry API
// ----------------------------------------------------
std::optional<std::string> OrderedProperties::get(const std::string& key) const {
    const std::string* value = std::visit(
        [&](const auto& map) { return map.find(key); }, properties);
    if (value == nullptr)
        return std::nullopt;
    return *value;
}

std::string OrderedProperties::getOrDefault(const std::string& key,
                                            const std::string& defaultValue) const
{
    auto value = get(key);
    return value ? *value : defaultValue;
}

std::optional<std::string> OrderedProperties::set(const std::string& key, const std::string& value) {
    return std::visit([&](auto& map) { return map.put(key, value); }, properties);
}

std::optional<std::string> OrderedProperties::remove(const std::string& key) {
    return std::visit([&](auto& map) { return map.erase(key); }, properties);
}

bool OrderedProperties::contains(const std::string& key) const {
    return std::visit([&](const auto& map) { return map.find(key) != nullptr; }, properties);
}

int OrderedProperties::size() const {
    return static_cast<int>(std::visit([](const auto& map) { return map.size(); }, properties));
}

bool OrderedProperties::isEmpty() const {
    return size() == 0;
}

void OrderedProperties::clear() {
    std::visit([](auto& map) { map.clear(); }, properties);
}

std::vector<std::string> OrderedProperties::keys() const {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(size()));
    forEachEntry([&](const std::string& key, const std::string&) {
        out.push_back(key);
    });
    return out;
}

std::vector<Entry> OrderedProperties::entries() const {
    std::vector<Entry> out;
    out.reserve(static_cast<std::size_t>(size()));
    forEachEntry([&](const std::string& key, const std::string& value) {
        out.emplace_back(key, value);
    });
    return out;
}

bool OrderedProperties::hasCustomOrdering() const {
    return std::holds_alternative<SortedEntries>(properties);
}

const KeyComparator* OrderedProperties::comparator() const {
    if (auto sorted = std::get_if<SortedEntries>(&properties))
        return &sorted->comparator();
    return nullptr;
}

// ----------------------------------------------------
// Text format
// ----------------------------------------------------
void OrderedProperties::load(std::istream& in, Encoding encoding) {
    auto source = makeCharSource(in, encoding);
    LineReader reader(*source);
    PropertiesAdapter target(*this);
    PropertiesParser::load(reader, target);
}

void OrderedProperties::store(std::ostream& out,
                              const std::optional<std::string>& comments,
                              Encoding encoding) const
{
    PropertiesAdapter source(*this);
    StreamSink sink(out, encoding);
    bool escapeUnicode = (encoding == Encoding::LATIN1);

    if (suppressDate) {
        DateSuppressingWriter filter(sink);
        PropertiesWriter::store(source, filter, comments, escapeUnicode, currentDateComment());
    } else {
        PropertiesWriter::store(source, sink, comments, escapeUnicode, currentDateComment());
    }
}

void OrderedProperties::list(std::ostream& out) const {
    out << "-- listing properties --\n";
    forEachEntry([&](const std::string& key, const std::string& value) {
        std::u32string chars = toCodePoints(value);
        if (chars.size() > 40)
            out << key << '=' << toUtf8(chars.substr(0, 37)) << "...\n";
        else
            out << key << '=' << value << '\n';
    });
}

// ----------------------------------------------------
// Conversion / comparison
// ----------------------------------------------------
std::unordered_map<std::string, std::string> OrderedProperties::toUnorderedMap() const {
    std::unordered_map<std::string, std::string> out;
    out.reserve(static_cast<std::size_t>(size()));
    forEachEntry([&](const std::string& key, const std::string& value) {
        out.emplace(key, value);
    });
    return out;
}

std::string OrderedProperties::toString() const {
    std::string out = "{";
    bool first = true;
    forEachEntry([&](const std::string& key, const std::string& value) {
        if (!first)
            out += ", ";
        first = false;
        out += key;
        out += '=';
        out += value;
    });
    out += '}';
    return out;
}

std::size_t OrderedProperties::hashCode() const {
    std::hash<std::string> hasher;
    std::size_t h = 1;
    forEachEntry([&](const std::string& key, const std::string& value) {
        h = 31 * h + (hasher(key) ^ hasher(value));
    });
    return h;
}

bool OrderedProperties::operator==(const OrderedProperties& other) const {
    if (this == &other)
        return true;
    return entries() == other.entries();
}

// ----------------------------------------------------
// Builder
// ----------------------------------------------------
OrderedPropertiesBuilder& OrderedPropertiesBuilder::withOrdering(KeyComparator comparator) {
    this->comparator = std::move(comparator);
    return *this;
}

OrderedPropertiesBuilder& OrderedPropertiesBuilder::withSuppressDateInComment(bool suppressDate) {
    this->suppressDate = suppressDate;
    return *this;
}

OrderedProperties OrderedPropertiesBuilder::build() const {
    return OrderedProperties(comparator, suppressDate);
}
