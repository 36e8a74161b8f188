#include "PropertiesAdapter.hpp"

#include <stdexcept>

#include "OrderedProperties.hpp"

PropertiesAdapter::PropertiesAdapter(OrderedProperties& target)
    : source(target),
      target(&target)
{
}

PropertiesAdapter::PropertiesAdapter(const OrderedProperties& source)
    : source(source),
      target(nullptr)
{
}

std::optional<std::string> PropertiesAdapter::get(const std::string& key) const {
    return source.get(key);
}

std::optional<std::string> PropertiesAdapter::put(const std::string& key, const std::string& value) {
    if (target == nullptr)
        throw std::logic_error("put on a read-only properties view");
    return target->set(key, value);
}

std::vector<std::string> PropertiesAdapter::keys() const {
    return source.keys();
}
