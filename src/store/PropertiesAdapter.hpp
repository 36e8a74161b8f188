#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../format/PropertyMap.hpp"

class OrderedProperties;

/**
 * Exposes an OrderedProperties as the PropertyMap the parser and the
 * serializer expect. Every call is forwarded; nothing is copied.
 *
 * Built from a const store it is read-only and put() throws std::logic_error.
 */
class PropertiesAdapter : public PropertyMap {
public:
    explicit PropertiesAdapter(OrderedProperties& target);
    explicit PropertiesAdapter(const OrderedProperties& source);

    std::optional<std::string> get(const std::string& key) const override;
    std::optional<std::string> put(const std::string& key, const std::string& value) override;
    std::vector<std::string> keys() const override;

private:
    const OrderedProperties& source;
    OrderedProperties* target;
};
