#pragma once

#include <functional>
#include <string>
#include <utility>

// One key/value declaration. Both sides are UTF-8 and may be empty.
using Entry = std::pair<std::string, std::string>;

// Strict "less than" ordering over keys, used for comparator-ordered stores.
using KeyComparator = std::function<bool(const std::string&, const std::string&)>;
