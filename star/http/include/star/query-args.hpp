#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace star {

using QueryArgs = std::map<std::string, std::string, std::less<>>;

// Parse a raw query string (without the leading '?').
// Parts are separated by '&' and split on their first '='. Parts without '=' are dropped.
// Duplicate keys: last one wins. Nothing is decoded (no percent-escapes, '+' kept as is).
QueryArgs ParseQueryArgs(std::string_view query);

}  // namespace star
