#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace star {

// Converted value of one path placeholder, in the order the placeholders appear in the pattern.
//  - int64_t for <int:...>
//  - double for <float:...>
//  - std::string for <string:...> and untyped <...> placeholders
using PathValue = std::variant<int64_t, double, std::string>;

// Textual rendition of a PathValue (integers in decimal, floats in shortest round-trip form).
std::string PathValueToString(const PathValue& value);

}  // namespace star
