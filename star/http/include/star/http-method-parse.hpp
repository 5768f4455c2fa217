#pragma once

#include <optional>
#include <string_view>

#include "star/http-method.hpp"

namespace star::http {

// Attempt to parse one of the supported HTTP methods, case-insensitively.
// Returns std::nullopt for any other token.
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace star::http
