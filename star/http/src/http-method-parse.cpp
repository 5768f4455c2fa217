#include "star/http-method-parse.hpp"

#include <optional>
#include <string_view>

#include "star/http-method.hpp"
#include "star/string-equal-ignore-case.hpp"

namespace star::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:
      return CaseInsensitiveEqual(str, "GET") ? std::optional<Method>(Method::GET) : std::nullopt;
    case 4:
      return CaseInsensitiveEqual(str, "POST") ? std::optional<Method>(Method::POST) : std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace star::http
