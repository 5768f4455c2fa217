#include "star/path-value.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <type_traits>
#include <variant>

namespace star {

std::string PathValueToString(const PathValue& value) {
  return std::visit(
      []<typename T>(const T& val) -> std::string {
        if constexpr (std::is_same_v<T, std::string>) {
          return val;
        } else {
          return std::format("{}", val);
        }
      },
      value);
}

}  // namespace star
