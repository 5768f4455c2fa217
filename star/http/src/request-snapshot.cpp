#include "star/request-snapshot.hpp"

#include <optional>
#include <string_view>

namespace star {

std::optional<std::string_view> RequestSnapshot::queryArg(std::string_view key) const {
  const auto it = _queryArgs.find(key);
  if (it == _queryArgs.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

}  // namespace star
