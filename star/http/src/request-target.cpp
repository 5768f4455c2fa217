#include "star/request-target.hpp"

#include <string_view>

namespace star {

RequestTarget SplitRequestTarget(std::string_view target) noexcept {
  RequestTarget ret;
  const auto questionPos = target.find('?');
  if (questionPos == std::string_view::npos) {
    ret.path = target;
    return ret;
  }
  ret.path = target.substr(0, questionPos);
  ret.hasQuery = true;
  std::string_view query = target.substr(questionPos + 1);
  // A second '?' ends the query string; what follows it is ignored.
  ret.query = query.substr(0, query.find('?'));
  return ret;
}

}  // namespace star
