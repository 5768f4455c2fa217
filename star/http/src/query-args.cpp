#include "star/query-args.hpp"

#include <string>
#include <string_view>

namespace star {

QueryArgs ParseQueryArgs(std::string_view query) {
  QueryArgs args;
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view part = query.substr(0, ampPos);
    const auto eqPos = part.find('=');
    if (eqPos != std::string_view::npos) {
      args.insert_or_assign(std::string(part.substr(0, eqPos)), std::string(part.substr(eqPos + 1)));
    }
    if (ampPos == std::string_view::npos) {
      break;
    }
    query.remove_prefix(ampPos + 1);
  }
  return args;
}

}  // namespace star
