#include "star/route-table.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "star/http-method.hpp"
#include "star/log.hpp"
#include "star/path-handlers.hpp"
#include "star/path-pattern.hpp"
#include "star/request-target.hpp"
#include "star/router-errors.hpp"

namespace star {

void RouteTable::add(http::Method method, std::string_view pattern, RequestHandler handler) {
  const auto methodIdx = http::MethodToIdx(method);
  auto& routes = _routes[methodIdx];
  auto& positions = _positions[methodIdx];

  std::string normalized(NormalizePath(pattern));

  const auto posIt = positions.find(normalized);
  if (posIt != positions.end()) {
    log::debug("Replacing handler of {} '{}'", http::MethodToStr(method), normalized);
    routes[posIt->second].handler = std::move(handler);
    return;
  }

  RouteEntry entry;
  try {
    entry.compiled = CompilePattern(normalized);
  } catch (const UnknownConverterKind& ex) {
    log::warn("Pattern '{}' cannot be compiled: {}. Every {} request reaching it without an exact match, "
              "including requests meant for routes registered after it, will get a 500 error page",
              normalized, ex.what(), http::MethodToStr(method));
    entry.compileError = ex.what();
  }
  entry.pattern = normalized;
  entry.handler = std::move(handler);

  positions.emplace(std::move(normalized), routes.size());
  routes.push_back(std::move(entry));
  log::debug("Registered {} '{}' at position {}", http::MethodToStr(method), routes.back().pattern,
             routes.size() - 1U);
}

std::size_t RouteTable::size() const noexcept {
  std::size_t total = 0;
  for (const auto& routes : _routes) {
    total += routes.size();
  }
  return total;
}

void RouteTable::clear() noexcept {
  for (auto& routes : _routes) {
    routes.clear();
  }
  for (auto& positions : _positions) {
    positions.clear();
  }
}

}  // namespace star
