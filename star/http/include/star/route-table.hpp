#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "star/http-method.hpp"
#include "star/path-handlers.hpp"
#include "star/path-pattern.hpp"

namespace star {

struct RouteEntry {
  // Normalized pattern (one trailing slash stripped).
  std::string pattern;

  // Compiled once at registration. Empty if compilation failed, in which case compileError
  // holds the reason, reported when a request reaches this route.
  std::optional<CompiledPattern> compiled;
  std::string compileError;

  RequestHandler handler;
};

// Per-method mapping from normalized pattern to handler, iterated in insertion order.
class RouteTable {
 public:
  // Store handler under (method, normalized pattern).
  // An existing entry for the same key keeps its position and gets the new handler.
  void add(http::Method method, std::string_view pattern, RequestHandler handler);

  // Entries registered for method, in insertion order.
  [[nodiscard]] std::span<const RouteEntry> candidates(http::Method method) const noexcept {
    return _routes[http::MethodToIdx(method)];
  }

  // Total number of (method, pattern) entries.
  [[nodiscard]] std::size_t size() const noexcept;

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  void clear() noexcept;

 private:
  std::array<std::vector<RouteEntry>, http::kNbMethods> _routes;
  std::array<std::unordered_map<std::string, std::size_t>, http::kNbMethods> _positions;
};

}  // namespace star
