#pragma once

#include <string_view>

namespace star {

struct RequestTarget {
  std::string_view path;   // everything before the first '?'
  std::string_view query;  // text between the first '?' and the next '?' (if any)
  bool hasQuery{false};
};

// Split a raw request target ("/path?query") into its path and query parts.
// Views point into target.
RequestTarget SplitRequestTarget(std::string_view target) noexcept;

// Strip exactly one trailing slash. Interior slashes are never touched, and "/" becomes "".
constexpr std::string_view NormalizePath(std::string_view path) noexcept {
  if (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path;
}

}  // namespace star
