#pragma once

#include <cstddef>
#include <string_view>

namespace star {

// ASCII only: method names and header field names are never localized.
constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

// Compares method names or header field names, ignoring ASCII case.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace star
