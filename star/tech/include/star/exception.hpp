#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <iterator>
#include <utility>

namespace star {

// Base exception of the library.
// The message is stored inline (no dynamic allocation) and truncated with "..." when it does not fit.
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto res = std::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (res.size > static_cast<std::ptrdiff_t>(kMsgMaxLen)) {
      static constexpr char kEllipsis[] = "...";
      std::copy(std::begin(kEllipsis), std::end(kEllipsis), _data + kMsgMaxLen - (std::size(kEllipsis) - 1));
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace star
