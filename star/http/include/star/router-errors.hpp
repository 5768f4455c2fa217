#pragma once

#include <format>
#include <utility>

#include "star/exception.hpp"
#include "star/invalid-argument-exception.hpp"

namespace star {

// Raised at registration time for a method name other than GET or POST (case-insensitive).
class InvalidMethod : public invalid_argument {
 public:
  template <typename... Args>
  explicit InvalidMethod(std::format_string<Args...> fmt, Args&&... args)
      : invalid_argument(fmt, std::forward<Args>(args)...) {}
};

// Raised when a pattern references a converter other than int, string or float.
class UnknownConverterKind : public exception {
 public:
  template <typename... Args>
  explicit UnknownConverterKind(std::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

// Raised when captured text violates its converter contract (for instance an int that overflows 64 bits).
class ConversionError : public exception {
 public:
  template <typename... Args>
  explicit ConversionError(std::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace star
