#pragma once

#include <cerrno>
#include <format>
#include <string_view>
#include <system_error>

namespace star {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: ThrowErrno("bind failed for {}:{}", address, port);
template <typename... Args>
[[noreturn]] void ThrowErrno(std::string_view fmt, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, std::vformat(fmt, std::make_format_args(args...)));
}

}  // namespace star
