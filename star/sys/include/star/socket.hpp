#pragma once

#include <cstdint>
#include <string_view>

#include "star/base-fd.hpp"

namespace star {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::invalid_argument for an unknown type, std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to bindAddress (dotted IPv4, e.g. "0.0.0.0") and start listening.
  // If port is 0, an ephemeral port is chosen and written back into the argument.
  // Throws std::invalid_argument for a malformed address, std::system_error on failure.
  void bindAndListen(std::string_view bindAddress, bool reusePort, uint16_t& port);

  // Accept one pending connection.
  // Never throws: returns a closed BaseFd when nothing is pending (non-blocking sockets), when interrupted,
  // or when the connection cannot be accepted (failure logged, errno preserved).
  [[nodiscard]] BaseFd accept() const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace star
