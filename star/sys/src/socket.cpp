#include "star/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include "star/base-fd.hpp"
#include "star/errno-throw.hpp"
#include "star/log.hpp"

namespace star {

namespace {

int ToNativeType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

constexpr int kListenBacklog = SOMAXCONN;

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ToNativeType(type), protocol)) {
  if (!_baseFd) {
    ThrowErrno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view bindAddress, bool reusePort, uint16_t& port) {
  const int fd = _baseFd.fd();

  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    ThrowErrno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) == -1) {
    log::warn("setsockopt(SO_REUSEPORT) failed on fd # {}, continuing without it", fd);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string addressStr(bindAddress);
  if (::inet_pton(AF_INET, addressStr.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 bind address");
  }

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    ThrowErrno("bind failed for {}:{}", bindAddress, port);
  }
  if (::listen(fd, kListenBacklog) == -1) {
    ThrowErrno("listen failed for {}:{}", bindAddress, port);
  }

  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) == -1) {
      ThrowErrno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("fd # {} listening on {}:{}", fd, bindAddress, port);
}

BaseFd Socket::accept() const {
  const int clientFd = ::accept4(_baseFd.fd(), nullptr, nullptr, SOCK_CLOEXEC);
  if (clientFd == -1) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK || savedErr == EINTR) {
      log::trace("accept on fd # {} would block: {}", _baseFd.fd(), std::strerror(savedErr));
    } else {
      // EMFILE, ENFILE, ENOBUFS, ENOMEM...: the connection stays in the backlog.
      log::error("accept failed on fd # {}: {}", _baseFd.fd(), std::strerror(savedErr));
    }
    errno = savedErr;
    return BaseFd{};
  }
  log::trace("Connection fd # {} accepted on fd # {}", clientFd, _baseFd.fd());
  return BaseFd{clientFd};
}

}  // namespace star
