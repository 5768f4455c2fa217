#include "star/socket-ops.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace star {

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

int64_t SafeRecv(int fd, void* buf, std::size_t len) noexcept {
  for (;;) {
    const auto nbRead = ::recv(fd, buf, len, 0);
    if (nbRead != -1 || errno != EINTR) {
      return static_cast<int64_t>(nbRead);
    }
  }
}

bool SendAll(int fd, std::string_view data) noexcept {
  while (!data.empty()) {
    const int64_t nbSent = SafeSend(fd, data.data(), data.size());
    if (nbSent == -1) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(nbSent));
  }
  return true;
}

bool SetReceiveTimeout(int fd, std::chrono::milliseconds timeout) noexcept {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(secs.count());
  tv.tv_usec = static_cast<suseconds_t>(std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs).count());
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

int WaitReadable(int fd, std::chrono::milliseconds timeout) noexcept {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLIN;
  const int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ret == -1 && errno == EINTR) {
    return 0;
  }
  return ret;
}

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace star
