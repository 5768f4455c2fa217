#include "star/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "star/base-fd.hpp"
#include "star/errno-throw.hpp"
#include "star/log.hpp"

namespace star {

namespace {

BaseFd OpenReadOnly(std::string_view path) {
  const std::string pathStr(path);
  BaseFd fd(::open(pathStr.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) {
    ThrowErrno("Unable to open file '{}'", path);
  }
  log::debug("Opened file '{}' with fd # {}", path, fd.fd());
  return fd;
}

}  // namespace

File::File(std::string_view path) : _fd(OpenReadOnly(path)) {}

std::size_t File::size() const {
  struct stat st{};
  if (::fstat(_fd.fd(), &st) == -1) {
    ThrowErrno("fstat failed on fd # {}", _fd.fd());
  }
  return static_cast<std::uint64_t>(st.st_size);
}

std::string File::loadAllContent() const {
  if (!_fd) {
    throw std::logic_error("File is not opened");
  }

  std::string content;
  content.reserve(size());

  static constexpr std::size_t kBufSize = 8192;
  char buf[kBufSize];
  for (;;) {
    const ssize_t nbRead = ::read(_fd.fd(), buf, kBufSize);
    if (nbRead == 0) {
      break;
    }
    if (nbRead == -1) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("read failed on fd # {}", _fd.fd());
    }
    content.append(buf, static_cast<std::size_t>(nbRead));
  }
  return content;
}

}  // namespace star
