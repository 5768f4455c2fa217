#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "star/base-fd.hpp"

namespace star {

// Read-only file, used to load templates from disk at startup.
class File {
 public:
  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path for reading.
  // Throws std::system_error if it cannot be opened.
  explicit File(std::string_view path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the current file size in bytes.
  // Throws std::system_error on failure.
  [[nodiscard]] std::size_t size() const;

  // Read the whole file content from its current offset.
  // Throws std::system_error on read failure, std::logic_error if the File is closed.
  [[nodiscard]] std::string loadAllContent() const;

 private:
  BaseFd _fd;
};

}  // namespace star
