#include "star/errno-throw.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

namespace star {

TEST(ErrnoThrow, CapturesErrnoAndFormatsMessage) {
  errno = ENOENT;
  try {
    ThrowErrno("cannot open {} (attempt {})", "error.html", 2);
    FAIL() << "ThrowErrno must throw";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), ENOENT);
    EXPECT_TRUE(std::string(ex.what()).starts_with("cannot open error.html (attempt 2)"));
  }
}

}  // namespace star
