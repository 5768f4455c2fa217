#include "star/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace star {

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1 || errno != EBADF; }

}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ClosesOnDestruction) {
  int pipeFds[2];
  ASSERT_EQ(::pipe(pipeFds), 0);
  {
    BaseFd rd(pipeFds[0]);
    BaseFd wr(pipeFds[1]);
    EXPECT_TRUE(rd);
    EXPECT_TRUE(wr);
  }
  EXPECT_FALSE(IsOpen(pipeFds[0]));
  EXPECT_FALSE(IsOpen(pipeFds[1]));
}

TEST(BaseFd, MoveTransfersOwnership) {
  int pipeFds[2];
  ASSERT_EQ(::pipe(pipeFds), 0);
  BaseFd rd(pipeFds[0]);
  BaseFd wr(pipeFds[1]);

  BaseFd moved(std::move(rd));
  EXPECT_EQ(moved.fd(), pipeFds[0]);
  EXPECT_FALSE(rd);  // NOLINT(bugprone-use-after-move)

  BaseFd assigned;
  assigned = std::move(wr);
  EXPECT_EQ(assigned.fd(), pipeFds[1]);
  EXPECT_FALSE(wr);  // NOLINT(bugprone-use-after-move)
}

TEST(BaseFd, ReleaseDoesNotClose) {
  int pipeFds[2];
  ASSERT_EQ(::pipe(pipeFds), 0);
  int raw;
  {
    BaseFd rd(pipeFds[0]);
    raw = rd.release();
    EXPECT_FALSE(rd);
  }
  EXPECT_TRUE(IsOpen(raw));
  ::close(raw);
  ::close(pipeFds[1]);
}

TEST(BaseFd, CloseIsIdempotent) {
  int pipeFds[2];
  ASSERT_EQ(::pipe(pipeFds), 0);
  BaseFd rd(pipeFds[0]);
  rd.close();
  rd.close();
  EXPECT_FALSE(rd);
  ::close(pipeFds[1]);
}

}  // namespace star
