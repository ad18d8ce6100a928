#include "rspd/base-fd.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

namespace rspd {

TEST(BaseFd, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, MoveTransfersOwnership) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);
  BaseFd moved(std::move(rd));
  EXPECT_FALSE(rd);
  EXPECT_EQ(moved.fd(), fds[0]);
  moved = std::move(wr);
  EXPECT_EQ(moved.fd(), fds[1]);
  moved.close();
  moved.close();
  EXPECT_FALSE(moved);
}

TEST(BaseFd, Release) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd rd(fds[0]);
  int raw = rd.release();
  EXPECT_FALSE(rd);
  EXPECT_EQ(::close(raw), 0);
  EXPECT_EQ(::close(fds[1]), 0);
}

}  // namespace rspd
