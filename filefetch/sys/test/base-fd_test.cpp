#include "filefetch/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

namespace filefetch {

namespace {
bool isOpened(int fd) { return ::fcntl(fd, F_GETFD) != -1; }
}  // namespace

TEST(BaseFdTest, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFdTest, ClosesOnDestruction) {
  int raw;
  {
    BaseFd fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    ASSERT_TRUE(fd);
    raw = fd.fd();
    EXPECT_TRUE(isOpened(raw));
  }
  EXPECT_FALSE(isOpened(raw));
}

TEST(BaseFdTest, MoveTransfersOwnership) {
  BaseFd fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  ASSERT_TRUE(fd);
  const int raw = fd.fd();
  BaseFd other(std::move(fd));
  EXPECT_EQ(other.fd(), raw);
  EXPECT_TRUE(isOpened(raw));

  BaseFd third;
  third = std::move(other);
  EXPECT_EQ(third.fd(), raw);
  third.close();
  EXPECT_FALSE(third);
  EXPECT_FALSE(isOpened(raw));
  third.close();  // idempotent
}

TEST(BaseFdTest, ReleaseDoesNotClose) {
  BaseFd fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  const int raw = fd.release();
  EXPECT_FALSE(fd);
  EXPECT_TRUE(isOpened(raw));
  ::close(raw);
}

TEST(BaseFdTest, FailedOpenIsClosed) {
  BaseFd fd(::open("/nonexistent/filefetch", O_RDONLY | O_CLOEXEC));
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
  EXPECT_FALSE(BaseFd(-42));
}

TEST(BaseFdTest, MoveAssignClosesPreviousDescriptor) {
  BaseFd first(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  BaseFd second(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  const int firstRaw = first.fd();
  const int secondRaw = second.fd();

  first = std::move(second);
  EXPECT_EQ(first.fd(), secondRaw);
  EXPECT_FALSE(isOpened(firstRaw));
  EXPECT_TRUE(isOpened(secondRaw));
}

TEST(BaseFdTest, SelfMoveAssignKeepsDescriptor) {
  BaseFd fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  const int raw = fd.fd();
  BaseFd& alias = fd;
  fd = std::move(alias);
  EXPECT_EQ(fd.fd(), raw);
  EXPECT_TRUE(isOpened(raw));
}

}  // namespace filefetch
