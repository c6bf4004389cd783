#include "runcase/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

using runcase::core::FileDescriptor;

TEST(FileDescriptor, DestructorClosesFd) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  int r = fds[0];
  {
    FileDescriptor fd(r);
  }
  errno  = 0;
  int rc = close(r);
  EXPECT_EQ(rc, -1);
  EXPECT_EQ(errno, EBADF);
  close(fds[1]);
}

TEST(FileDescriptor, MoveSemantics) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  FileDescriptor w(fds[1]);
  {
    FileDescriptor a(fds[0]);
    FileDescriptor b(std::move(a));
    EXPECT_FALSE(a.is_valid());

    char c = 'x';
    ASSERT_EQ(write(w.get(), &c, 1), 1) << std::strerror(errno);
    char buf{};
    ASSERT_EQ(read(b.get(), &buf, 1), 1) << std::strerror(errno);
    EXPECT_EQ(buf, 'x');
  }
}

TEST(FileDescriptor, DefaultConstructor) {
  FileDescriptor fd;
  EXPECT_EQ(fd.get(), -1);
  EXPECT_FALSE(fd);
}

TEST(FileDescriptor, ReleaseGivesUpOwnership) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  int raw = -1;
  {
    FileDescriptor fd(fds[0]);
    raw = fd.release();
    EXPECT_FALSE(fd.is_valid());
  }
  EXPECT_EQ(close(raw), 0);
  close(fds[1]);
}

TEST(FileDescriptor, CloseIsIdempotent) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  FileDescriptor fd(fds[0]);
  fd.close();
  fd.close();
  EXPECT_EQ(fd.get(), -1);
  close(fds[1]);
}

TEST(FileDescriptor, MakePipeIsCloseOnExec) {
  auto pipe = runcase::core::make_pipe();
  ASSERT_TRUE(pipe.has_value()) << std::strerror(pipe.error());
  EXPECT_TRUE(fcntl(pipe->read_.get(), F_GETFD) & FD_CLOEXEC);
  EXPECT_TRUE(fcntl(pipe->write_.get(), F_GETFD) & FD_CLOEXEC);
}

TEST(FileDescriptor, SetNonblocking) {
  auto pipe = runcase::core::make_pipe();
  ASSERT_TRUE(pipe.has_value());
  ASSERT_TRUE(pipe->read_.set_nonblocking().has_value());
  EXPECT_TRUE(fcntl(pipe->read_.get(), F_GETFL) & O_NONBLOCK);

  char buf{};
  errno = 0;
  EXPECT_EQ(read(pipe->read_.get(), &buf, 1), -1);
  EXPECT_EQ(errno, EAGAIN);
}
