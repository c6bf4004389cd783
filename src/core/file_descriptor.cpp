#include "runcase/FileDescriptor.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace runcase::core {

FileDescriptor::FileDescriptor(int fd) noexcept
    : fd_(fd) {}

FileDescriptor::~FileDescriptor() {
  close();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
  other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    close();
    fd_       = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

int FileDescriptor::get() const noexcept {
  return fd_;
}

bool FileDescriptor::is_valid() const noexcept {
  return fd_ != -1;
}

FileDescriptor::operator bool() const noexcept {
  return is_valid();
}

int FileDescriptor::release() noexcept {
  int old_fd = fd_;
  fd_        = -1;
  return old_fd;
}

void FileDescriptor::close() noexcept {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

auto FileDescriptor::set_nonblocking() const -> Result<void, int> {
  int flags = fcntl(fd_, F_GETFL);
  if (flags == -1) {
    return std::unexpected(errno);
  }
  if (fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto make_pipe() -> Result<PipePair, int> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(errno);
  }
  return PipePair{FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}

} // namespace runcase::core
