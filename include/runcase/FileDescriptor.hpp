#pragma once

#include <array>

#include "runcase/Result.hpp"

namespace runcase::core {

class FileDescriptor {
  int fd_ = -1;

public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) noexcept;
  ~FileDescriptor();
  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] int  get() const noexcept;
  [[nodiscard]] bool is_valid() const noexcept;
  explicit           operator bool() const noexcept;

  int  release() noexcept;
  void close() noexcept;

  // Errors carry errno.
  [[nodiscard]] auto set_nonblocking() const -> Result<void, int>;
};

struct PipePair {
  FileDescriptor read_;
  FileDescriptor write_;
};

// Both ends are created close-on-exec.
auto make_pipe() -> Result<PipePair, int>;

} // namespace runcase::core
