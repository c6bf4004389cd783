#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "runcase/FileDescriptor.hpp"
#include "runcase/Result.hpp"

namespace runcase::process {

enum class ProcessStatus {
  NotStarted,
  Running,
  Exited,
  Signaled
};

struct ExitStatus {
  std::optional<int> exit_code_;
  std::optional<int> signal_;
};

// A child with all three standard streams connected to pipes owned by the
// parent. terminate()/kill() may be called from any thread; they never
// signal a pid that has already been reaped.
class Process {
  std::string                           executable_;
  std::vector<std::string>              args_;
  std::optional<std::filesystem::path>  working_dir_;
  std::vector<std::string>              environment_;
  pid_t                                 pid_    = -1;
  ProcessStatus                         status_ = ProcessStatus::NotStarted;
  std::chrono::steady_clock::time_point start_time_;
  mutable std::mutex                    mutex_;

  core::FileDescriptor stdin_fd_;
  core::FileDescriptor stdout_fd_;
  core::FileDescriptor stderr_fd_;

public:
  // `args` excludes argv[0]; `environment` holds NAME=VALUE strings and
  // replaces the inherited environment when non-empty.
  Process(
      std::string                          executable,
      std::vector<std::string>             args,
      std::optional<std::filesystem::path> working_dir = std::nullopt,
      std::vector<std::string>             environment = {}
  );

  // Non-blocking: does not wait for or signal the child.
  ~Process() = default;

  Process(Process const&)            = delete;
  Process& operator=(Process const&) = delete;
  Process(Process&&)                 = delete;
  Process& operator=(Process&&)      = delete;

  // Error is the errno reported by posix_spawn, including exec failures.
  auto start() -> core::Result<void, int>;

  // Blocks until the child exits. Does not hold the lock while blocked.
  auto wait() -> std::optional<ExitStatus>;
  auto try_wait() -> std::optional<ExitStatus>;

  bool terminate() const;
  bool kill() const;
  bool send_signal(int signo) const;

  [[nodiscard]] bool          is_running() const noexcept;
  [[nodiscard]] pid_t         pid() const noexcept;
  [[nodiscard]] ProcessStatus status() const noexcept;

  [[nodiscard]] std::string const&              executable() const noexcept {
    return executable_;
  }
  [[nodiscard]] std::vector<std::string> const& args() const noexcept {
    return args_;
  }
  [[nodiscard]] std::chrono::steady_clock::time_point start_time() const noexcept {
    return start_time_;
  }

  // Parent ends of the pipes, valid after a successful start().
  [[nodiscard]] core::FileDescriptor& stdin_fd() noexcept {
    return stdin_fd_;
  }
  [[nodiscard]] core::FileDescriptor& stdout_fd() noexcept {
    return stdout_fd_;
  }
  [[nodiscard]] core::FileDescriptor& stderr_fd() noexcept {
    return stderr_fd_;
  }

private:
  auto create_argv() const -> std::vector<char*>;
  auto exit_status_from(int wait_status) -> ExitStatus;
  auto lost_child() -> ExitStatus;
};

} // namespace runcase::process
