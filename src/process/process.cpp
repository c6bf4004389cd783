#include "runcase/Process.hpp"
#include "runcase/Log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" {
  extern char** environ; // NOLINT
}

namespace runcase::process {

namespace {

// Owns the posix_spawn attribute objects for the duration of one start().
struct SpawnState {
  posix_spawn_file_actions_t actions_;
  posix_spawnattr_t          attrs_;
  bool                       actions_ready_ = false;
  bool                       attrs_ready_   = false;

  SpawnState() = default;

  SpawnState(SpawnState const&)            = delete;
  SpawnState& operator=(SpawnState const&) = delete;

  ~SpawnState() {
    if (attrs_ready_) {
      posix_spawnattr_destroy(&attrs_);
    }
    if (actions_ready_) {
      posix_spawn_file_actions_destroy(&actions_);
    }
  }

  int init() {
    if (int err = posix_spawn_file_actions_init(&actions_)) {
      return err;
    }
    actions_ready_ = true;
    if (int err = posix_spawnattr_init(&attrs_)) {
      return err;
    }
    attrs_ready_ = true;
    return 0;
  }
};

int setup_file_actions(
    posix_spawn_file_actions_t*                 actions,
    core::PipePair const&                       in,
    core::PipePair const&                       out,
    core::PipePair const&                       err,
    std::optional<std::filesystem::path> const& working_dir
) {
  if (int e = posix_spawn_file_actions_adddup2(actions, in.read_.get(), STDIN_FILENO)) {
    return e;
  }
  if (int e = posix_spawn_file_actions_adddup2(actions, out.write_.get(), STDOUT_FILENO)) {
    return e;
  }
  if (int e = posix_spawn_file_actions_adddup2(actions, err.write_.get(), STDERR_FILENO)) {
    return e;
  }
  // The pipes are close-on-exec; this also drops anything the host leaked.
  if (int e = posix_spawn_file_actions_addclosefrom_np(actions, 3)) {
    return e;
  }
  if (working_dir.has_value()) {
    if (int e = posix_spawn_file_actions_addchdir_np(actions, working_dir->c_str())) {
      return e;
    }
  }
  return 0;
}

int setup_attributes(posix_spawnattr_t* attrs) {
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  sigaddset(&defaults, SIGINT);
  sigaddset(&defaults, SIGTERM);
  if (int e = posix_spawnattr_setsigdefault(attrs, &defaults)) {
    return e;
  }

  sigset_t empty;
  sigemptyset(&empty);
  if (int e = posix_spawnattr_setsigmask(attrs, &empty)) {
    return e;
  }

  return posix_spawnattr_setflags(attrs, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
}

} // namespace

Process::Process(
    std::string                          executable,
    std::vector<std::string>             args,
    std::optional<std::filesystem::path> working_dir,
    std::vector<std::string>             environment
)
    : executable_(std::move(executable))
    , args_(std::move(args))
    , working_dir_(std::move(working_dir))
    , environment_(std::move(environment)) {}

auto Process::start() -> core::Result<void, int> {
  std::lock_guard lock(mutex_);

  if (status_ != ProcessStatus::NotStarted) {
    return std::unexpected(EALREADY);
  }
  if (executable_.empty()) {
    log::error("Process::start() error: empty executable");
    return std::unexpected(ENOENT);
  }

  auto in = core::make_pipe();
  if (!in) {
    return std::unexpected(in.error());
  }
  auto out = core::make_pipe();
  if (!out) {
    return std::unexpected(out.error());
  }
  auto err = core::make_pipe();
  if (!err) {
    return std::unexpected(err.error());
  }

  SpawnState spawn;
  if (int e = spawn.init()) {
    log::error("posix_spawn init failed: {}", std::strerror(e));
    return std::unexpected(e);
  }
  if (int e = setup_file_actions(&spawn.actions_, *in, *out, *err, working_dir_)) {
    log::error("posix_spawn file actions failed: {}", std::strerror(e));
    return std::unexpected(e);
  }
  if (int e = setup_attributes(&spawn.attrs_)) {
    log::error("posix_spawn attributes failed: {}", std::strerror(e));
    return std::unexpected(e);
  }

  auto               argv = create_argv();
  std::vector<char*> envp;
  if (!environment_.empty()) {
    envp.reserve(environment_.size() + 1);
    for (auto& entry : environment_) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
  }

  start_time_ = std::chrono::steady_clock::now();

  pid_t pid = -1;
  if (int e = posix_spawnp(
          &pid, executable_.c_str(), &spawn.actions_, &spawn.attrs_, argv.data(), envp.empty() ? environ : envp.data()
      )) {
    log::debug("posix_spawnp({}) failed: {}", executable_, std::strerror(e));
    return std::unexpected(e);
  }

  pid_       = pid;
  status_    = ProcessStatus::Running;
  stdin_fd_  = std::move(in->write_);
  stdout_fd_ = std::move(out->read_);
  stderr_fd_ = std::move(err->read_);

  for (auto* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
    if (auto nb = fd->set_nonblocking(); !nb) {
      log::warn("fcntl(O_NONBLOCK) failed: {}", std::strerror(nb.error()));
    }
  }

  return {};
}

auto Process::wait() -> std::optional<ExitStatus> {
  pid_t pid = -1;
  {
    std::lock_guard lock(mutex_);
    if (status_ != ProcessStatus::Running) {
      return std::nullopt;
    }
    pid = pid_;
  }

  // Block without the lock and without reaping, so terminate() and kill()
  // from other threads still reach the child.
  siginfo_t info{};
  while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == -1) {
    if (errno == ECHILD) {
      break;
    }
    if (errno != EINTR) {
      log::error("waitid() failed: {}", std::strerror(errno));
      return std::nullopt;
    }
  }

  return try_wait();
}

auto Process::try_wait() -> std::optional<ExitStatus> {
  std::lock_guard lock(mutex_);

  if (status_ != ProcessStatus::Running) {
    return std::nullopt;
  }

  int   status = 0;
  pid_t result = waitpid(pid_, &status, WNOHANG);

  if (result == 0) {
    return std::nullopt;
  }

  if (result == -1) {
    if (errno == ECHILD) {
      return lost_child();
    }
    if (errno != EINTR) {
      log::error("waitpid() failed: {}", std::strerror(errno));
    }
    return std::nullopt;
  }

  return exit_status_from(status);
}

bool Process::terminate() const {
  return send_signal(SIGTERM);
}

bool Process::kill() const {
  return send_signal(SIGKILL);
}

bool Process::send_signal(int signo) const {
  std::lock_guard lock(mutex_);

  if (status_ != ProcessStatus::Running || pid_ <= 0) {
    return false;
  }

  if (::kill(pid_, signo) == -1) {
    log::error("kill({}) failed: {}", signo, std::strerror(errno));
    return false;
  }

  return true;
}

bool Process::is_running() const noexcept {
  std::lock_guard lock(mutex_);
  return status_ == ProcessStatus::Running;
}

pid_t Process::pid() const noexcept {
  std::lock_guard lock(mutex_);
  return pid_;
}

ProcessStatus Process::status() const noexcept {
  std::lock_guard lock(mutex_);
  return status_;
}

std::vector<char*> Process::create_argv() const {
  std::vector<char*> argv;
  argv.reserve(args_.size() + 2);

  argv.push_back(const_cast<char*>(executable_.c_str()));
  for (auto const& arg : args_) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  return argv;
}

// Someone else reaped the child (SIGCHLD ignored by the host, for one).
auto Process::lost_child() -> ExitStatus {
  log::warn("child {} was reaped elsewhere; exit status unknown", pid_);
  status_ = ProcessStatus::Exited;
  return {};
}

auto Process::exit_status_from(int wait_status) -> ExitStatus {
  ExitStatus result;

  if (WIFEXITED(wait_status)) {
    result.exit_code_ = WEXITSTATUS(wait_status);
    status_           = ProcessStatus::Exited;
  } else if (WIFSIGNALED(wait_status)) {
    result.signal_ = WTERMSIG(wait_status);
    status_        = ProcessStatus::Signaled;
  }

  return result;
}

} // namespace runcase::process
