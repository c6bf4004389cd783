#include "runcase/Executor.hpp"
#include "runcase/Env.hpp"
#include "runcase/Log.hpp"
#include "runcase/Signals.hpp"
#include "runcase/TimeoutGuard.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <memory>
#include <system_error>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <poll.h>
#include <unistd.h>

namespace runcase::exec {

namespace {

constexpr int         POLL_INTERVAL_MS = 10;
constexpr std::size_t READ_CHUNK       = 8192;

auto elapsed_since(std::chrono::steady_clock::time_point begin) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
}

// One request from Created to Finalized. Owns the child, both output
// buffers and the guard; the guard is declared last so it is joined before
// anything its callback touches goes away.
class Execution {
  ExecutionRequest const&                request_;
  EngineConfig const&                    config_;
  process::ProcessRegistry&              registry_;
  Notifier&                              notifier_;
  io::IoRouter                           router_;
  ExecutionState                         state_ = ExecutionState::Created;
  RunResult                              result_;
  std::chrono::steady_clock::time_point  launched_at_;
  std::shared_ptr<process::Process>      process_;
  process::ProcessRegistry::Registration registration_;
  std::string                            pending_input_;
  std::size_t                            input_offset_   = 0;
  bool                                   backstop_fired_ = false;
  std::atomic<bool>                      timed_out_{false};
  TimeoutGuard                           guard_;

public:
  Execution(
      ExecutionRequest const&   request,
      EngineConfig const&       config,
      process::ProcessRegistry& registry,
      Notifier&                 notifier,
      io::OriginResolver        resolver
  )
      : request_(request)
      , config_(config)
      , registry_(registry)
      , notifier_(notifier)
      , router_(notifier, std::move(resolver)) {}

  auto run() -> RunResult {
    log::debug(
        "running testcase: language={} artifact={} input_file={} output_file={}",
        request_.language_.name_,
        request_.artifact_path_.string(),
        request_.input_file_name_,
        request_.output_file_name_
    );

    auto const platform = current_platform();
    auto const language = launch::normalize_for_platform(request_.language_, platform);
    auto const plan     = launch::resolve_launch(language, request_.artifact_path_, {config_.online_judge_, platform});

    // File-mode input has to exist before the child can open it.
    pending_input_ = router_.prepare_input(request_);

    std::optional<std::filesystem::path> cwd;
    if (!plan.working_directory_.empty()) {
      cwd = plan.working_directory_;
    }
    process_ = std::make_shared<process::Process>(plan.executable_, plan.args_, cwd, core::env::merged(config_.extra_env_));

    launched_at_ = std::chrono::steady_clock::now();
    if (auto started = process_->start(); !started) {
      return spawn_failed(started.error(), language, plan);
    }

    registration_ = registry_.add(process_);
    guard_.arm(config_.timeout_, [this] {
      timed_out_.store(true);
      if (process_->terminate()) {
        log::debug("deadline of {} ms passed, sent SIGTERM to {}", config_.timeout_.count(), process_->pid());
      }
    });
    transition(ExecutionState::Launched);

    if (io::input_mode(request_) == io::InputMode::File || pending_input_.empty()) {
      process_->stdin_fd().close();
    }

    transition(ExecutionState::Running);
    on_exit(pump());

    router_.collect_output(request_, result_);
    transition(ExecutionState::Finalized);
    log::debug("run result:\n{}", format_result(result_));
    return std::move(result_);
  }

private:
  void transition(ExecutionState next) {
    log::debug("execution state: {} -> {}", to_string(state_), to_string(next));
    state_ = next;
  }

  auto spawn_failed(int error, LanguageDescriptor const& language, launch::LaunchPlan const& plan) -> RunResult {
    transition(ExecutionState::SpawnFailed);
    result_.exit_code_ = 1;
    result_.signal_    = core::signal::errno_name(error);
    result_.time_      = elapsed_since(launched_at_);

    log::error("could not launch {} {}: {}", plan.executable_, fmt::join(plan.args_, " "), std::strerror(error));
    notifier_.notify(
        ErrorKind::SpawnFailure,
        fmt::format("Could not launch testcase process. Is '{}' in your PATH?", language.compiler_)
    );

    transition(ExecutionState::Finalized);
    return std::move(result_);
  }

  // Moves bytes in both directions until the child is reaped.
  auto pump() -> process::ExitStatus {
    auto& in  = process_->stdin_fd();
    auto& out = process_->stdout_fd();
    auto& err = process_->stderr_fd();

    while (true) {
      std::array<pollfd, 3> fds{};
      nfds_t                count    = 0;
      int                   in_slot  = -1;
      int                   out_slot = -1;
      int                   err_slot = -1;

      if (in && input_offset_ < pending_input_.size()) {
        in_slot      = static_cast<int>(count);
        fds[count++] = pollfd{in.get(), POLLOUT, 0};
      }
      if (out) {
        out_slot     = static_cast<int>(count);
        fds[count++] = pollfd{out.get(), POLLIN, 0};
      }
      if (err) {
        err_slot     = static_cast<int>(count);
        fds[count++] = pollfd{err.get(), POLLIN, 0};
      }

      if (poll(fds.data(), count, POLL_INTERVAL_MS) == -1 && errno != EINTR) {
        log::error("poll() failed: {}", std::strerror(errno));
      }

      if (in_slot != -1 && fds[in_slot].revents != 0) {
        write_input(in);
      }
      if (out_slot != -1 && fds[out_slot].revents != 0) {
        drain(out, result_.stdout_);
      }
      if (err_slot != -1 && fds[err_slot].revents != 0) {
        drain(err, result_.stderr_);
      }

      if (auto status = process_->try_wait()) {
        drain(out, result_.stdout_);
        drain(err, result_.stderr_);
        in.close();
        return *status;
      }

      if (!backstop_fired_ && elapsed_since(launched_at_) >= config_.spawn_timeout_) {
        backstop_fired_ = true;
        log::warn("process {} outlived the {} ms spawn timeout, sending SIGKILL", process_->pid(), config_.spawn_timeout_.count());
        timed_out_.store(true);
        process_->kill();
      }
    }
  }

  void write_input(core::FileDescriptor& in) {
    while (input_offset_ < pending_input_.size()) {
      ssize_t n = ::write(in.get(), pending_input_.data() + input_offset_, pending_input_.size() - input_offset_);
      if (n > 0) {
        input_offset_ += static_cast<std::size_t>(n);
        continue;
      }
      if (n == -1 && errno == EINTR) {
        continue;
      }
      if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
      }
      // EPIPE: the child stopped reading; the rest of the input is dropped.
      log::debug("stopped writing stdin after {} bytes: {}", input_offset_, std::strerror(errno));
      break;
    }
    in.close();
  }

  // Reads whatever is available without blocking; closes `fd` at EOF.
  void drain(core::FileDescriptor& fd, std::string& sink) {
    if (!fd) {
      return;
    }

    std::array<char, READ_CHUNK> buffer{};
    while (true) {
      ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
      if (n > 0) {
        sink.append(buffer.data(), static_cast<std::size_t>(n));
        continue;
      }
      if (n == -1 && errno == EINTR) {
        continue;
      }
      if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
      }
      if (n == -1) {
        log::error("read() failed: {}", std::strerror(errno));
      }
      fd.close();
      return;
    }
  }

  void on_exit(process::ExitStatus const& status) {
    // Settle the race with the guard before any result field is written.
    bool const beat_deadline = guard_.disarm();

    transition(ExecutionState::Exited);
    result_.time_      = elapsed_since(launched_at_);
    result_.exit_code_ = status.exit_code_;
    if (status.signal_.has_value()) {
      result_.signal_ = core::signal::name(*status.signal_);
    }
    result_.timed_out_ = timed_out_.load();
    registration_.reset();

    if (result_.timed_out_) {
      log::info("{}: process timed out after {} ms", to_string(ErrorKind::Timeout), result_.time_.count());
    } else if (result_.signal_.has_value()) {
      log::info("{}: process killed by {}", to_string(ErrorKind::AbnormalTermination), *result_.signal_);
    }
    if (!beat_deadline) {
      log::debug("exit observed after the deadline fired");
    }
  }
};

} // namespace

auto to_string(ExecutionState state) noexcept -> std::string_view {
  switch (state) {
    case ExecutionState::Created: return "created";
    case ExecutionState::Launched: return "launched";
    case ExecutionState::Running: return "running";
    case ExecutionState::Exited: return "exited";
    case ExecutionState::SpawnFailed: return "spawn-failed";
    case ExecutionState::Finalized: return "finalized";
  }
  return "unknown";
}

Executor::Executor(
    EngineConfig              config,
    process::ProcessRegistry& registry,
    Notifier&                 notifier,
    io::OriginResolver        resolver
)
    : config_(std::move(config)), registry_(registry), notifier_(notifier), resolver_(std::move(resolver)) {
  config_.timeout_       = std::clamp(config_.timeout_, std::chrono::milliseconds{1}, constant::MAX_TIMEOUT);
  config_.spawn_timeout_ = std::min(config_.spawn_timeout_, constant::MAX_TIMEOUT);
  if (config_.spawn_timeout_ < config_.timeout_) {
    config_.spawn_timeout_ = config_.timeout_;
  }
  core::signal::ignore_broken_pipe();
}

auto Executor::run(ExecutionRequest const& request) -> RunResult {
  // The child is started inside the artifact's directory, so a relative
  // artifact path would be resolved against it a second time.
  auto            anchored = request;
  std::error_code ec;
  if (auto absolute = std::filesystem::absolute(request.artifact_path_, ec); !ec) {
    anchored.artifact_path_ = std::move(absolute);
  } else {
    log::warn("could not make {} absolute: {}", request.artifact_path_.string(), ec.message());
  }

  Execution execution{anchored, config_, registry_, notifier_, resolver_};
  return execution.run();
}

auto Executor::submit(ExecutionRequest request) -> std::future<RunResult> {
  return std::async(std::launch::async, [this, request = std::move(request)] { return run(request); });
}

auto Executor::kill_all() -> std::size_t {
  log::info("killing running binaries");
  return registry_.kill_all();
}

} // namespace runcase::exec
