#include "runcase/Signals.hpp"
#include "runcase/Log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fmt/core.h>
#include <pthread.h>

namespace runcase::core::signal {

void ignore_broken_pipe() {
  struct sigaction sa{};
  sa.sa_handler = SIG_IGN;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (sigaction(SIGPIPE, &sa, nullptr) == -1) {
    log::warn("sigaction(SIGPIPE): {}", std::strerror(errno));
  }
}

void watch_termination(std::function<void(int)> handler) {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);

  if (int err = pthread_sigmask(SIG_BLOCK, &set, nullptr); err != 0) {
    log::warn("pthread_sigmask: {}", std::strerror(err));
    return;
  }

  // Lives until the process exits.
  std::thread([set, handler = std::move(handler)] {
    while (true) {
      int signo = 0;
      if (sigwait(&set, &signo) != 0) {
        continue;
      }
      handler(signo);
    }
  }).detach();
}

auto name(int signo) -> std::string {
  if (char const* abbrev = sigabbrev_np(signo)) {
    return fmt::format("SIG{}", abbrev);
  }
  return fmt::format("SIG{}", signo);
}

auto errno_name(int error) -> std::string {
  if (char const* err_name = strerrorname_np(error)) {
    return err_name;
  }
  return fmt::format("E{}", error);
}

} // namespace runcase::core::signal
