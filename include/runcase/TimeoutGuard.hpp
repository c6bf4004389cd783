#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace runcase::exec {

// One-shot deadline timer. The callback runs on the timer thread with the
// guard's lock held, so once disarm() returns the outcome is settled:
// either the callback has completed or it will never run.
class TimeoutGuard {
  enum class State {
    Idle,
    Armed,
    Fired,
    Disarmed
  };

  std::mutex              mutex_;
  std::condition_variable cv_;
  State                   state_ = State::Idle;
  std::thread             timer_;

public:
  TimeoutGuard() = default;
  ~TimeoutGuard();

  TimeoutGuard(TimeoutGuard const&)            = delete;
  TimeoutGuard& operator=(TimeoutGuard const&) = delete;

  // Arming twice is a no-op.
  void arm(std::chrono::milliseconds deadline, std::function<void()> on_expire);

  // Idempotent. Returns true when the callback did not fire.
  bool disarm();

  [[nodiscard]] bool fired();
  [[nodiscard]] bool armed();
};

} // namespace runcase::exec
