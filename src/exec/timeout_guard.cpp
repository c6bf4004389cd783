#include "runcase/TimeoutGuard.hpp"

namespace runcase::exec {

TimeoutGuard::~TimeoutGuard() {
  disarm();
}

void TimeoutGuard::arm(std::chrono::milliseconds deadline, std::function<void()> on_expire) {
  std::lock_guard lock(mutex_);
  if (state_ != State::Idle) {
    return;
  }
  state_ = State::Armed;

  auto const expires_at = std::chrono::steady_clock::now() + deadline;
  timer_ = std::thread([this, expires_at, on_expire = std::move(on_expire)] {
    std::unique_lock timer_lock(mutex_);
    cv_.wait_until(timer_lock, expires_at, [this] { return state_ != State::Armed; });
    if (state_ != State::Armed) {
      return;
    }
    state_ = State::Fired;
    if (on_expire) {
      on_expire();
    }
  });
}

bool TimeoutGuard::disarm() {
  bool cancelled = true;
  {
    std::lock_guard lock(mutex_);
    if (state_ == State::Armed || state_ == State::Idle) {
      state_ = State::Disarmed;
    } else if (state_ == State::Fired) {
      cancelled = false;
    }
  }
  cv_.notify_all();

  if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id()) {
    timer_.join();
  }
  return cancelled;
}

bool TimeoutGuard::fired() {
  std::lock_guard lock(mutex_);
  return state_ == State::Fired;
}

bool TimeoutGuard::armed() {
  std::lock_guard lock(mutex_);
  return state_ == State::Armed;
}

} // namespace runcase::exec
