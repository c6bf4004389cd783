#include "runcase/Log.hpp"
#include "runcase/Constants.hpp"

#include <atomic>
#include <mutex>

namespace runcase::log {

namespace {

std::atomic<bool> verbose_enabled{false};
std::mutex        write_mutex;

} // namespace

void set_verbose(bool enabled) noexcept {
  verbose_enabled.store(enabled, std::memory_order_relaxed);
}

bool verbose() noexcept {
  return verbose_enabled.load(std::memory_order_relaxed);
}

void write(std::string_view level, std::string_view message) {
  std::lock_guard lock(write_mutex);
  fmt::print(stderr, "{}: {}: {}\n", constant::EXE_NAME, level, message);
}

} // namespace runcase::log
