#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "runcase/Constants.hpp"
#include "runcase/Result.hpp"

namespace runcase {

struct EngineConfig {
  // Guard deadline; SIGTERM on expiry.
  std::chrono::milliseconds timeout_ = constant::DEFAULT_TIMEOUT;
  // Hard backstop; SIGKILL on expiry. Never below timeout_.
  std::chrono::milliseconds spawn_timeout_ = constant::DEFAULT_SPAWN_TIMEOUT;
  bool                      online_judge_  = false;
  bool                      verbose_       = false;
  std::vector<std::pair<std::string, std::string>> extra_env_{
      {std::string{constant::DEBUG_ENV}, "true"},
      {std::string{constant::HARNESS_ENV}, "true"},
  };
};

// Overlays RUNCASE_* environment variables on `base`.
auto load_config_from_env(EngineConfig base = {}) -> core::Result<EngineConfig>;

// Rejects deadlines that are non-positive or above constant::MAX_TIMEOUT,
// and lifts spawn_timeout_ to timeout_.
auto validate_config(EngineConfig config) -> core::Result<EngineConfig>;

auto parse_millis(std::string_view text) -> core::Result<std::chrono::milliseconds>;
auto parse_flag(std::string_view text) -> core::Result<bool>;

} // namespace runcase
