#include "runcase/Config.hpp"
#include "runcase/Env.hpp"

#include <charconv>

#include <fmt/core.h>

namespace runcase {

auto parse_millis(std::string_view text) -> core::Result<std::chrono::milliseconds> {
  long long value = 0;

  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::unexpected(fmt::format("invalid duration in milliseconds: '{}'", text));
  }
  return std::chrono::milliseconds{value};
}

auto parse_flag(std::string_view text) -> core::Result<bool> {
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    return true;
  }
  if (text.empty() || text == "0" || text == "false" || text == "no" || text == "off") {
    return false;
  }
  return std::unexpected(fmt::format("invalid boolean: '{}'", text));
}

auto load_config_from_env(EngineConfig base) -> core::Result<EngineConfig> {
  if (auto value = core::env::get(constant::ENV_TIMEOUT)) {
    auto parsed = parse_millis(*value);
    if (!parsed) {
      return std::unexpected(fmt::format("{}: {}", constant::ENV_TIMEOUT, parsed.error()));
    }
    base.timeout_ = *parsed;
  }

  if (auto value = core::env::get(constant::ENV_SPAWN_TIMEOUT)) {
    auto parsed = parse_millis(*value);
    if (!parsed) {
      return std::unexpected(fmt::format("{}: {}", constant::ENV_SPAWN_TIMEOUT, parsed.error()));
    }
    base.spawn_timeout_ = *parsed;
  }

  if (auto value = core::env::get(constant::ENV_ONLINE_JUDGE)) {
    auto parsed = parse_flag(*value);
    if (!parsed) {
      return std::unexpected(fmt::format("{}: {}", constant::ENV_ONLINE_JUDGE, parsed.error()));
    }
    base.online_judge_ = *parsed;
  }

  if (auto value = core::env::get(constant::ENV_VERBOSE)) {
    auto parsed = parse_flag(*value);
    if (!parsed) {
      return std::unexpected(fmt::format("{}: {}", constant::ENV_VERBOSE, parsed.error()));
    }
    base.verbose_ = *parsed;
  }

  return base;
}

auto validate_config(EngineConfig config) -> core::Result<EngineConfig> {
  if (config.timeout_.count() <= 0) {
    return std::unexpected(fmt::format("timeout must be positive, got {} ms", config.timeout_.count()));
  }
  if (config.timeout_ > constant::MAX_TIMEOUT) {
    return std::unexpected(fmt::format(
        "timeout must not exceed {} ms, got {} ms", constant::MAX_TIMEOUT.count(), config.timeout_.count()
    ));
  }
  if (config.spawn_timeout_ > constant::MAX_TIMEOUT) {
    return std::unexpected(fmt::format(
        "spawn timeout must not exceed {} ms, got {} ms", constant::MAX_TIMEOUT.count(), config.spawn_timeout_.count()
    ));
  }
  if (config.spawn_timeout_ < config.timeout_) {
    config.spawn_timeout_ = config.timeout_;
  }
  return config;
}

} // namespace runcase
