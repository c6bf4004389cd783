#pragma once

#include <cstddef>
#include <future>
#include <string_view>

#include "runcase/Config.hpp"
#include "runcase/IoRouter.hpp"
#include "runcase/Notifier.hpp"
#include "runcase/Origin.hpp"
#include "runcase/ProcessRegistry.hpp"
#include "runcase/Run.hpp"

namespace runcase::exec {

enum class ExecutionState {
  Created,
  Launched,
  Running,
  Exited,
  SpawnFailed,
  Finalized
};

[[nodiscard]] auto to_string(ExecutionState state) noexcept -> std::string_view;

// Runs one request at a time per call; calls may overlap across threads.
// Every call returns exactly one RunResult and never throws for spawn,
// I/O or timeout failures.
class Executor {
  EngineConfig              config_;
  process::ProcessRegistry& registry_;
  Notifier&                 notifier_;
  io::OriginResolver        resolver_;

public:
  Executor(
      EngineConfig              config,
      process::ProcessRegistry& registry,
      Notifier&                 notifier,
      io::OriginResolver        resolver = io::default_origin_resolver()
  );

  auto run(ExecutionRequest const& request) -> RunResult;
  auto submit(ExecutionRequest request) -> std::future<RunResult>;

  auto kill_all() -> std::size_t;

  [[nodiscard]] EngineConfig const& config() const noexcept {
    return config_;
  }
  [[nodiscard]] process::ProcessRegistry& registry() noexcept {
    return registry_;
  }
};

} // namespace runcase::exec
