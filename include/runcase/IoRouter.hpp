#pragma once

#include <filesystem>
#include <string>

#include "runcase/Notifier.hpp"
#include "runcase/Origin.hpp"
#include "runcase/Run.hpp"

namespace runcase::io {

enum class InputMode {
  Stream,
  File
};

enum class OutputMode {
  Stream,
  File
};

[[nodiscard]] auto input_mode(ExecutionRequest const& request) noexcept -> InputMode;
[[nodiscard]] auto output_mode(ExecutionRequest const& request) noexcept -> OutputMode;

// Filesystem failures are reported through the notifier and swallowed.
class IoRouter {
  Notifier&      notifier_;
  OriginResolver resolver_;

public:
  IoRouter(Notifier& notifier, OriginResolver resolver);

  // Stream mode: returns the bytes destined for the child's stdin.
  // File mode: writes (or copies) the input file into the working
  // directory and returns nothing.
  auto prepare_input(ExecutionRequest const& request) -> std::string;

  // File mode only: replaces result.stdout_ with the output file.
  void collect_output(ExecutionRequest const& request, RunResult& result);

  [[nodiscard]] auto origin_of(std::string_view text) const -> std::string;
};

} // namespace runcase::io
