#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "runcase/Language.hpp"

namespace runcase {

struct ExecutionRequest {
  LanguageDescriptor    language_;
  std::filesystem::path artifact_path_;
  std::string           input_;
  // Non-empty names select file mode. Never contain a path separator.
  std::string input_file_name_;
  std::string output_file_name_;

  [[nodiscard]] std::filesystem::path working_directory() const;
};

enum class Termination {
  Exited,
  Signaled,
  TimedOut,
  Unknown
};

struct RunResult {
  std::string                stdout_;
  std::string                stderr_;
  std::optional<int>         exit_code_;
  std::optional<std::string> signal_;
  std::chrono::milliseconds  time_{0};
  bool                       timed_out_ = false;

  // Timeout outranks a signal, which outranks an exit code.
  [[nodiscard]] Termination termination() const noexcept;
  [[nodiscard]] bool        did_error(bool ignore_stderr) const noexcept;
};

[[nodiscard]] auto to_string(Termination termination) noexcept -> std::string_view;

// Multi-line, human readable report used by the CLI and the debug log.
[[nodiscard]] auto format_result(RunResult const& result) -> std::string;

} // namespace runcase
