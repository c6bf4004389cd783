#include "runcase/Run.hpp"

#include <fmt/core.h>

namespace runcase {

std::filesystem::path ExecutionRequest::working_directory() const {
  return artifact_path_.parent_path();
}

Termination RunResult::termination() const noexcept {
  if (timed_out_) {
    return Termination::TimedOut;
  }
  if (signal_.has_value()) {
    return Termination::Signaled;
  }
  if (exit_code_.has_value()) {
    return Termination::Exited;
  }
  return Termination::Unknown;
}

bool RunResult::did_error(bool ignore_stderr) const noexcept {
  bool const stderr_failure = !ignore_stderr && !stderr_.empty();
  return (exit_code_.has_value() && *exit_code_ != 0) || signal_.has_value() || stderr_failure;
}

auto to_string(Termination termination) noexcept -> std::string_view {
  switch (termination) {
    case Termination::Exited: return "exited";
    case Termination::Signaled: return "signaled";
    case Termination::TimedOut: return "timed out";
    case Termination::Unknown: return "unknown";
  }
  return "unknown";
}

auto format_result(RunResult const& result) -> std::string {
  auto out = fmt::format(
      "termination: {}\nexit code: {}\nsignal: {}\ntime: {} ms\ntimed out: {}\n",
      to_string(result.termination()),
      result.exit_code_ ? fmt::format("{}", *result.exit_code_) : std::string{"-"},
      result.signal_.value_or("-"),
      result.time_.count(),
      result.timed_out_ ? "yes" : "no"
  );
  out += fmt::format("--- stdout ({} bytes) ---\n{}", result.stdout_.size(), result.stdout_);
  if (!result.stdout_.empty() && result.stdout_.back() != '\n') {
    out += '\n';
  }
  out += fmt::format("--- stderr ({} bytes) ---\n{}", result.stderr_.size(), result.stderr_);
  if (!result.stderr_.empty() && result.stderr_.back() != '\n') {
    out += '\n';
  }
  return out;
}

} // namespace runcase
