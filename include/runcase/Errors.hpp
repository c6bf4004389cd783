#pragma once

#include <string_view>

namespace runcase {

// Every kind still ends in a finalized RunResult; none of them is retried.
enum class ErrorKind {
  SpawnFailure,
  Timeout,
  AbnormalTermination,
  IoFailure,
  JudgeInputFailure,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

} // namespace runcase
