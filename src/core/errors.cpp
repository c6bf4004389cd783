#include "runcase/Errors.hpp"

namespace runcase {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
    case ErrorKind::SpawnFailure: return "spawn failure";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::AbnormalTermination: return "abnormal termination";
    case ErrorKind::IoFailure: return "i/o failure";
    case ErrorKind::JudgeInputFailure: return "judge input failure";
  }
  return "unknown";
}

} // namespace runcase
