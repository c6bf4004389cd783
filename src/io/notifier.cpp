#include "runcase/Notifier.hpp"
#include "runcase/Constants.hpp"

#include <cstdio>

#include <fmt/core.h>

namespace runcase {

void StderrNotifier::notify(ErrorKind kind, std::string_view message) {
  fmt::print(stderr, "{}: {}: {}\n", constant::EXE_NAME, to_string(kind), message);
}

void CollectingNotifier::notify(ErrorKind kind, std::string_view message) {
  notifications_.push_back(Notification{kind, std::string{message}});
}

} // namespace runcase
