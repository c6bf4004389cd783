#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "runcase/Errors.hpp"

namespace runcase {

// User-facing messages, as opposed to the diagnostic log.
class Notifier {
public:
  virtual ~Notifier() = default;

  virtual void notify(ErrorKind kind, std::string_view message) = 0;
};

class StderrNotifier final : public Notifier {
public:
  void notify(ErrorKind kind, std::string_view message) override;
};

struct Notification {
  ErrorKind   kind_;
  std::string message_;
};

// Keeps everything it is told; used by embedders that render messages
// later.
class CollectingNotifier final : public Notifier {
  std::vector<Notification> notifications_;

public:
  void notify(ErrorKind kind, std::string_view message) override;

  [[nodiscard]] std::vector<Notification> const& notifications() const noexcept {
    return notifications_;
  }
  void clear() noexcept {
    notifications_.clear();
  }
};

} // namespace runcase
