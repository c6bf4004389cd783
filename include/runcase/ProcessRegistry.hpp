#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "runcase/Process.hpp"

namespace runcase::process {

// Live executions that kill_all() can reach. Owned by whoever owns the
// executors and shared with each of them by reference.
class ProcessRegistry {
public:
  using EntryId = std::uint64_t;

  // Removes its entry when reset or destroyed.
  class Registration {
    ProcessRegistry* registry_ = nullptr;
    EntryId          id_       = 0;

  public:
    Registration() = default;
    Registration(ProcessRegistry& registry, EntryId id) noexcept;
    ~Registration();

    Registration(Registration const&)            = delete;
    Registration& operator=(Registration const&) = delete;
    Registration(Registration&& other) noexcept;
    Registration& operator=(Registration&& other) noexcept;

    void                  reset() noexcept;
    [[nodiscard]] EntryId id() const noexcept {
      return id_;
    }
    [[nodiscard]] bool active() const noexcept {
      return registry_ != nullptr;
    }
  };

  ProcessRegistry() = default;

  ProcessRegistry(ProcessRegistry const&)            = delete;
  ProcessRegistry& operator=(ProcessRegistry const&) = delete;

  [[nodiscard]] auto add(std::shared_ptr<Process> process) -> Registration;
  void               remove(EntryId id) noexcept;

  // Sends SIGTERM to every registered process and returns how many were
  // signalled. Does not wait and does not clear the registry.
  auto kill_all() -> std::size_t;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] bool empty() const;

private:
  mutable std::mutex                                     mutex_;
  std::vector<std::pair<EntryId, std::shared_ptr<Process>>> entries_;
  EntryId                                                next_id_ = 1;
};

} // namespace runcase::process
