#include "runcase/ProcessRegistry.hpp"
#include "runcase/Log.hpp"

#include <algorithm>
#include <iterator>

namespace runcase::process {

ProcessRegistry::Registration::Registration(ProcessRegistry& registry, EntryId id) noexcept
    : registry_(&registry), id_(id) {}

ProcessRegistry::Registration::~Registration() {
  reset();
}

ProcessRegistry::Registration::Registration(Registration&& other) noexcept
    : registry_(other.registry_), id_(other.id_) {
  other.registry_ = nullptr;
}

auto ProcessRegistry::Registration::operator=(Registration&& other) noexcept -> Registration& {
  if (this != &other) {
    reset();
    registry_       = other.registry_;
    id_             = other.id_;
    other.registry_ = nullptr;
  }
  return *this;
}

void ProcessRegistry::Registration::reset() noexcept {
  if (registry_ != nullptr) {
    registry_->remove(id_);
    registry_ = nullptr;
  }
}

auto ProcessRegistry::add(std::shared_ptr<Process> process) -> Registration {
  std::lock_guard lock(mutex_);
  EntryId         id = next_id_++;
  entries_.emplace_back(id, std::move(process));
  return Registration{*this, id};
}

void ProcessRegistry::remove(EntryId id) noexcept {
  std::lock_guard lock(mutex_);
  std::erase_if(entries_, [id](auto const& entry) { return entry.first == id; });
}

auto ProcessRegistry::kill_all() -> std::size_t {
  // Signal outside the lock so a finishing execution can still remove itself.
  std::vector<std::shared_ptr<Process>> live;
  {
    std::lock_guard lock(mutex_);
    live.reserve(entries_.size());
    std::ranges::transform(entries_, std::back_inserter(live), [](auto const& entry) { return entry.second; });
  }

  log::info("killing {} running process(es)", live.size());

  std::size_t signalled = 0;
  for (auto const& process : live) {
    if (process && process->terminate()) {
      ++signalled;
    }
  }
  return signalled;
}

auto ProcessRegistry::size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

bool ProcessRegistry::empty() const {
  std::lock_guard lock(mutex_);
  return entries_.empty();
}

} // namespace runcase::process
