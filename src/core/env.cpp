#include "runcase/Env.hpp"

#include <algorithm>
#include <cstdlib>

extern "C" {
  extern char** environ; // NOLINT
}

namespace runcase::core::env {

auto get(std::string_view name) -> std::optional<std::string> {
  std::string key{name};
  if (char const* value = std::getenv(key.c_str())) {
    return std::string{value};
  }
  return std::nullopt;
}

auto merged(std::vector<std::pair<std::string, std::string>> const& overrides) -> std::vector<std::string> {
  std::vector<std::string> result;

  if (environ != nullptr) {
    for (char** entry = environ; *entry != nullptr; ++entry) {
      std::string_view item{*entry};
      auto             name = item.substr(0, item.find('='));

      bool overridden = std::ranges::any_of(overrides, [name](auto const& kv) { return kv.first == name; });
      if (!overridden) {
        result.emplace_back(item);
      }
    }
  }

  for (auto const& [name, value] : overrides) {
    result.push_back(name + "=" + value);
  }
  return result;
}

} // namespace runcase::core::env
