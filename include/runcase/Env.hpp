#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace runcase::core::env {

auto get(std::string_view name) -> std::optional<std::string>;

// Host environment as NAME=VALUE strings, with `overrides` replacing or
// extending entries of the same name.
auto merged(std::vector<std::pair<std::string, std::string>> const& overrides) -> std::vector<std::string>;

} // namespace runcase::core::env
