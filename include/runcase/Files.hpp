#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "runcase/Result.hpp"

namespace runcase::core::files {

// Errors are human readable and name the path involved.
auto read_file(std::filesystem::path const& path) -> Result<std::string>;
auto write_file(std::filesystem::path const& path, std::string_view content) -> Result<void>;
auto copy_file(std::filesystem::path const& from, std::filesystem::path const& to) -> Result<void>;

} // namespace runcase::core::files
