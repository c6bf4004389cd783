#pragma once

#include <filesystem>

#include "runcase/Language.hpp"

namespace runcase::exec {

// Removes a compiled artifact, recursively when it is a directory.
// Languages without a build step are left alone. Filesystem failures are
// logged, not thrown.
void delete_binary(LanguageDescriptor const& language, std::filesystem::path const& artifact);

} // namespace runcase::exec
