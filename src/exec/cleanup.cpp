#include "runcase/Cleanup.hpp"
#include "runcase/Log.hpp"

#include <system_error>

namespace runcase::exec {

void delete_binary(LanguageDescriptor const& language, std::filesystem::path const& artifact) {
  if (language.skip_compile_) {
    log::info("Skipping deletion of binary as it's not a compiled language.");
    return;
  }

  log::info("Deleting binary {}", artifact.string());

  std::error_code ec;
  if (std::filesystem::is_directory(artifact, ec)) {
    std::filesystem::remove_all(artifact, ec);
  } else {
    std::filesystem::remove(artifact, ec);
  }

  if (ec) {
    log::error("Error while deleting binary {}: {}", artifact.string(), ec.message());
  }
}

} // namespace runcase::exec
