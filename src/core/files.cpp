#include "runcase/Files.hpp"
#include "runcase/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

namespace runcase::core::files {

auto read_file(std::filesystem::path const& path) -> Result<std::string> {
  FileDescriptor fd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
  if (!fd) {
    return std::unexpected(fmt::format("open {}: {}", path.string(), std::strerror(errno)));
  }

  std::string            content;
  std::array<char, 8192> buffer{};
  while (true) {
    ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(fmt::format("read {}: {}", path.string(), std::strerror(errno)));
    }
    content.append(buffer.data(), static_cast<size_t>(n));
  }
  return content;
}

auto write_file(std::filesystem::path const& path, std::string_view content) -> Result<void> {
  FileDescriptor fd{::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
  if (!fd) {
    return std::unexpected(fmt::format("open {}: {}", path.string(), std::strerror(errno)));
  }

  while (!content.empty()) {
    ssize_t n = ::write(fd.get(), content.data(), content.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(fmt::format("write {}: {}", path.string(), std::strerror(errno)));
    }
    content.remove_prefix(static_cast<size_t>(n));
  }
  return {};
}

auto copy_file(std::filesystem::path const& from, std::filesystem::path const& to) -> Result<void> {
  std::error_code ec;
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    return std::unexpected(fmt::format("copy {} to {}: {}", from.string(), to.string(), ec.message()));
  }
  return {};
}

} // namespace runcase::core::files
