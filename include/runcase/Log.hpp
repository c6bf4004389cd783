#pragma once

#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace runcase::log {

void set_verbose(bool enabled) noexcept;
[[nodiscard]] bool verbose() noexcept;

void write(std::string_view level, std::string_view message);

// debug() and info() only print in verbose mode.
template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (verbose()) {
    write("debug", fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  if (verbose()) {
    write("info", fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  write("warn", fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  write("error", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace runcase::log
