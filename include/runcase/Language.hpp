#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace runcase {

// Supplied by the language resolution layer; read-only here apart from
// normalize_for_platform().
struct LanguageDescriptor {
  std::string              name_;
  std::string              compiler_;
  std::vector<std::string> args_;
  bool                     skip_compile_ = false;
};

enum class Platform {
  Posix,
  Windows
};

[[nodiscard]] constexpr Platform current_platform() noexcept {
#ifdef _WIN32
  return Platform::Windows;
#else
  return Platform::Posix;
#endif
}

namespace launch {

inline constexpr std::string_view JAVA_LAUNCHER  = "java";
inline constexpr std::string_view MONO_LAUNCHER  = "mono";
inline constexpr std::string_view PROJECT_BINARY = ".cphcsrun";
inline constexpr std::string_view STACK_FLAG     = "/stack:67108864";

// python, ruby, js: <interpreter> <artifact> <args...>
struct Interpreted {
  std::string              interpreter_;
  std::vector<std::string> extra_args_;
};

// java: java [-DONLINE_JUDGE] -cp <dir> <class>
struct ClassPath {
  bool online_judge_ = false;
};

// csharp built by dotnet: <artifact>/.cphcsrun /stack:N
struct ProjectBinary {
  Platform platform_ = Platform::Posix;
};

// csharp built by anything else: mono <artifact>
struct MonoLauncher {};

struct NativeBinary {};

using LaunchStrategy = std::variant<Interpreted, ClassPath, ProjectBinary, MonoLauncher, NativeBinary>;

struct LaunchOptions {
  bool     online_judge_ = false;
  Platform platform_     = current_platform();
};

struct LaunchPlan {
  std::string              executable_;
  std::vector<std::string> args_;
  std::filesystem::path    working_directory_;
};

// On Windows `python3` is not installed under that name.
[[nodiscard]] auto normalize_for_platform(LanguageDescriptor language, Platform platform) -> LanguageDescriptor;

[[nodiscard]] auto classify(LanguageDescriptor const& language, LaunchOptions const& options) -> LaunchStrategy;

// Never fails; a bad executable shows up when the process is spawned.
[[nodiscard]] auto resolve_launch(
    LanguageDescriptor const&    language,
    std::filesystem::path const& artifact,
    LaunchOptions const&         options = {}
) -> LaunchPlan;

[[nodiscard]] auto executable_suffix(Platform platform) noexcept -> std::string_view;

// Artifact file stem without its trailing compiled-unit marker.
[[nodiscard]] auto java_class_name(std::filesystem::path const& artifact) -> std::string;

} // namespace launch

} // namespace runcase
