#include "runcase/Language.hpp"

namespace runcase {

namespace launch {

namespace {

bool is_interpreted(std::string_view name) noexcept {
  return name == "python" || name == "ruby" || name == "js";
}

template<typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

} // namespace

auto normalize_for_platform(LanguageDescriptor language, Platform platform) -> LanguageDescriptor {
  if (platform == Platform::Windows && language.compiler_ == "python3") {
    language.compiler_ = "python";
  }
  return language;
}

auto classify(LanguageDescriptor const& language, LaunchOptions const& options) -> LaunchStrategy {
  if (is_interpreted(language.name_)) {
    return Interpreted{language.compiler_, language.args_};
  }
  if (language.name_ == "java") {
    return ClassPath{options.online_judge_};
  }
  if (language.name_ == "csharp") {
    if (language.compiler_.find("dotnet") != std::string::npos) {
      return ProjectBinary{options.platform_};
    }
    return MonoLauncher{};
  }
  return NativeBinary{};
}

auto executable_suffix(Platform platform) noexcept -> std::string_view {
  return platform == Platform::Windows ? ".exe" : "";
}

auto java_class_name(std::filesystem::path const& artifact) -> std::string {
  auto stem = artifact.stem().string();
  if (!stem.empty()) {
    stem.pop_back();
  }
  return stem;
}

auto resolve_launch(LanguageDescriptor const& language, std::filesystem::path const& artifact, LaunchOptions const& options)
    -> LaunchPlan {
  auto const directory = artifact.parent_path();

  auto strategy = classify(normalize_for_platform(language, options.platform_), options);

  return std::visit(
      Overloaded{
          [&](Interpreted const& s) {
            LaunchPlan plan{s.interpreter_, {artifact.string()}, directory};
            plan.args_.insert(plan.args_.end(), s.extra_args_.begin(), s.extra_args_.end());
            return plan;
          },
          [&](ClassPath const& s) {
            LaunchPlan plan{std::string{JAVA_LAUNCHER}, {}, directory};
            if (s.online_judge_) {
              plan.args_.emplace_back("-DONLINE_JUDGE");
            }
            plan.args_.emplace_back("-cp");
            plan.args_.push_back(directory.string());
            plan.args_.push_back(java_class_name(artifact));
            return plan;
          },
          [&](ProjectBinary const& s) {
            auto binary = artifact / (std::string{PROJECT_BINARY} + std::string{executable_suffix(s.platform_)});
            return LaunchPlan{binary.string(), {std::string{STACK_FLAG}}, directory};
          },
          [&](MonoLauncher const&) {
            return LaunchPlan{std::string{MONO_LAUNCHER}, {artifact.string()}, directory};
          },
          [&](NativeBinary const&) {
            return LaunchPlan{artifact.string(), {}, directory};
          },
      },
      strategy
  );
}

} // namespace launch

} // namespace runcase
