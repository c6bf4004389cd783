#include "runcase/Language.hpp"

#include <gtest/gtest.h>

namespace runcase::launch::test {

namespace {

auto lang(std::string name, std::string compiler, std::vector<std::string> args = {}) -> LanguageDescriptor {
  return LanguageDescriptor{std::move(name), std::move(compiler), std::move(args), false};
}

} // namespace

TEST(ResolveLaunch, PythonRunsArtifactThroughInterpreter) {
  auto plan = resolve_launch(lang("python", "python3", {"-O"}), "/w/sol.py", {false, Platform::Posix});

  EXPECT_EQ(plan.executable_, "python3");
  EXPECT_EQ(plan.args_, (std::vector<std::string>{"/w/sol.py", "-O"}));
  EXPECT_EQ(plan.working_directory_, "/w");
}

TEST(ResolveLaunch, PythonOnWindowsDropsVersionSuffix) {
  auto plan = resolve_launch(lang("python", "python3"), "/w/sol.py", {false, Platform::Windows});
  EXPECT_EQ(plan.executable_, "python");
}

TEST(ResolveLaunch, RubyAndJsAreInterpreted) {
  EXPECT_EQ(resolve_launch(lang("ruby", "ruby"), "/w/a.rb", {}).executable_, "ruby");

  auto js = resolve_launch(lang("js", "node"), "/w/a.js", {});
  EXPECT_EQ(js.executable_, "node");
  EXPECT_EQ(js.args_, (std::vector<std::string>{"/w/a.js"}));
}

TEST(ResolveLaunch, JavaUsesClassPath) {
  auto plan = resolve_launch(lang("java", "javac"), "/w/Main_.class", {false, Platform::Posix});

  EXPECT_EQ(plan.executable_, "java");
  EXPECT_EQ(plan.args_, (std::vector<std::string>{"-cp", "/w", "Main"}));
  EXPECT_EQ(plan.working_directory_, "/w");
}

TEST(ResolveLaunch, JavaOnlineJudgeDefinesProperty) {
  auto plan = resolve_launch(lang("java", "javac"), "/w/Main_.class", {true, Platform::Posix});
  EXPECT_EQ(plan.args_, (std::vector<std::string>{"-DONLINE_JUDGE", "-cp", "/w", "Main"}));
}

TEST(ResolveLaunch, CsharpDotnetRunsProjectBinary) {
  auto posix = resolve_launch(lang("csharp", "dotnet"), "/w/out", {false, Platform::Posix});
  EXPECT_EQ(posix.executable_, "/w/out/.cphcsrun");
  EXPECT_EQ(posix.args_, (std::vector<std::string>{"/stack:67108864"}));

  auto windows = resolve_launch(lang("csharp", "dotnet"), "/w/out", {false, Platform::Windows});
  EXPECT_EQ(windows.executable_, "/w/out/.cphcsrun.exe");
}

TEST(ResolveLaunch, CsharpOtherCompilerUsesMono) {
  auto plan = resolve_launch(lang("csharp", "mcs"), "/w/a.bin", {});
  EXPECT_EQ(plan.executable_, "mono");
  EXPECT_EQ(plan.args_, (std::vector<std::string>{"/w/a.bin"}));
}

TEST(ResolveLaunch, CompiledLanguagesRunArtifactDirectly) {
  for (auto const* name : {"cpp", "c", "rust", "go", "hs"}) {
    auto plan = resolve_launch(lang(name, "whatever"), "/w/a.bin", {});
    EXPECT_EQ(plan.executable_, "/w/a.bin") << name;
    EXPECT_TRUE(plan.args_.empty()) << name;
    EXPECT_EQ(plan.working_directory_, "/w") << name;
  }
}

TEST(Classify, SelectsStrategy) {
  EXPECT_TRUE(std::holds_alternative<Interpreted>(classify(lang("python", "python3"), {})));
  EXPECT_TRUE(std::holds_alternative<ClassPath>(classify(lang("java", "javac"), {})));
  EXPECT_TRUE(std::holds_alternative<ProjectBinary>(classify(lang("csharp", "/usr/bin/dotnet"), {})));
  EXPECT_TRUE(std::holds_alternative<MonoLauncher>(classify(lang("csharp", "csc"), {})));
  EXPECT_TRUE(std::holds_alternative<NativeBinary>(classify(lang("cpp", "g++"), {})));
}

TEST(JavaClassName, DropsLastCharacterOfStem) {
  EXPECT_EQ(java_class_name("/w/Solution_.class"), "Solution");
  EXPECT_EQ(java_class_name("/w/A"), "");
}

} // namespace runcase::launch::test
