#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "runcase/Executor.hpp"
#include "runcase/Language.hpp"
#include "runcase/Notifier.hpp"
#include "runcase/Origin.hpp"
#include "runcase/Run.hpp"

namespace runcase::judge {

struct TestCase {
  int         id_ = 0;
  std::string input_;
  std::string output_;
};

struct Problem {
  std::filesystem::path src_path_;
  std::filesystem::path bin_path_;
  LanguageDescriptor    language_;
  std::vector<TestCase> tests_;
  std::string           input_file_name_;
  std::string           output_file_name_;
};

struct TestVerdict {
  RunResult run_;
  bool      pass_ = false;
  int       id_   = 0;
};

class Judge {
public:
  virtual ~Judge() = default;

  [[nodiscard]] virtual bool is_correct(TestCase const& test, std::string_view actual) const = 0;
};

// Ignores trailing whitespace on each line and trailing blank lines.
class TrimmedJudge final : public Judge {
public:
  [[nodiscard]] bool is_correct(TestCase const& test, std::string_view actual) const override;
};

class Compiler {
public:
  virtual ~Compiler() = default;

  virtual bool compile(Problem const& problem) = 0;
};

// For artifacts that are already built.
class NullCompiler final : public Compiler {
public:
  bool compile(Problem const& problem) override;
};

class ResultSink {
public:
  virtual ~ResultSink() = default;

  virtual void publish(Problem const& problem, TestVerdict const& verdict) = 0;
};

struct RunnerOptions {
  bool ignore_stderr_ = false;
};

// Validates, compiles, resolves origin references, executes, cleans up and
// judges a single test case.
class TestCaseRunner {
  exec::Executor&    executor_;
  Compiler&          compiler_;
  Judge const&       judge_;
  Notifier&          notifier_;
  ResultSink*        sink_;
  io::OriginResolver resolver_;
  RunnerOptions      options_;

public:
  TestCaseRunner(
      exec::Executor&    executor,
      Compiler&          compiler,
      Judge const&       judge,
      Notifier&          notifier,
      ResultSink*        sink     = nullptr,
      io::OriginResolver resolver = io::default_origin_resolver(),
      RunnerOptions      options  = {}
  );

  auto run_single(Problem const& problem, int id, bool skip_compile = false) -> std::optional<TestVerdict>;

private:
  bool check_file_name(std::string_view field, std::string_view name);
};

[[nodiscard]] bool contains_separator(std::string_view name) noexcept;

} // namespace runcase::judge
