#include "runcase/Judge.hpp"

#include <filesystem>
#include <vector>

#include <gtest/gtest.h>

#include "test_utils.h"

namespace runcase::judge::test {

using namespace std::chrono_literals;
using runcase::test::TempDir;
using runcase::test::write_script;
using runcase::test::write_text;

namespace {

class CountingCompiler final : public Compiler {
public:
  int  calls_   = 0;
  bool succeed_ = true;

  bool compile(Problem const& /*problem*/) override {
    ++calls_;
    return succeed_;
  }
};

class RecordingSink final : public ResultSink {
public:
  std::vector<TestVerdict> verdicts_;

  void publish(Problem const& /*problem*/, TestVerdict const& verdict) override {
    verdicts_.push_back(verdict);
  }
};

} // namespace

class TestCaseRunnerTest : public ::testing::Test {
protected:
  TempDir                  dir_;
  process::ProcessRegistry registry_;
  CollectingNotifier       notifier_;
  exec::Executor           executor_{EngineConfig{}, registry_, notifier_};
  CountingCompiler         compiler_;
  TrimmedJudge             judge_;
  RecordingSink            sink_;

  auto problem(std::string_view script, std::string input, std::string output) -> Problem {
    Problem problem;
    problem.bin_path_ = write_script(dir_ / "sol.bin", script);
    problem.src_path_ = dir_ / "sol.cpp";
    problem.language_ = LanguageDescriptor{"cpp", "g++", {}, false};
    problem.tests_.push_back(TestCase{1, std::move(input), std::move(output)});
    return problem;
  }

  auto runner(RunnerOptions options = {}) -> TestCaseRunner {
    return TestCaseRunner{executor_, compiler_, judge_, notifier_, &sink_, io::default_origin_resolver(), options};
  }
};

TEST(TrimmedJudge, IgnoresTrailingWhitespace) {
  TrimmedJudge judge;
  TestCase     test{1, "", "7\n8\n"};

  EXPECT_TRUE(judge.is_correct(test, "7\n8\n"));
  EXPECT_TRUE(judge.is_correct(test, "7  \r\n8\t\n\n\n"));
  EXPECT_TRUE(judge.is_correct(test, "7\n8"));
  EXPECT_FALSE(judge.is_correct(test, "7\n9\n"));
  EXPECT_FALSE(judge.is_correct(test, " 7\n8\n"));
  EXPECT_FALSE(judge.is_correct(test, "7\n\n8\n"));
}

TEST(ContainsSeparator, DetectsSlash) {
  EXPECT_TRUE(contains_separator("../in.txt"));
  EXPECT_TRUE(contains_separator("a/b"));
  EXPECT_FALSE(contains_separator("in.txt"));
  EXPECT_FALSE(contains_separator(""));
}

TEST_F(TestCaseRunnerTest, PassingRunCompilesRunsAndDeletes) {
  auto prob    = problem("read a; read b; echo $((a + b))", "3\n4\n", "7\n");
  auto verdict = runner().run_single(prob, 1);

  ASSERT_TRUE(verdict.has_value());
  EXPECT_TRUE(verdict->pass_);
  EXPECT_EQ(verdict->id_, 1);
  EXPECT_EQ(verdict->run_.stdout_, "7\n");
  EXPECT_EQ(compiler_.calls_, 1);
  EXPECT_FALSE(std::filesystem::exists(prob.bin_path_));
  ASSERT_EQ(sink_.verdicts_.size(), 1);
  EXPECT_TRUE(sink_.verdicts_.front().pass_);
}

TEST_F(TestCaseRunnerTest, SkipCompileKeepsArtifact) {
  auto prob    = problem("echo 7", "", "7\n");
  auto verdict = runner().run_single(prob, 1, true);

  ASSERT_TRUE(verdict.has_value());
  EXPECT_TRUE(verdict->pass_);
  EXPECT_EQ(compiler_.calls_, 0);
  EXPECT_TRUE(std::filesystem::exists(prob.bin_path_));
}

TEST_F(TestCaseRunnerTest, WrongAnswerFails) {
  auto verdict = runner().run_single(problem("echo 8", "", "7\n"), 1, true);

  ASSERT_TRUE(verdict.has_value());
  EXPECT_FALSE(verdict->pass_);
}

TEST_F(TestCaseRunnerTest, StderrFailsUnlessIgnored) {
  auto prob = problem("echo 7; echo debug >&2", "", "7\n");

  auto strict = runner().run_single(prob, 1, true);
  ASSERT_TRUE(strict.has_value());
  EXPECT_FALSE(strict->pass_);

  auto lenient = runner({.ignore_stderr_ = true}).run_single(prob, 1, true);
  ASSERT_TRUE(lenient.has_value());
  EXPECT_TRUE(lenient->pass_);
}

TEST_F(TestCaseRunnerTest, NonZeroExitFailsEvenWithCorrectOutput) {
  auto verdict = runner().run_single(problem("echo 7; exit 1", "", "7\n"), 1, true);

  ASSERT_TRUE(verdict.has_value());
  EXPECT_FALSE(verdict->pass_);
}

TEST_F(TestCaseRunnerTest, SeparatorInInputFileNameIsRefused) {
  auto prob             = problem("echo 7", "", "7\n");
  prob.input_file_name_ = "../in.txt";

  EXPECT_FALSE(runner().run_single(prob, 1).has_value());
  ASSERT_EQ(notifier_.notifications().size(), 1);
  EXPECT_EQ(notifier_.notifications().front().message_, "For security reason, input_file_name shouldn't contain '/'.");
  EXPECT_EQ(compiler_.calls_, 0);
  EXPECT_TRUE(sink_.verdicts_.empty());
}

TEST_F(TestCaseRunnerTest, SeparatorInOutputFileNameIsRefused) {
  auto prob              = problem("echo 7", "", "7\n");
  prob.output_file_name_ = "sub/out.txt";

  EXPECT_FALSE(runner().run_single(prob, 1).has_value());
  ASSERT_EQ(notifier_.notifications().size(), 1);
  EXPECT_EQ(notifier_.notifications().front().message_, "For security reason, output_file_name shouldn't contain '/'.");
}

TEST_F(TestCaseRunnerTest, UnknownTestIdYieldsNothing) {
  EXPECT_FALSE(runner().run_single(problem("echo 7", "", "7\n"), 42).has_value());
  EXPECT_EQ(compiler_.calls_, 0);
}

TEST_F(TestCaseRunnerTest, CompileFailureStopsBeforeRunning) {
  compiler_.succeed_ = false;
  auto prob          = problem("echo 7 > ran.txt", "", "");

  EXPECT_FALSE(runner().run_single(prob, 1).has_value());
  EXPECT_FALSE(std::filesystem::exists(dir_ / "ran.txt"));
}

TEST_F(TestCaseRunnerTest, ExpectedOutputFromOriginFile) {
  write_text(dir_ / "big.ans", "7\n");
  auto verdict = runner().run_single(problem("echo 7", "", "@file:big.ans"), 1, true);

  ASSERT_TRUE(verdict.has_value());
  EXPECT_TRUE(verdict->pass_);
}

TEST_F(TestCaseRunnerTest, MissingExpectedOriginIsNotFatal) {
  auto verdict = runner().run_single(problem("echo 7", "", "@file:missing.ans"), 1, true);

  ASSERT_TRUE(verdict.has_value());
  EXPECT_FALSE(verdict->pass_);
  EXPECT_TRUE(notifier_.notifications().empty());
}

TEST_F(TestCaseRunnerTest, OriginWithSeparatorIsRefused) {
  EXPECT_FALSE(runner().run_single(problem("cat", "@file:../in.txt", ""), 1, true).has_value());
  ASSERT_EQ(notifier_.notifications().size(), 1);
  EXPECT_EQ(
      notifier_.notifications().front().message_, "For security reason, input_origin_file_name shouldn't contain '/'."
  );
}

TEST_F(TestCaseRunnerTest, FileModeRoundTrip) {
  auto prob              = problem("read a < in.txt; echo $((a * 2)) > out.txt", "21\n", "42\n");
  prob.input_file_name_  = "in.txt";
  prob.output_file_name_ = "out.txt";

  auto verdict = runner().run_single(prob, 1, true);
  ASSERT_TRUE(verdict.has_value());
  EXPECT_TRUE(verdict->pass_);
}

} // namespace runcase::judge::test
