#include "runcase/Cli.hpp"
#include "runcase/Config.hpp"
#include "runcase/Executor.hpp"
#include "runcase/Files.hpp"
#include "runcase/Judge.hpp"
#include "runcase/Log.hpp"
#include "runcase/Notifier.hpp"
#include "runcase/ProcessRegistry.hpp"
#include "runcase/Signals.hpp"

#include <cstdio>
#include <filesystem>
#include <string_view>

#include <fmt/core.h>

namespace {

constexpr int EXIT_OK    = 0;
constexpr int EXIT_FAIL  = 1;
constexpr int EXIT_USAGE = 2;

auto default_compiler(std::string_view language) -> std::string {
  if (language == "python") {
    return "python3";
  }
  if (language == "ruby") {
    return "ruby";
  }
  if (language == "js") {
    return "node";
  }
  if (language == "java") {
    return "javac";
  }
  if (language == "csharp") {
    return "dotnet";
  }
  return std::string{language};
}

auto usage_error(runcase::cli::ArgumentParser const& parser, std::string_view message) -> int {
  fmt::print(stderr, "Error: {}\n\n{}", message, parser.help());
  return EXIT_USAGE;
}

// Prints the run result; the judged verdict when expected output was given.
class ReportSink final : public runcase::judge::ResultSink {
  bool judged_;

public:
  explicit ReportSink(bool judged) : judged_(judged) {}

  void publish(runcase::judge::Problem const& /*problem*/, runcase::judge::TestVerdict const& verdict) override {
    fmt::print("{}", runcase::format_result(verdict.run_));
    if (judged_) {
      fmt::print("verdict: {}\n", verdict.pass_ ? "passed" : "failed");
    }
  }
};

} // namespace

int main(int argc, char* argv[]) {
  using namespace runcase;

  auto parser = cli::create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args) {
    return usage_error(parser, args.error());
  }
  if (args->has("help")) {
    parser.print_help();
    return EXIT_OK;
  }
  if (args->has("version")) {
    cli::ArgumentParser::print_version();
    return EXIT_OK;
  }
  if (args->positional_.size() != 1) {
    return usage_error(parser, "exactly one artifact path is required");
  }

  auto env_config = load_config_from_env();
  if (!env_config) {
    return usage_error(parser, env_config.error());
  }
  auto config = cli::apply_arguments(*args, *env_config);
  if (!config) {
    return usage_error(parser, config.error());
  }
  log::set_verbose(config->verbose_);

  if (args->has("input") && args->has("input-path")) {
    return usage_error(parser, "--input and --input-path are mutually exclusive");
  }

  judge::TestCase test{.id_ = 0};
  if (auto input = args->get<std::string>("input")) {
    test.input_ = *input;
  } else if (auto input_path = args->get<std::string>("input-path")) {
    auto content = core::files::read_file(*input_path);
    if (!content) {
      log::error("{}", content.error());
      return EXIT_FAIL;
    }
    test.input_ = std::move(*content);
  }

  bool const judged = args->has("expected");
  if (auto expected_path = args->get<std::string>("expected")) {
    auto content = core::files::read_file(*expected_path);
    if (!content) {
      log::error("{}", content.error());
      return EXIT_FAIL;
    }
    test.output_ = std::move(*content);
  }

  auto const language_name = args->get<std::string>("lang").value_or("cpp");

  judge::Problem problem;
  problem.bin_path_ = std::filesystem::absolute(args->positional_.front());
  problem.src_path_ = problem.bin_path_;
  problem.language_ = LanguageDescriptor{
      .name_         = language_name,
      .compiler_     = args->get<std::string>("compiler").value_or(default_compiler(language_name)),
      .args_         = args->get_all("arg"),
      .skip_compile_ = args->has("skip-compile"),
  };
  problem.input_file_name_  = args->get<std::string>("input-file").value_or("");
  problem.output_file_name_ = args->get<std::string>("output-file").value_or("");
  problem.tests_.push_back(std::move(test));

  process::ProcessRegistry registry;
  StderrNotifier           notifier;
  exec::Executor           executor{*config, registry, notifier};

  core::signal::watch_termination([&executor](int signo) {
    log::warn("received {}, stopping running processes", core::signal::name(signo));
    executor.kill_all();
  });

  judge::NullCompiler   compiler;
  judge::TrimmedJudge   trimmed;
  ReportSink            sink{judged};
  judge::TestCaseRunner runner{
      executor, compiler, trimmed, notifier, &sink, io::default_origin_resolver(), {.ignore_stderr_ = args->has("ignore-stderr")}
  };

  // The artifact is prebuilt and belongs to the caller: no compile, no delete.
  auto verdict = runner.run_single(problem, 0, true);
  if (!verdict) {
    return EXIT_FAIL;
  }
  if (judged) {
    return verdict->pass_ ? EXIT_OK : EXIT_FAIL;
  }
  return verdict->run_.did_error(args->has("ignore-stderr")) ? EXIT_FAIL : EXIT_OK;
}
