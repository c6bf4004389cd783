#include "runcase/Cli.hpp"
#include "runcase/Constants.hpp"

#include <algorithm>
#include <cstdio>
#include <iterator>

#include <fmt/core.h>

namespace runcase::cli {

namespace {

// Collects up to `nargs` values following argv[i]; a leading '-' ends the run.
auto take_values(int& i, int argc, char const* const* argv, size_t nargs) -> std::vector<std::string> {
  std::vector<std::string> values;
  values.reserve(nargs);
  for (size_t k = 0; k < nargs && i + 1 < argc; ++k) {
    ++i;
    if (std::string_view{argv[i]}.starts_with("-")) {
      --i;
      break;
    }
    values.emplace_back(argv[i]);
  }
  return values;
}

void store(
    std::unordered_map<std::string, std::vector<std::string>>& given,
    std::string const&                                         name,
    bool                                                       repeatable,
    std::vector<std::string>                                   values
) {
  auto& slot = given[name];
  if (repeatable) {
    std::ranges::move(values, std::back_inserter(slot));
  } else {
    slot = std::move(values);
  }
}

} // namespace

bool Arguments::has(std::string const& name) const noexcept {
  return args_.contains(name);
}

auto Arguments::get_all(std::string const& name) const -> std::vector<std::string> {
  auto it = args_.find(name);
  if (it == args_.end()) {
    return {};
  }
  return it->second;
}

Option::Option(std::string name, std::string short_name) noexcept
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::default_value(std::string value) -> Option& {
  default_value_ = {std::move(value)};
  return *this;
}

auto Option::nargs(size_t n) noexcept -> Option& {
  nargs_ = n;
  return *this;
}

auto Option::repeatable() noexcept -> Option& {
  repeatable_ = true;
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, std::string short_name) -> Option& {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

auto ArgumentParser::parse(int argc, char const* const* argv) const -> core::Result<Arguments> {
  Arguments                                                 result;
  std::unordered_map<std::string, std::vector<std::string>> given;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};

    if (arg == "--") {
      for (++i; i < argc; ++i) {
        result.positional_.emplace_back(argv[i]);
      }
      break;
    }

    if (arg.starts_with("--")) {
      std::string_view name        = arg.substr(2);
      size_t           eq_pos      = name.find('=');
      std::string_view option_name = name.substr(0, eq_pos);

      auto option_it = std::ranges::find_if(options_, [option_name](Option const& opt) {
        return opt.name_ == option_name;
      });

      if (option_it == options_.end()) {
        return std::unexpected(fmt::format("Unknown option: --{}", option_name));
      }

      if (option_it->nargs_ == 0) {
        if (eq_pos != std::string_view::npos) {
          return std::unexpected(fmt::format("Flag option --{} does not accept a value", option_name));
        }
        given[option_it->name_] = {"true"};
        continue;
      }

      std::vector<std::string> values;
      if (eq_pos != std::string_view::npos) {
        values.emplace_back(name.substr(eq_pos + 1));
      } else {
        values = take_values(i, argc, argv, option_it->nargs_);
      }

      if (values.size() < option_it->nargs_) {
        return std::unexpected(
            fmt::format("Option --{} requires {} arguments, got {}", option_name, option_it->nargs_, values.size())
        );
      }

      store(given, option_it->name_, option_it->repeatable_, std::move(values));
    } else if (arg.starts_with("-") && arg.size() > 1) {
      for (size_t j = 1; j < arg.size(); ++j) {
        char short_opt{arg[j]};

        auto option_it = std::ranges::find_if(options_, [short_opt](Option const& opt) {
          return !opt.short_name_.empty() && opt.short_name_.front() == short_opt;
        });

        if (option_it == options_.end()) {
          return std::unexpected(fmt::format("Unknown option: -{}", short_opt));
        }

        if (option_it->nargs_ == 0) {
          given[option_it->name_] = {"true"};
          continue;
        }

        if (j < arg.size() - 1) {
          return std::unexpected(
              fmt::format("Option -{} requires a value and cannot be combined with other short options", short_opt)
          );
        }

        auto values = take_values(i, argc, argv, option_it->nargs_);
        if (values.size() < option_it->nargs_) {
          return std::unexpected(
              fmt::format("Option -{} requires {} arguments, got {}", short_opt, option_it->nargs_, values.size())
          );
        }

        store(given, option_it->name_, option_it->repeatable_, std::move(values));
      }
    } else {
      result.positional_.emplace_back(arg);
    }
  }

  for (auto const& option : options_) {
    if (auto it = given.find(option.name_); it != given.end()) {
      result.args_[option.name_] = std::move(it->second);
    } else if (option.default_value_) {
      result.args_[option.name_] = *option.default_value_;
    }
  }

  return result;
}

auto ArgumentParser::help() const -> std::string {
  std::string out = fmt::format("Usage: {}", name_);
  if (!options_.empty()) {
    out += " [OPTIONS]";
  }
  out += " <artifact>\n\n";

  if (!desc_.empty()) {
    out += fmt::format("{}\n\n", desc_);
  }

  if (!options_.empty()) {
    out += "Options:\n";
    for (auto const& option : options_) {
      out += "  ";

      if (!option.short_name_.empty()) {
        out += fmt::format("-{}", option.short_name_);
        if (!option.name_.empty()) {
          out += ", ";
        }
      }

      if (!option.name_.empty()) {
        out += fmt::format("--{}", option.name_);
      }

      if (option.nargs_ > 0) {
        out += " <value>";
        if (option.nargs_ > 1) {
          out += "...";
        }
      }

      if (!option.description_.empty()) {
        out += fmt::format("\n    {}", option.description_);
      }

      if (option.default_value_) {
        out += fmt::format(" (default: {})", option.default_value_->front());
      }

      out += "\n";
    }
  }
  return out;
}

void ArgumentParser::print_help() const {
  fmt::print("{}", help());
}

void ArgumentParser::print_version() {
  fmt::print("{} {} {}\n", constant::EXE_NAME, constant::EXE_DESC, constant::VERSION);
}

auto create_default_arg_parser() -> ArgumentParser {
  // clang-format off
  ArgumentParser parser(std::string{constant::EXE_NAME}, std::string{constant::EXE_DESC});

  parser.add_argument("lang", "l")
    .nargs(1)
    .default_value("cpp")
    .desc("Language of the artifact (cpp, c, rust, go, python, ruby, js, java, csharp, ...)");
  parser.add_argument("compiler")
    .nargs(1)
    .desc("Compiler or interpreter command configured for the language");
  parser.add_argument("arg", "a")
    .nargs(1)
    .repeatable()
    .desc("Extra interpreter argument, may be given more than once");
  parser.add_argument("skip-compile")
    .desc("The language is interpreted; the artifact is never deleted");
  parser.add_argument("input", "i")
    .nargs(1)
    .desc("Test input text");
  parser.add_argument("input-path")
    .nargs(1)
    .desc("Read the test input from this file");
  parser.add_argument("input-file")
    .nargs(1)
    .desc("Deliver input through this file in the artifact's directory instead of stdin");
  parser.add_argument("output-file")
    .nargs(1)
    .desc("Collect output from this file in the artifact's directory instead of stdout");
  parser.add_argument("expected", "e")
    .nargs(1)
    .desc("Judge the output against the expected output in this file");
  parser.add_argument("timeout", "t")
    .nargs(1)
    .desc("Deadline in milliseconds before SIGTERM");
  parser.add_argument("spawn-timeout")
    .nargs(1)
    .desc("Hard limit in milliseconds before SIGKILL");
  parser.add_argument("online-judge")
    .desc("Define ONLINE_JUDGE for JVM runs");
  parser.add_argument("ignore-stderr")
    .desc("Output on stderr does not count as an error");
  parser.add_argument("verbose", "v")
    .desc("Enable verbose output");
  parser.add_argument("help", "h")
    .desc("Show help message");
  parser.add_argument("version", "V")
    .desc("Show version message");

  return parser;
  // clang-format on
}

auto apply_arguments(Arguments const& args, EngineConfig base) -> core::Result<EngineConfig> {
  if (auto value = args.get<std::string>("timeout")) {
    auto parsed = parse_millis(*value);
    if (!parsed) {
      return std::unexpected(fmt::format("--timeout: {}", parsed.error()));
    }
    base.timeout_ = *parsed;
  }
  if (auto value = args.get<std::string>("spawn-timeout")) {
    auto parsed = parse_millis(*value);
    if (!parsed) {
      return std::unexpected(fmt::format("--spawn-timeout: {}", parsed.error()));
    }
    base.spawn_timeout_ = *parsed;
  }
  if (args.has("online-judge")) {
    base.online_judge_ = true;
  }
  if (args.has("verbose")) {
    base.verbose_ = true;
  }
  return validate_config(std::move(base));
}

} // namespace runcase::cli
