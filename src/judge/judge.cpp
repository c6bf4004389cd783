#include "runcase/Judge.hpp"
#include "runcase/Log.hpp"

#include <vector>

namespace runcase::judge {

namespace {

auto rtrim(std::string_view line) noexcept -> std::string_view {
  auto const end = line.find_last_not_of(" \t\r\n\f\v");
  return end == std::string_view::npos ? std::string_view{} : line.substr(0, end + 1);
}

// Lines with trailing whitespace stripped, trailing blank lines dropped.
auto normalized_lines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;

  size_t begin = 0;
  while (begin <= text.size()) {
    auto const end = text.find('\n', begin);
    if (end == std::string_view::npos) {
      lines.push_back(rtrim(text.substr(begin)));
      break;
    }
    lines.push_back(rtrim(text.substr(begin, end - begin)));
    begin = end + 1;
  }

  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  return lines;
}

} // namespace

bool TrimmedJudge::is_correct(TestCase const& test, std::string_view actual) const {
  return normalized_lines(test.output_) == normalized_lines(actual);
}

bool NullCompiler::compile(Problem const& problem) {
  log::debug("{} is already built, nothing to compile", problem.bin_path_.string());
  return true;
}

bool contains_separator(std::string_view name) noexcept {
  return name.find('/') != std::string_view::npos;
}

} // namespace runcase::judge
