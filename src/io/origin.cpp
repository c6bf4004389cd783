#include "runcase/Origin.hpp"
#include "runcase/Constants.hpp"

namespace runcase::io {

namespace {

auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view whitespace = " \t\r\n";
  auto                       first      = s.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(whitespace);
  return s.substr(first, last - first + 1);
}

} // namespace

auto origin_file_name(std::string_view text) -> std::string {
  auto content = trim(text);
  if (!content.starts_with(constant::ORIGIN_MARKER) || content.find('\n') != std::string_view::npos) {
    return {};
  }
  return std::string{trim(content.substr(constant::ORIGIN_MARKER.size()))};
}

auto default_origin_resolver() -> OriginResolver {
  return [](std::string_view text) { return origin_file_name(text); };
}

} // namespace runcase::io
