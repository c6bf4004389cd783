#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace runcase::io {

// Maps test text to the name of the file holding its real content, or to
// an empty string when the text is literal.
using OriginResolver = std::function<std::string(std::string_view)>;

// Text whose trimmed content is one line "@file:<name>" refers to <name>.
auto origin_file_name(std::string_view text) -> std::string;

auto default_origin_resolver() -> OriginResolver;

} // namespace runcase::io
