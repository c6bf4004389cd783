#pragma once

#include <expected>
#include <string>

namespace runcase::core {

template<typename T, typename U = std::string>
using Result = std::expected<T, U>;

} // namespace runcase::core
