#pragma once

#include <chrono>
#include <string_view>

namespace runcase::constant {

inline constexpr std::string_view EXE_NAME = "runcase";
inline constexpr std::string_view EXE_DESC = "Runs a candidate program against one test input";
inline constexpr std::string_view VERSION  = "v0.1.0-dev";

inline constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{3000};
inline constexpr std::chrono::milliseconds DEFAULT_SPAWN_TIMEOUT{10000};
// Deadlines are added to steady_clock::now(); larger values overflow it.
inline constexpr std::chrono::milliseconds MAX_TIMEOUT = std::chrono::hours{24};

// Flags exported to every candidate process.
inline constexpr std::string_view DEBUG_ENV   = "DEBUG";
inline constexpr std::string_view HARNESS_ENV = "CPH";

inline constexpr std::string_view ENV_TIMEOUT       = "RUNCASE_TIMEOUT_MS";
inline constexpr std::string_view ENV_SPAWN_TIMEOUT = "RUNCASE_SPAWN_TIMEOUT_MS";
inline constexpr std::string_view ENV_ONLINE_JUDGE  = "RUNCASE_ONLINE_JUDGE";
inline constexpr std::string_view ENV_VERBOSE       = "RUNCASE_VERBOSE";

inline constexpr std::string_view ORIGIN_MARKER = "@file:";

} // namespace runcase::constant
