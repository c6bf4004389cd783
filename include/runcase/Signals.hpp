#pragma once

#include <functional>
#include <string>

namespace runcase::core::signal {

// Writes to a pipe whose reader already exited must fail with EPIPE
// instead of killing the engine.
void ignore_broken_pipe();

// Blocks SIGINT and SIGTERM in the calling thread and hands each delivery
// to `handler` on a dedicated thread. Call before any other thread starts.
void watch_termination(std::function<void(int)> handler);

// "SIGTERM" style name, or "SIG<n>" for unknown numbers.
auto name(int signo) -> std::string;

// "ENOENT" style name, or "E<n>" for unknown numbers.
auto errno_name(int error) -> std::string;

} // namespace runcase::core::signal
