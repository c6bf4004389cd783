#include "runcase/IoRouter.hpp"
#include "runcase/Files.hpp"
#include "runcase/Log.hpp"

#include <fmt/core.h>

namespace runcase::io {

namespace {

// Relative names only ever resolve inside the working directory.
bool is_plain_name(std::string_view name) noexcept {
  return !name.empty() && name != "." && name != ".." && name.find('/') == std::string_view::npos;
}

} // namespace

auto input_mode(ExecutionRequest const& request) noexcept -> InputMode {
  return request.input_file_name_.empty() ? InputMode::Stream : InputMode::File;
}

auto output_mode(ExecutionRequest const& request) noexcept -> OutputMode {
  return request.output_file_name_.empty() ? OutputMode::Stream : OutputMode::File;
}

IoRouter::IoRouter(Notifier& notifier, OriginResolver resolver)
    : notifier_(notifier), resolver_(std::move(resolver)) {}

auto IoRouter::origin_of(std::string_view text) const -> std::string {
  return resolver_ ? resolver_(text) : std::string{};
}

auto IoRouter::prepare_input(ExecutionRequest const& request) -> std::string {
  auto const work_dir = request.working_directory();
  auto const origin   = origin_of(request.input_);

  if (!origin.empty()) {
    log::debug("input origin file: {}", origin);
    if (!is_plain_name(origin)) {
      notifier_.notify(ErrorKind::IoFailure, fmt::format("Refusing input origin file outside {}: {}", work_dir.string(), origin));
      return {};
    }
  }

  if (input_mode(request) == InputMode::Stream) {
    log::debug("writing input to stdin");
    if (origin.empty()) {
      return request.input_;
    }

    auto const origin_path = work_dir / origin;
    auto       content     = core::files::read_file(origin_path);
    if (!content) {
      notifier_.notify(
          ErrorKind::IoFailure, fmt::format("An error occurred when reading input from {}: {}", origin, content.error())
      );
      return {};
    }
    return std::move(*content);
  }

  log::debug("writing input to {}", request.input_file_name_);
  if (!is_plain_name(request.input_file_name_)) {
    notifier_.notify(
        ErrorKind::IoFailure, fmt::format("Refusing input file outside {}: {}", work_dir.string(), request.input_file_name_)
    );
    return {};
  }

  auto const input_path = work_dir / request.input_file_name_;
  if (origin.empty()) {
    if (auto written = core::files::write_file(input_path, request.input_); !written) {
      notifier_.notify(
          ErrorKind::IoFailure,
          fmt::format("An error occurred when writing input content to {}: {}", input_path.string(), written.error())
      );
    }
  } else {
    auto const origin_path = work_dir / origin;
    if (auto copied = core::files::copy_file(origin_path, input_path); !copied) {
      notifier_.notify(ErrorKind::IoFailure, fmt::format("An error occurred when copying input content: {}", copied.error()));
    }
  }
  return {};
}

void IoRouter::collect_output(ExecutionRequest const& request, RunResult& result) {
  if (output_mode(request) != OutputMode::File) {
    return;
  }

  auto const work_dir = request.working_directory();
  if (!is_plain_name(request.output_file_name_)) {
    notifier_.notify(
        ErrorKind::IoFailure,
        fmt::format("Refusing output file outside {}: {}", work_dir.string(), request.output_file_name_)
    );
    result.stdout_.clear();
    return;
  }

  auto const output_path = work_dir / request.output_file_name_;
  auto       content     = core::files::read_file(output_path);
  if (!content) {
    notifier_.notify(
        ErrorKind::IoFailure,
        fmt::format("An error occurred when reading output content from {}: {}", output_path.string(), content.error())
    );
    result.stdout_.clear();
    return;
  }

  log::debug("read {} bytes of output from {}", content->size(), output_path.string());
  result.stdout_ = std::move(*content);
}

} // namespace runcase::io
