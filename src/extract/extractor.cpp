#include "webfetch/extract/extractor.hpp"

#include "webfetch/common/fs.hpp"
#include "webfetch/observability/global.hpp"
#include "webfetch/process/supervisor.hpp"

namespace webfetch::extract {

namespace {

common::StageFailure stage_failure(common::ErrorKind kind, std::string reason,
                                   std::string diagnostic = {}) {
  return common::StageFailure{
      .kind = kind, .reason = std::move(reason), .diagnostic = std::move(diagnostic)};
}

} // namespace

const std::vector<ExtractorCommand> &python_runners() {
  static const std::vector<ExtractorCommand> runners = {
      {.label = "uvx", .command = "uvx", .args = {"trafilatura", "--markdown", "--formatting"}},
      {.label = "uv",
       .command = "uv",
       .args = {"run", "--with", "trafilatura", "trafilatura", "--markdown", "--formatting"}},
      {.label = "pipx",
       .command = "pipx",
       .args = {"run", "trafilatura", "--markdown", "--formatting"}},
      {.label = "pip-run",
       .command = "pip-run",
       .args = {"trafilatura", "--", "-m", "trafilatura", "--markdown", "--formatting"}},
  };
  return runners;
}

bool probe_runner(const std::string &command, std::chrono::milliseconds timeout) {
  process::SpawnOptions options;
  options.capture_output = true;
  options.kill_grace = std::chrono::milliseconds(500);
  auto result = process::run_capture(command, {"--version"}, options, timeout);
  return result.ok() && result.value().exit.success();
}

std::optional<ExtractorCommand> detect_extractor(const config::ExtractorConfig &config,
                                                 const RunnerProbe &probe) {
  const std::string runner = common::to_lower(common::trim(config.runner));

  if (runner == "command" || (!common::trim(config.command).empty() && runner == "auto")) {
    if (common::trim(config.command).empty()) {
      return std::nullopt;
    }
    return ExtractorCommand{.label = "command", .command = config.command, .args = config.args};
  }

  for (const auto &candidate : python_runners()) {
    if (runner == candidate.label) {
      ExtractorCommand chosen = candidate;
      if (!config.args.empty()) {
        chosen.args = config.args;
      }
      return chosen;
    }
  }

  if (runner != "auto") {
    return std::nullopt;
  }
  for (const auto &candidate : python_runners()) {
    if (probe && probe(candidate.command)) {
      return candidate;
    }
  }
  return std::nullopt;
}

ContentExtractor::ContentExtractor(std::optional<ExtractorCommand> command,
                                   std::chrono::milliseconds kill_grace)
    : command_(std::move(command)), kill_grace_(kill_grace) {}

ExtractionOutcome ContentExtractor::extract(const std::string &markup,
                                            common::CancellationToken &cancel) {
  using common::ErrorKind;
  if (cancel.is_cancelled()) {
    return common::aborted_failure();
  }
  if (!command_.has_value()) {
    return stage_failure(ErrorKind::ProcessLaunchFailure,
                         "No Python tool runner found. Install one of: uv (recommended), pipx, "
                         "or pip-run.");
  }

  process::SpawnOptions options;
  options.input = markup;
  options.capture_output = true;
  options.kill_grace = kill_grace_;
  auto spawned = process::spawn(command_->command, command_->args, options);
  if (!spawned.ok()) {
    if (cancel.is_cancelled()) {
      return common::aborted_failure();
    }
    observability::record_error("extractor", spawned.error());
    return stage_failure(ErrorKind::ProcessLaunchFailure,
                         "Failed to run " + command_->command + " trafilatura: " + spawned.error());
  }
  auto handle = std::move(spawned).value();

  common::Result<process::ProcessExit> waited =
      common::Result<process::ProcessExit>::failure("not started");
  {
    process::ProcessHandle *raw = handle.get();
    common::CancelRegistration registration(cancel, [raw]() { raw->cancel(); });
    waited = handle->wait();
  }

  if (cancel.is_cancelled()) {
    return common::aborted_failure();
  }
  if (!waited.ok()) {
    return stage_failure(ErrorKind::ProcessExitFailure,
                         "Trafilatura extraction failed: " + waited.error());
  }

  const auto &exit = waited.value();
  const std::string stderr_text = common::trim(handle->stderr_text());
  observability::record_event("extractor", command_->label + " exited with " +
                                               (exit.signal != 0
                                                    ? "signal " + std::to_string(exit.signal)
                                                    : "code " + std::to_string(exit.exit_code)));
  if (!exit.success()) {
    const std::string code =
        exit.signal != 0 ? "signal " + std::to_string(exit.signal) : std::to_string(exit.exit_code);
    return stage_failure(ErrorKind::ProcessExitFailure,
                         "Trafilatura extraction failed (exit code " + code +
                             "): " + (stderr_text.empty() ? "(no error output)" : stderr_text),
                         stderr_text);
  }

  std::string text = common::trim(handle->stdout_text());
  if (text.empty()) {
    return stage_failure(ErrorKind::EmptyOutput,
                         "no content extracted: the page may be empty or use a format that "
                         "trafilatura cannot parse",
                         stderr_text);
  }
  return Extracted{.text = std::move(text)};
}

} // namespace webfetch::extract
