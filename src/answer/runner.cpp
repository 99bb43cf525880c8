#include "webfetch/answer/runner.hpp"

#include "webfetch/answer/event_stream.hpp"
#include "webfetch/common/fs.hpp"
#include "webfetch/observability/global.hpp"
#include "webfetch/process/supervisor.hpp"

namespace webfetch::answer {

std::string build_answer_prompt(const std::string &content, const std::string &instruction) {
  return "Web page content:\n---\n" + content + "\n---\n\n" + instruction;
}

std::vector<std::string> build_answer_args(const AnswerRequest &request) {
  std::vector<std::string> args = {"--mode", "json", "-p", "--no-session", "--no-tools"};
  if (!request.model.empty()) {
    args.push_back("--model");
    args.push_back(request.model);
  }
  if (!request.thinking_level.empty()) {
    args.push_back("--thinking");
    args.push_back(request.thinking_level);
  }
  args.push_back(build_answer_prompt(request.content, request.instruction));
  return args;
}

AnswerRunner::AnswerRunner(std::string command, std::chrono::milliseconds kill_grace)
    : command_(std::move(command)), kill_grace_(kill_grace) {}

AnswerOutcome AnswerRunner::answer(const AnswerRequest &request,
                                   common::CancellationToken &cancel) {
  using common::ErrorKind;
  if (cancel.is_cancelled()) {
    return common::aborted_failure();
  }

  process::SpawnOptions options;
  options.capture_output = true;
  options.kill_grace = kill_grace_;
  auto spawned = process::spawn(command_, build_answer_args(request), options);
  if (!spawned.ok()) {
    if (cancel.is_cancelled()) {
      return common::aborted_failure();
    }
    observability::record_error("answerer", spawned.error());
    return common::StageFailure{.kind = ErrorKind::ProcessLaunchFailure,
                                .reason = "Failed to spawn " + command_ +
                                          " sub-agent: " + spawned.error(),
                                .diagnostic = {}};
  }
  auto handle = std::move(spawned).value();

  EventStreamParser parser;
  handle->set_stdout_callback([&parser](std::string_view chunk) { parser.feed(chunk); });

  common::Result<process::ProcessExit> waited =
      common::Result<process::ProcessExit>::failure("not started");
  {
    process::ProcessHandle *raw = handle.get();
    common::CancelRegistration registration(cancel, [raw]() { raw->cancel(); });
    waited = handle->wait();
  }
  parser.finish();

  if (cancel.is_cancelled()) {
    return common::aborted_failure();
  }
  if (!waited.ok()) {
    return common::StageFailure{.kind = ErrorKind::ProcessExitFailure,
                                .reason = "Sub-agent failed: " + waited.error(),
                                .diagnostic = {}};
  }

  const auto &exit = waited.value();
  observability::record_event("answerer", "exited with code " + std::to_string(exit.exit_code) +
                                              " after " + std::to_string(parser.events_seen()) +
                                              " events");

  // Text salvaged from the stream counts even when the process failed afterwards.
  if (!parser.last_answer_text().empty()) {
    return Answered{.text = parser.last_answer_text()};
  }
  const std::string stderr_text = common::trim(handle->stderr_text());
  if (!exit.success()) {
    const std::string code =
        exit.signal != 0 ? "signal " + std::to_string(exit.signal) : std::to_string(exit.exit_code);
    return common::StageFailure{.kind = ErrorKind::ProcessExitFailure,
                                .reason = "Sub-agent failed (exit code " + code + "): " +
                                          (stderr_text.empty() ? "(no output)" : stderr_text),
                                .diagnostic = stderr_text};
  }
  return common::StageFailure{.kind = ErrorKind::EmptyOutput,
                              .reason = "Sub-agent returned no response",
                              .diagnostic = stderr_text};
}

} // namespace webfetch::answer
