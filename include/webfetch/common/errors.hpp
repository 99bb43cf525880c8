#pragma once

#include <string>
#include <string_view>

namespace webfetch::common {

enum class ErrorKind {
  InvalidLocator,
  Timeout,
  NetworkFailure,
  ProcessLaunchFailure,
  ProcessExitFailure,
  EmptyOutput,
  Aborted,
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

/// Failure arm shared by every stage outcome.
struct StageFailure {
  ErrorKind kind = ErrorKind::NetworkFailure;
  std::string reason;
  std::string diagnostic;
};

[[nodiscard]] inline StageFailure aborted_failure() {
  return StageFailure{.kind = ErrorKind::Aborted, .reason = "Aborted", .diagnostic = {}};
}

} // namespace webfetch::common
