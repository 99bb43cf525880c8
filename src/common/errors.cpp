#include "webfetch/common/errors.hpp"

namespace webfetch::common {

std::string_view error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidLocator:
    return "invalid_locator";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::NetworkFailure:
    return "network_failure";
  case ErrorKind::ProcessLaunchFailure:
    return "process_launch_failure";
  case ErrorKind::ProcessExitFailure:
    return "process_exit_failure";
  case ErrorKind::EmptyOutput:
    return "empty_output";
  case ErrorKind::Aborted:
    return "aborted";
  }
  return "unknown";
}

} // namespace webfetch::common
