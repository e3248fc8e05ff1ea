#include <gitbridge/errors.hpp>

#include <fmt/format.h>

namespace gitbridge {

const char *const kBinaryRemedy =
    "Install git or set GITBRIDGE_GIT_BINARY to the full path of the git binary.";

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::InvalidInput:
    return "invalid_input";
  case ErrorKind::ExecutableNotFound:
    return "executable_not_found";
  case ErrorKind::NotARepository:
    return "not_a_repository";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::CommandFailure:
    return "command_failure";
  case ErrorKind::AuthTransportMismatch:
    return "auth_transport_mismatch";
  }
  return "unknown";
}

NotARepositoryError::NotARepositoryError()
    : Error(ErrorKind::NotARepository,
            "Not a git repository. Set the repo path to a folder inside a git "
            "repo (or the repo root).") {}

TimeoutError::TimeoutError(int timeout_ms)
    : Error(ErrorKind::Timeout, fmt::format("git timeout after {}ms", timeout_ms)),
      timeout_ms_(timeout_ms) {}

} // namespace gitbridge
