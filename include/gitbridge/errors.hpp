#pragma once
#include <stdexcept>
#include <string>

namespace gitbridge {

enum class ErrorKind {
  InvalidInput,
  ExecutableNotFound,
  NotARepository,
  Timeout,
  CommandFailure,
  AuthTransportMismatch
};

const char *to_string(ErrorKind k);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class InvalidInputError : public Error {
public:
  explicit InvalidInputError(const std::string &msg)
      : Error(ErrorKind::InvalidInput, msg) {}
};

class ExecutableNotFoundError : public Error {
public:
  explicit ExecutableNotFoundError(const std::string &msg)
      : Error(ErrorKind::ExecutableNotFound, msg) {}
};

class NotARepositoryError : public Error {
public:
  NotARepositoryError();
};

class TimeoutError : public Error {
public:
  explicit TimeoutError(int timeout_ms);
  int timeout_ms() const { return timeout_ms_; }

private:
  int timeout_ms_;
};

// Non-accepted exit code. Also the error class fallback recipes treat as
// "not supported by this git".
class CommandFailure : public Error {
public:
  CommandFailure(const std::string &msg, int exit_code, std::string out = {},
                 std::string err = {})
      : Error(ErrorKind::CommandFailure, msg), exit_code_(exit_code),
        stdout_(std::move(out)), stderr_(std::move(err)) {}

  int exit_code() const { return exit_code_; }
  const std::string &stdout_text() const { return stdout_; }
  const std::string &stderr_text() const { return stderr_; }

private:
  int exit_code_;
  std::string stdout_;
  std::string stderr_;
};

class AuthTransportMismatchError : public Error {
public:
  explicit AuthTransportMismatchError(const std::string &msg)
      : Error(ErrorKind::AuthTransportMismatch, msg) {}
};

extern const char *const kBinaryRemedy;

} // namespace gitbridge
