#pragma once
#include <gitbridge/process.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace gitbridge {

enum class Direction { Push, Pull };

struct AuthRequest {
  std::string token;
  std::optional<std::string> explicit_remote;
  Direction direction = Direction::Push;
};

// Builds the one-shot `Authorization: Basic ...` header for token auth over
// HTTP(S). The header goes to `-c http.extraHeader=` of a single invocation.
class AuthHeaderBuilder {
public:
  static constexpr const char *kUsername = "x-access-token";

  AuthHeaderBuilder(ProcessRunner &runner, std::string git)
      : runner_(runner), git_(std::move(git)) {}

  std::string build(const std::filesystem::path &working_dir, const AuthRequest &req);

  std::string select_remote(const std::filesystem::path &working_dir,
                            const AuthRequest &req);
  std::string remote_url(const std::filesystem::path &working_dir, const std::string &remote,
                         Direction direction);

private:
  std::optional<std::string> push_default(const std::filesystem::path &working_dir);
  std::optional<std::string> upstream_remote(const std::filesystem::path &working_dir);

  ProcessRunner &runner_;
  std::string git_;
};

std::string base64_encode(const std::string &in);
std::string basic_auth_header(const std::string &user, const std::string &password);
bool is_http_url(const std::string &url);

} // namespace gitbridge
