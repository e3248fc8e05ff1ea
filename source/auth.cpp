#include <gitbridge/auth.hpp>
#include <gitbridge/errors.hpp>
#include <gitbridge/queries.hpp>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace fs = std::filesystem;

namespace gitbridge {

std::string base64_encode(const std::string &in) {
  std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
  int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char *>(in.data()),
                          static_cast<int>(in.size()));
  return std::string(reinterpret_cast<const char *>(out.data()), n > 0 ? n : 0);
}

std::string basic_auth_header(const std::string &user, const std::string &password) {
  return "Authorization: Basic " + base64_encode(user + ":" + password);
}

bool is_http_url(const std::string &url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::optional<std::string> AuthHeaderBuilder::push_default(const fs::path &working_dir) {
  try {
    RunOptions o;
    o.timeout_ms = timeouts::kMetadata;
    auto r = runner_.run(working_dir, {git_, "config", "--get", "remote.pushDefault"}, o);
    auto v = trim(r.out);
    if (!v.empty())
      return v;
  } catch (const Error &e) {
    spdlog::debug("[auth] remote.pushDefault unset: {}", e.what());
  }
  return std::nullopt;
}

std::optional<std::string> AuthHeaderBuilder::upstream_remote(const fs::path &working_dir) {
  auto up = query_upstream(runner_, git_, working_dir, timeouts::kMetadata);
  if (!up)
    return std::nullopt;
  auto slash = up->find('/');
  if (slash == std::string::npos || slash == 0)
    return std::nullopt;
  return up->substr(0, slash);
}

std::string AuthHeaderBuilder::select_remote(const fs::path &working_dir,
                                             const AuthRequest &req) {
  if (req.explicit_remote && !req.explicit_remote->empty())
    return *req.explicit_remote;

  std::optional<std::string> guess;
  if (req.direction == Direction::Push) {
    guess = push_default(working_dir);
    if (!guess)
      guess = upstream_remote(working_dir);
  } else {
    guess = upstream_remote(working_dir);
    if (!guess)
      guess = push_default(working_dir);
  }
  return guess.value_or("origin");
}

std::string AuthHeaderBuilder::remote_url(const fs::path &working_dir, const std::string &remote,
                                          Direction direction) {
  RunOptions o;
  o.timeout_ms = timeouts::kMetadata;
  if (direction == Direction::Push) {
    try {
      return trim(runner_.run(working_dir, {git_, "remote", "get-url", "--push", remote}, o).out);
    } catch (const CommandFailure &e) {
      spdlog::debug("[auth] get-url --push {} failed: {}", remote, e.what());
    }
  }
  try {
    return trim(runner_.run(working_dir, {git_, "remote", "get-url", remote}, o).out);
  } catch (const CommandFailure &e) {
    spdlog::debug("[auth] get-url {} failed: {}", remote, e.what());
  }
  return {};
}

std::string AuthHeaderBuilder::build(const fs::path &working_dir, const AuthRequest &req) {
  const auto remote = select_remote(working_dir, req);
  const auto url = remote_url(working_dir, remote, req.direction);
  if (!is_http_url(url)) {
    throw AuthTransportMismatchError(fmt::format(
        "Remote '{}' is not HTTPS; token auth is only supported for HTTPS remotes. "
        "Configure an HTTPS remote or {} via SSH.",
        remote, req.direction == Direction::Push ? "push" : "pull"));
  }
  spdlog::debug("[auth] token auth for remote '{}'", remote);
  return basic_auth_header(kUsername, req.token);
}

} // namespace gitbridge
