#include <gitbridge/binary.hpp>
#include <gitbridge/errors.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace gitbridge {

const std::vector<std::string> &BinaryResolver::default_candidates() {
  static const std::vector<std::string> c = {
      "git", "/usr/bin/git", "/bin/git", "/usr/local/bin/git", "/opt/homebrew/bin/git",
  };
  return c;
}

BinaryResolver::BinaryResolver(ProcessRunner &runner,
                               std::optional<std::string> override_path,
                               std::vector<std::string> candidates)
    : runner_(runner), override_(std::move(override_path)),
      candidates_(std::move(candidates)) {
  if (override_ && override_->empty())
    override_.reset();
}

std::string BinaryResolver::probe(const fs::path &working_dir,
                                  const std::string &candidate) {
  RunOptions o;
  o.timeout_ms = kProbeTimeoutMs;
  auto r = runner_.run(working_dir, {candidate, "--version"}, o);
  return trim(r.out);
}

std::string BinaryResolver::detect(const fs::path &working_dir) {
  if (override_) {
    try {
      (void)probe(working_dir, *override_);
      return *override_;
    } catch (const Error &e) {
      throw ExecutableNotFoundError(fmt::format(
          "Configured git binary '{}' does not respond to --version: {}. {}",
          *override_, e.what(), kBinaryRemedy));
    }
  }

  for (const auto &c : candidates_) {
    try {
      auto version = probe(working_dir, c);
      spdlog::debug("[resolve] {} -> {}", c, version);
      return c;
    } catch (const Error &e) {
      spdlog::debug("[resolve] {} rejected: {}", c, e.what());
    }
  }
  throw ExecutableNotFoundError(
      fmt::format("Git executable not found. {}", kBinaryRemedy));
}

std::string BinaryResolver::resolve(const fs::path &working_dir) {
  std::lock_guard<std::mutex> lk(mu_);
  if (cached_dir_ && *cached_dir_ == working_dir)
    return cached_binary_;

  cached_dir_.reset();
  cached_binary_ = detect(working_dir);
  cached_dir_ = working_dir;
  return cached_binary_;
}

std::vector<ProbeRow> BinaryResolver::probe_all(const fs::path &working_dir) {
  std::vector<ProbeRow> rows;
  rows.reserve(candidates_.size());
  for (const auto &c : candidates_) {
    ProbeRow row{c, std::nullopt, std::nullopt};
    try {
      auto v = probe(working_dir, c);
      if (!v.empty())
        row.version = v;
    } catch (const Error &e) {
      row.error = e.what();
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace gitbridge
