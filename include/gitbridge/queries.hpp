#pragma once
#include <gitbridge/process.hpp>
#include <gitbridge/status.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitbridge {

namespace timeouts {
inline constexpr int kMetadata = 5000;
inline constexpr int kDefault = 20000;
inline constexpr int kDiff = 25000;
inline constexpr int kStashPop = 30000;
inline constexpr int kCommit = 60000;
inline constexpr int kPush = 120000;
inline constexpr int kPull = 180000;
} // namespace timeouts

struct RepoInfo {
  bool ok = false;
  std::optional<std::string> branch;
  std::optional<std::string> upstream;
  std::vector<std::string> remotes;
};

enum class StatusMode {
  Full,    // -uall --ignored=matching
  Shallow, // --no-optional-locks, untracked excluded
  ShallowWithUntracked
};

// Work-tree check plus branch/upstream/remotes. Only a failed or negative
// work-tree check yields ok=false; the other fields degrade individually.
RepoInfo query_info(ProcessRunner &runner, const std::string &git,
                    const std::filesystem::path &repo);

CategorizedStatus query_status(ProcessRunner &runner, const std::string &git,
                               const std::filesystem::path &repo, StatusMode mode);

// Ignored paths only (`--ignored=matching` with untracked directories
// collapsed). Used for clean repositories, where the shallow query skips them.
std::vector<StatusEntry> query_ignored(ProcessRunner &runner, const std::string &git,
                                       const std::filesystem::path &repo);

// `rev-parse --abbrev-ref --symbolic-full-name @{u}`, nullopt when unset.
std::optional<std::string> query_upstream(ProcessRunner &runner, const std::string &git,
                                          const std::filesystem::path &repo,
                                          int timeout_ms = timeouts::kDefault);

std::vector<std::string> split_lines(const std::string &text);

} // namespace gitbridge
