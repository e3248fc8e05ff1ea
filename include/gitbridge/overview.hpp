#pragma once
#include <gitbridge/process.hpp>
#include <gitbridge/scanner.hpp>
#include <gitbridge/status.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gitbridge {

enum class ChangeKind { Conflicted, Untracked, StagedAndUnstaged, Staged, Unstaged, Unknown };

const char *to_string(ChangeKind k);

struct ChangeFlags {
  bool staged = false;
  bool unstaged = false;
  bool untracked = false;
  bool conflicted = false;
};

struct PathChange {
  ChangeFlags flags;
  char index_state = ' ';
  char worktree_state = ' ';
  std::optional<std::string> original_path;
  ChangeKind kind = ChangeKind::Unknown;
};

// Keyed in path collation order, like the bucket listings.
using PathChangeMap = std::map<std::string, PathChange, PathLess>;

struct BucketCounts {
  std::size_t staged = 0;
  std::size_t unstaged = 0;
  std::size_t untracked = 0;
  std::size_t conflicted = 0;
};

struct BucketPaths {
  std::vector<std::string> staged;
  std::vector<std::string> unstaged;
  std::vector<std::string> untracked;
  std::vector<std::string> conflicted;
};

struct OverviewRow {
  RepositoryHandle repo;
  bool ok = false;
  std::optional<std::string> branch;
  bool dirty = false;
  BucketCounts counts;
  BucketPaths sample;
  // filled for dirty repositories only
  PathChangeMap changes_by_path;
  BucketPaths changes;
  std::vector<std::string> ignored;
  std::size_t ignored_count = 0;
};

struct OverviewOptions {
  std::size_t max_repos = 200;
  bool include_untracked = false;
};

class OverviewAggregator {
public:
  static constexpr int kWorkers = 4;
  static constexpr int kMaxDepth = 4;
  static constexpr std::size_t kMaxReposCap = 500;
  static constexpr std::size_t kSampleLimit = 8;
  static constexpr std::size_t kPathLimit = 250;
  static constexpr std::size_t kWideLimit = 800;

  OverviewAggregator(ProcessRunner &runner, std::string git)
      : runner_(runner), git_(std::move(git)) {}

  std::vector<OverviewRow> build(const std::filesystem::path &root,
                                 const OverviewOptions &opts = {});

  OverviewRow summarize(const RepositoryHandle &repo, bool include_untracked);

private:
  ProcessRunner &runner_;
  std::string git_;
};

// Per-path merge of the four change buckets (ignored excluded).
PathChangeMap merge_changes(const CategorizedStatus &st, std::size_t limit);

} // namespace gitbridge
