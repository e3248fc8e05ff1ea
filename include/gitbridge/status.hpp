#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitbridge {

struct StatusEntry {
  std::string path;
  char index_state = ' ';
  char worktree_state = ' ';
  std::optional<std::string> original_path; // renames/copies only
};

struct CategorizedStatus {
  std::vector<StatusEntry> staged;
  std::vector<StatusEntry> unstaged;
  std::vector<StatusEntry> untracked;
  std::vector<StatusEntry> conflicted;
  std::vector<StatusEntry> ignored;
};

// Decodes `git status --porcelain=v1 -z`. Records shorter than three bytes are
// skipped; a rename/copy record takes the following record as its path and
// keeps its own path as original_path.
std::vector<StatusEntry> parse_status_z(std::string_view raw);

CategorizedStatus categorize(const std::vector<StatusEntry> &entries);

bool is_conflict_code(char x, char y);

// Collation order used for every path listing.
bool path_less(const std::string &a, const std::string &b);

struct PathLess {
  bool operator()(const std::string &a, const std::string &b) const { return path_less(a, b); }
};

} // namespace gitbridge
