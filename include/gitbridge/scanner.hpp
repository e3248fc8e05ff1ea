#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace gitbridge {

inline constexpr const char *kGitMarker = ".git";

struct RepositoryHandle {
  std::filesystem::path absolute_path;
  std::string relative_path; // always '/'-separated
  std::string name;
};

struct ScanOptions {
  int max_depth = 4;
  std::size_t max_results = 200;
};

// Breadth-first search for repository roots below `root` (the root itself is
// never reported). Repositories are not descended into.
std::vector<RepositoryHandle> scan_repositories(const std::filesystem::path &root,
                                                const ScanOptions &opts = {});

bool has_git_marker(const std::filesystem::path &dir);

} // namespace gitbridge
