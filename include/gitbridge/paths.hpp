#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace gitbridge {

// Turns a caller-supplied repository path into an absolute, allowed path.
// Throws InvalidInputError on rejection.
using PathValidator = std::function<std::filesystem::path(const std::string &)>;

// Relative, non-empty, NUL-free and not escaping through "..".
bool is_repo_relative_path(const std::string &candidate);

void require_repo_relative(const std::string &op, const std::string &file);
void require_repo_relative(const std::string &op, const std::vector<std::string> &files);

class RootPathValidator {
public:
  explicit RootPathValidator(std::vector<std::filesystem::path> roots);

  std::filesystem::path operator()(const std::string &p) const;

  bool within_roots(const std::filesystem::path &abs) const;
  const std::vector<std::filesystem::path> &roots() const { return roots_; }

private:
  std::vector<std::filesystem::path> roots_;
};

} // namespace gitbridge
