#include <gitbridge/errors.hpp>
#include <gitbridge/paths.hpp>
#include <gitbridge/process.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace gitbridge {

bool is_repo_relative_path(const std::string &candidate) {
  if (trim(candidate).empty())
    return false;
  if (candidate.find('\0') != std::string::npos)
    return false;
  if (fs::path(candidate).is_absolute())
    return false;
  std::string norm = candidate;
  std::replace(norm.begin(), norm.end(), '\\', '/');
  if (norm == ".." || norm.rfind("../", 0) == 0)
    return false;
  if (norm.find("/../") != std::string::npos)
    return false;
  if (norm.size() >= 3 && norm.compare(norm.size() - 3, 3, "/..") == 0)
    return false;
  return true;
}

void require_repo_relative(const std::string &op, const std::string &file) {
  if (!is_repo_relative_path(file))
    throw InvalidInputError(fmt::format("Invalid file path for {}: {}", op, file));
}

void require_repo_relative(const std::string &op, const std::vector<std::string> &files) {
  for (const auto &f : files)
    require_repo_relative(op, f);
}

RootPathValidator::RootPathValidator(std::vector<fs::path> roots) {
  for (auto &r : roots) {
    std::error_code ec;
    auto abs = fs::absolute(r, ec);
    roots_.push_back((ec ? r : abs).lexically_normal());
  }
  if (roots_.empty())
    roots_.push_back(fs::current_path());
}

static bool is_prefix_of(const fs::path &root, const fs::path &p) {
  auto r = root.begin(), re = root.end();
  auto i = p.begin(), ie = p.end();
  for (; r != re; ++r, ++i) {
    // trailing separator of the root shows up as an empty element
    if (r->empty())
      continue;
    if (i == ie || *i != *r)
      return false;
  }
  return true;
}

bool RootPathValidator::within_roots(const fs::path &abs) const {
  const auto norm = abs.lexically_normal();
  return std::any_of(roots_.begin(), roots_.end(),
                     [&](const fs::path &root) { return is_prefix_of(root, norm); });
}

fs::path RootPathValidator::operator()(const std::string &p) const {
  if (trim(p).empty())
    throw InvalidInputError("Path must be a non-empty string.");
  if (p.find('\0') != std::string::npos)
    throw InvalidInputError("Invalid path (contains null byte).");

  const std::string candidate = trim(p);
  fs::path cp(candidate);
  if (cp.is_absolute()) {
    if (!within_roots(cp))
      throw InvalidInputError("Path is outside allowed roots.");
    return cp.lexically_normal();
  }

  auto resolved = (roots_.front() / cp).lexically_normal();
  if (!within_roots(resolved))
    throw InvalidInputError("Path is outside allowed roots.");
  return resolved;
}

} // namespace gitbridge
