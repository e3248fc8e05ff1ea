#include <gitbridge/scanner.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <set>

namespace fs = std::filesystem;

namespace gitbridge {

bool has_git_marker(const fs::path &dir) {
  std::error_code ec;
  auto st = fs::status(dir / kGitMarker, ec);
  if (ec)
    return false;
  return fs::is_directory(st) || fs::is_regular_file(st);
}

static std::vector<fs::path> child_dirs(const fs::path &dir) {
  std::vector<fs::path> out;
  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    spdlog::debug("[scan] skip {}: {}", dir.string(), ec.message());
    return out;
  }
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec)
      break;
    const auto name = it->path().filename().string();
    if (name.empty() || name[0] == '.')
      continue;
    std::error_code dec;
    if (!it->is_directory(dec) || dec)
      continue;
    out.push_back(it->path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<RepositoryHandle> scan_repositories(const fs::path &root,
                                                const ScanOptions &opts) {
  struct Item {
    fs::path dir;
    int depth;
  };
  std::deque<Item> queue;
  queue.push_back(Item{root, 0});
  std::set<fs::path> seen;
  std::vector<RepositoryHandle> repos;

  while (!queue.empty() && repos.size() < opts.max_results) {
    Item cur = std::move(queue.front());
    queue.pop_front();

    std::error_code ec;
    fs::path resolved = fs::canonical(cur.dir, ec);
    if (ec)
      resolved = fs::absolute(cur.dir, ec).lexically_normal();
    if (!seen.insert(resolved).second)
      continue;

    if (cur.depth > opts.max_depth)
      continue;
    if (cur.dir.filename() == kGitMarker)
      continue;

    if (cur.depth > 0 && has_git_marker(cur.dir)) {
      RepositoryHandle h;
      h.absolute_path = cur.dir;
      h.relative_path = cur.dir.lexically_relative(root).lexically_normal().generic_string();
      h.name = cur.dir.filename().string();
      repos.push_back(std::move(h));
      continue;
    }

    for (auto &child : child_dirs(cur.dir))
      queue.push_back(Item{std::move(child), cur.depth + 1});
  }
  return repos;
}

} // namespace gitbridge
