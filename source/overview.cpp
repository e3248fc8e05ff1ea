#include <gitbridge/errors.hpp>
#include <gitbridge/overview.hpp>
#include <gitbridge/queries.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <thread>

namespace fs = std::filesystem;

namespace gitbridge {

const char *to_string(ChangeKind k) {
  switch (k) {
  case ChangeKind::Conflicted:
    return "conflicted";
  case ChangeKind::Untracked:
    return "untracked";
  case ChangeKind::StagedAndUnstaged:
    return "staged+unstaged";
  case ChangeKind::Staged:
    return "staged";
  case ChangeKind::Unstaged:
    return "unstaged";
  case ChangeKind::Unknown:
    break;
  }
  return "unknown";
}

static ChangeKind classify(const ChangeFlags &f) {
  if (f.conflicted)
    return ChangeKind::Conflicted;
  if (f.untracked)
    return ChangeKind::Untracked;
  if (f.staged && f.unstaged)
    return ChangeKind::StagedAndUnstaged;
  if (f.staged)
    return ChangeKind::Staged;
  if (f.unstaged)
    return ChangeKind::Unstaged;
  return ChangeKind::Unknown;
}

// A stored state char is replaced when it is still blank/'?' or when the
// incoming one carries information.
static void merge_state(char &stored, char incoming) {
  if (incoming == '\0')
    return;
  if (stored == ' ' || stored == '?' || incoming != ' ')
    stored = incoming;
}

PathChangeMap merge_changes(const CategorizedStatus &st, std::size_t limit) {
  PathChangeMap out;
  auto touch = [&](const std::vector<StatusEntry> &bucket, bool ChangeFlags::*flag) {
    const auto n = std::min(limit, bucket.size());
    for (std::size_t i = 0; i < n; ++i) {
      const auto &e = bucket[i];
      if (e.path.empty())
        continue;
      auto &row = out[e.path];
      row.flags.*flag = true;
      if (e.original_path && !row.original_path)
        row.original_path = e.original_path;
      merge_state(row.index_state, e.index_state);
      merge_state(row.worktree_state, e.worktree_state);
    }
  };
  touch(st.conflicted, &ChangeFlags::conflicted);
  touch(st.untracked, &ChangeFlags::untracked);
  touch(st.unstaged, &ChangeFlags::unstaged);
  touch(st.staged, &ChangeFlags::staged);

  for (auto &[path, row] : out)
    row.kind = classify(row.flags);
  return out;
}

static std::vector<std::string> paths_of(const std::vector<StatusEntry> &xs, std::size_t limit) {
  std::vector<std::string> out;
  const auto n = std::min(limit, xs.size());
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i)
    out.push_back(xs[i].path);
  return out;
}

static BucketPaths bucket_paths(const CategorizedStatus &st, std::size_t limit) {
  return BucketPaths{paths_of(st.staged, limit), paths_of(st.unstaged, limit),
                     paths_of(st.untracked, limit), paths_of(st.conflicted, limit)};
}

static bool has_changes(const CategorizedStatus &st) {
  return !st.staged.empty() || !st.unstaged.empty() || !st.untracked.empty() ||
         !st.conflicted.empty();
}

OverviewRow OverviewAggregator::summarize(const RepositoryHandle &repo, bool include_untracked) {
  OverviewRow row;
  row.repo = repo;

  RepoInfo info;
  try {
    info = query_info(runner_, git_, repo.absolute_path);
  } catch (const std::exception &e) {
    spdlog::warn("[overview] info failed for {}: {}", repo.relative_path, e.what());
  }
  if (!info.ok)
    return row;

  row.ok = true;
  row.branch = info.branch;

  try {
    const auto shallow =
        query_status(runner_, git_, repo.absolute_path,
                     include_untracked ? StatusMode::ShallowWithUntracked : StatusMode::Shallow);
    if (!has_changes(shallow)) {
      const auto ignored =
          include_untracked ? shallow.ignored : query_ignored(runner_, git_, repo.absolute_path);
      row.ignored = paths_of(ignored, kWideLimit);
      row.ignored_count = ignored.size();
      return row;
    }

    CategorizedStatus full = shallow;
    try {
      full = query_status(runner_, git_, repo.absolute_path, StatusMode::Full);
    } catch (const Error &e) {
      spdlog::warn("[overview] full status failed for {}, keeping shallow: {}",
                   repo.relative_path, e.what());
    }

    row.dirty = true;
    row.counts = BucketCounts{full.staged.size(), full.unstaged.size(), full.untracked.size(),
                              full.conflicted.size()};
    row.changes_by_path = merge_changes(full, kWideLimit);
    row.changes = bucket_paths(full, kPathLimit);
    row.sample = bucket_paths(full, kSampleLimit);
    row.ignored = paths_of(full.ignored, kWideLimit);
    row.ignored_count = full.ignored.size();
  } catch (const std::exception &e) {
    spdlog::warn("[overview] status failed for {}: {}", repo.relative_path, e.what());
    OverviewRow minimal;
    minimal.repo = repo;
    minimal.ok = true;
    minimal.branch = info.branch;
    return minimal;
  }
  return row;
}

std::vector<OverviewRow> OverviewAggregator::build(const fs::path &root,
                                                   const OverviewOptions &opts) {
  const std::size_t limit = std::clamp<std::size_t>(opts.max_repos, 1, kMaxReposCap);
  const auto repos = scan_repositories(root, ScanOptions{kMaxDepth, limit});
  spdlog::info("[overview] {} repositories under {}", repos.size(), root.string());

  std::vector<OverviewRow> rows(repos.size());
  std::atomic<std::size_t> cursor{0};

  auto worker = [&] {
    for (;;) {
      const std::size_t i = cursor.fetch_add(1);
      if (i >= repos.size())
        return;
      rows[i] = summarize(repos[i], opts.include_untracked);
    }
  };

  const std::size_t n = std::min<std::size_t>(kWorkers, repos.size());
  std::vector<std::thread> pool;
  pool.reserve(n);
  for (std::size_t k = 0; k < n; ++k)
    pool.emplace_back(worker);
  for (auto &t : pool)
    t.join();

  auto key = [](const OverviewRow &r) -> const std::string & {
    return r.repo.relative_path.empty() ? r.repo.name : r.repo.relative_path;
  };
  std::stable_sort(rows.begin(), rows.end(), [&](const OverviewRow &a, const OverviewRow &b) {
    return path_less(key(a), key(b));
  });
  return rows;
}

} // namespace gitbridge
