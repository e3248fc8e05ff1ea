#include <gitbridge/errors.hpp>
#include <gitbridge/queries.hpp>

#include <spdlog/spdlog.h>

#include <sstream>

namespace fs = std::filesystem;

namespace gitbridge {

static RunOptions with_timeout(int ms) {
  RunOptions o;
  o.timeout_ms = ms;
  return o;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> out;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    auto t = trim(line);
    if (!t.empty())
      out.push_back(std::move(t));
  }
  return out;
}

std::optional<std::string> query_upstream(ProcessRunner &runner, const std::string &git,
                                          const fs::path &repo, int timeout_ms) {
  try {
    auto r = runner.run(repo, {git, "rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{u}"},
                        with_timeout(timeout_ms));
    auto v = trim(r.out);
    if (!v.empty())
      return v;
  } catch (const Error &e) {
    spdlog::debug("[query] no upstream in {}: {}", repo.string(), e.what());
  }
  return std::nullopt;
}

RepoInfo query_info(ProcessRunner &runner, const std::string &git, const fs::path &repo) {
  RepoInfo info;
  try {
    auto inside = runner.run(repo, {git, "rev-parse", "--is-inside-work-tree"}, RunOptions{});
    if (trim(inside.out).rfind("true", 0) != 0)
      return info;
  } catch (const Error &e) {
    spdlog::debug("[query] {} is not a work tree: {}", repo.string(), e.what());
    return info;
  }
  info.ok = true;

  try {
    auto r = runner.run(repo, {git, "rev-parse", "--abbrev-ref", "HEAD"}, RunOptions{});
    auto b = trim(r.out);
    if (!b.empty())
      info.branch = b;
  } catch (const Error &e) {
    spdlog::debug("[query] no branch in {}: {}", repo.string(), e.what());
  }

  info.upstream = query_upstream(runner, git, repo);

  try {
    auto r = runner.run(repo, {git, "remote"}, RunOptions{});
    info.remotes = split_lines(r.out);
  } catch (const Error &e) {
    spdlog::debug("[query] no remotes in {}: {}", repo.string(), e.what());
  }
  return info;
}

CategorizedStatus query_status(ProcessRunner &runner, const std::string &git,
                               const fs::path &repo, StatusMode mode) {
  std::vector<std::string> argv{git};
  RunOptions o;
  if (mode == StatusMode::Full) {
    argv.insert(argv.end(), {"status", "--porcelain=v1", "-z", "-uall", "--ignored=matching"});
  } else {
    // --no-optional-locks is a global option and must precede the subcommand
    const bool untracked = mode == StatusMode::ShallowWithUntracked;
    argv.insert(argv.end(), {"--no-optional-locks", "status", "--porcelain=v1", "-z",
                             untracked ? "-uall" : "-uno"});
    if (untracked)
      argv.push_back("--ignored=matching");
    o.timeout_ms = timeouts::kMetadata;
  }

  auto r = runner.run(repo, argv, o);
  auto st = categorize(parse_status_z(r.out));
  if (mode == StatusMode::Shallow) {
    st.untracked.clear();
    st.ignored.clear();
  }
  return st;
}

std::vector<StatusEntry> query_ignored(ProcessRunner &runner, const std::string &git,
                                       const fs::path &repo) {
  auto r = runner.run(repo,
                      {git, "--no-optional-locks", "status", "--porcelain=v1", "-z",
                       "--untracked-files=normal", "--ignored=matching"},
                      with_timeout(timeouts::kMetadata));
  return categorize(parse_status_z(r.out)).ignored;
}

} // namespace gitbridge
