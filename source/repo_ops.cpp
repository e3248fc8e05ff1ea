#include <gitbridge/errors.hpp>
#include <gitbridge/markers.hpp>
#include <gitbridge/repo_ops.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace fs = std::filesystem;

namespace gitbridge {

const char *to_string(IdentityScope s) {
  return s == IdentityScope::Global ? "global" : "local";
}

void run_fallbacks(const char *op, const std::vector<std::function<void()>> &recipes) {
  for (std::size_t i = 0; i < recipes.size(); ++i) {
    try {
      recipes[i]();
      return;
    } catch (const CommandFailure &e) {
      if (i + 1 == recipes.size())
        throw;
      spdlog::warn("[ops] {}: recipe {} failed, trying next: {}", op, i + 1, e.what());
    }
  }
}

std::vector<CheckIgnoreMatch> parse_check_ignore_z(const std::string &raw) {
  // Empty fields are positional: a non-matching path arrives as "\0\0\0path\0".
  std::vector<std::string> tokens;
  std::size_t start = 0;
  while (start < raw.size()) {
    auto end = raw.find('\0', start);
    if (end == std::string::npos)
      end = raw.size();
    tokens.emplace_back(raw, start, end - start);
    start = end + 1;
  }

  std::vector<CheckIgnoreMatch> out;
  for (std::size_t i = 0; i + 3 < tokens.size(); i += 4) {
    if (tokens[i].empty())
      continue;
    CheckIgnoreMatch m;
    m.source = tokens[i];
    errno = 0;
    char *endp = nullptr;
    long v = std::strtol(tokens[i + 1].c_str(), &endp, 10);
    if (endp != tokens[i + 1].c_str() && errno == 0)
      m.line = static_cast<int>(v);
    m.pattern = tokens[i + 2];
    m.path = tokens[i + 3];
    out.push_back(std::move(m));
  }
  return out;
}

std::string clean_config_value(const std::string &value) {
  auto v = trim(value);
  if (v.find_first_of(std::string("\0\r\n", 3)) != std::string::npos)
    throw InvalidInputError("Invalid git config value (contains control characters).");
  if (v.size() > RepositoryOperations::kConfigValueMax)
    throw InvalidInputError("Invalid git config value (too long).");
  return v;
}

static std::optional<std::string> non_empty(std::string s) {
  if (s.empty())
    return std::nullopt;
  return s;
}

static std::optional<std::string> clean_opt(const std::optional<std::string> &v) {
  if (!v)
    return std::nullopt;
  return non_empty(trim(*v));
}

fs::path RepositoryOperations::resolve_repo(const std::string &path) const {
  return validator_(path.empty() ? std::string("/") : path);
}

SubprocessResult RepositoryOperations::exec(const fs::path &repo,
                                            const std::vector<std::string> &argv,
                                            int timeout_ms) {
  RunOptions o;
  o.timeout_ms = timeout_ms;
  return runner_.run(repo, argv, o);
}

std::optional<std::string> RepositoryOperations::auth_header(
    const fs::path &repo, const std::string &git, const std::optional<std::string> &token,
    const std::optional<std::string> &remote, Direction direction) {
  auto clean = clean_opt(token);
  if (!clean)
    return std::nullopt;
  AuthHeaderBuilder builder(runner_, git);
  return builder.build(repo, AuthRequest{*clean, remote, direction});
}

RepoInfo RepositoryOperations::info(const std::string &path) {
  const auto repo = resolve_repo(path);
  std::string git;
  try {
    git = resolver_.resolve(repo);
  } catch (const Error &e) {
    spdlog::warn("[ops] info: {}", e.what());
    return RepoInfo{};
  }
  return query_info(runner_, git, repo);
}

StatusResult RepositoryOperations::status(const std::string &path) {
  const auto repo = resolve_repo(path);
  const auto git = resolver_.resolve(repo);
  return StatusResult{true, query_status(runner_, git, repo, StatusMode::Full)};
}

StatusResult RepositoryOperations::status_overview(const std::string &path,
                                                   bool include_untracked) {
  const auto repo = resolve_repo(path);
  const auto git = resolver_.resolve(repo);
  return StatusResult{true,
                      query_status(runner_, git, repo,
                                   include_untracked ? StatusMode::ShallowWithUntracked
                                                     : StatusMode::Shallow)};
}

std::string RepositoryOperations::diff(const DiffRequest &req) {
  const auto repo = resolve_repo(req.path);
  require_repo_relative("git_diff", req.file);
  const auto git = resolver_.resolve(repo);

  const auto ref = clean_opt(req.ref);
  if (!ref) {
    std::vector<std::string> argv{git, "diff"};
    if (req.cached)
      argv.push_back("--cached");
    argv.insert(argv.end(), {"--", req.file});
    return exec(repo, argv, timeouts::kDiff).out;
  }

  // working tree, then index, then the file as a brand new one
  auto worktree = exec(repo, {git, "diff", *ref, "--", req.file}, timeouts::kDiff).out;
  if (!trim(worktree).empty())
    return worktree;

  try {
    auto staged = exec(repo, {git, "diff", "--cached", *ref, "--", req.file}, timeouts::kDiff).out;
    if (!trim(staged).empty())
      return staged;
  } catch (const CommandFailure &e) {
    spdlog::warn("[ops] diff --cached {} failed: {}", *ref, e.what());
  }

  try {
    RunOptions o;
    o.timeout_ms = timeouts::kDiff;
    o.ok_codes = {0, 1};
    return runner_.run(repo, {git, "diff", "--no-index", "--", "/dev/null", req.file}, o).out;
  } catch (const CommandFailure &e) {
    spdlog::warn("[ops] diff --no-index {} failed: {}", req.file, e.what());
  }
  return {};
}

void RepositoryOperations::stage(const std::string &path, const std::vector<std::string> &files) {
  const auto repo = resolve_repo(path);
  const auto git = resolver_.resolve(repo);
  if (files.empty()) {
    exec(repo, {git, "add", "-A"});
    return;
  }
  require_repo_relative("git_stage", files);

  std::vector<std::string> existing, missing;
  for (const auto &f : files) {
    std::error_code ec;
    if (fs::exists(repo / f, ec))
      existing.push_back(f);
    else
      missing.push_back(f);
  }
  if (!existing.empty()) {
    std::vector<std::string> argv{git, "add", "-A", "--"};
    argv.insert(argv.end(), existing.begin(), existing.end());
    exec(repo, argv);
  }
  if (!missing.empty()) {
    std::vector<std::string> argv{git, "rm", "--cached", "--ignore-unmatch", "--"};
    argv.insert(argv.end(), missing.begin(), missing.end());
    exec(repo, argv);
  }
}

static std::vector<std::string> with_targets(std::vector<std::string> argv,
                                             const std::vector<std::string> &files) {
  if (files.empty())
    argv.push_back(".");
  else
    argv.insert(argv.end(), files.begin(), files.end());
  return argv;
}

void RepositoryOperations::unstage(const std::string &path,
                                   const std::vector<std::string> &files) {
  const auto repo = resolve_repo(path);
  const auto git = resolver_.resolve(repo);
  require_repo_relative("git_unstage", files);

  run_fallbacks("unstage", {
      [&] { exec(repo, with_targets({git, "restore", "--staged", "--"}, files)); },
      [&] { exec(repo, with_targets({git, "reset", "-q", "HEAD", "--"}, files)); },
  });
}

void RepositoryOperations::untrack(const std::string &path,
                                   const std::vector<std::string> &files) {
  const auto repo = resolve_repo(path);
  const auto git = resolver_.resolve(repo);
  if (files.empty())
    throw InvalidInputError("git_untrack requires at least one file path.");
  require_repo_relative("git_untrack", files);

  std::vector<std::string> argv{git, "rm", "--cached", "--"};
  argv.insert(argv.end(), files.begin(), files.end());
  exec(repo, argv, timeouts::kDiff);
}

CheckIgnoreResult RepositoryOperations::check_ignore(const std::string &path,
                                                     const std::vector<std::string> &files) {
  const auto repo = resolve_repo(path);
  const auto git = resolver_.resolve(repo);
  if (files.empty())
    throw InvalidInputError("git_check_ignore requires at least one file path.");
  require_repo_relative("git_check_ignore", files);

  std::string input;
  for (const auto &f : files) {
    input += f;
    input.push_back('\0');
  }
  RunOptions o;
  o.timeout_ms = timeouts::kMetadata;
  o.ok_codes = {0, 1};
  o.stdin_payload = std::move(input);
  auto r = runner_.run(repo, {git, "check-ignore", "-v", "-n", "-z", "--stdin"}, o);
  return CheckIgnoreResult{true, parse_check_ignore_z(r.out)};
}

void RepositoryOperations::restore(const std::string &path,
                                   const std::vector<std::string> &files) {
  const auto repo = resolve_repo(path);
  const auto git = resolver_.resolve(repo);
  require_repo_relative("git_restore", files);

  run_fallbacks("restore", {
      [&] {
        exec(repo,
             with_targets({git, "restore", "--source=HEAD", "--staged", "--worktree", "--"}, files));
      },
      [&] {
        try {
          exec(repo, with_targets({git, "reset", "-q", "HEAD", "--"}, files));
        } catch (const CommandFailure &e) {
          spdlog::warn("[ops] restore: reset failed, checkout decides: {}", e.what());
        }
        exec(repo, with_targets({git, "checkout", "--"}, files));
      },
  });
}

ConflictVersions RepositoryOperations::conflict_versions(const std::string &path,
                                                         const std::string &file) {
  const auto repo = resolve_repo(path);
  require_repo_relative("git_conflict_versions", file);
  const auto git = resolver_.resolve(repo);

  ConflictVersions cv;
  cv.file = file;
  auto read_stage = [&](int stage, std::string &content, std::optional<std::string> &error) {
    try {
      content = exec(repo, {git, "show", fmt::format(":{}:{}", stage, file)}).out;
    } catch (const Error &e) {
      content.clear();
      error = e.what();
    }
  };
  read_stage(1, cv.base, cv.base_error);
  read_stage(2, cv.ours, cv.ours_error);
  read_stage(3, cv.theirs, cv.theirs_error);
  return cv;
}

void RepositoryOperations::checkout_conflict(const std::string &path, const std::string &file,
                                             ConflictSide side) {
  const auto repo = resolve_repo(path);
  require_repo_relative("git_checkout_conflict", file);
  const auto git = resolver_.resolve(repo);
  exec(repo,
       {git, "checkout", side == ConflictSide::Theirs ? "--theirs" : "--ours", "--", file},
       timeouts::kDiff);
}

StashResult RepositoryOperations::stash(const StashRequest &req) {
  const auto repo = resolve_repo(req.path);
  const auto git = resolver_.resolve(repo);

  auto list = [&]() -> std::string {
    try {
      return exec(repo, {git, "stash", "list"}, timeouts::kMetadata).out;
    } catch (const Error &e) {
      spdlog::warn("[ops] stash list failed: {}", e.what());
      return {};
    }
  };

  const auto before = list();
  std::vector<std::string> argv{git, "stash", "push"};
  if (req.include_untracked)
    argv.push_back("-u");
  const auto message = trim(req.message);
  if (!message.empty())
    argv.insert(argv.end(), {"-m", message});
  const auto r = exec(repo, argv);
  const auto after = list();

  StashResult res;
  res.output = combined_output(r);
  const bool nothing =
      markers::match(res.output, markers::stash_push()) == Outcome::NothingToStash;
  res.created = !trim(after).empty() && trim(after) != trim(before) && !nothing;
  if (res.created) {
    const auto first = after.substr(0, after.find('\n'));
    res.ref = non_empty(trim(first.substr(0, first.find(':'))));
  }
  return res;
}

StashPopResult RepositoryOperations::stash_pop(const StashPopRequest &req) {
  const auto repo = resolve_repo(req.path);
  const auto git = resolver_.resolve(repo);

  std::vector<std::string> argv{git, "stash", "pop"};
  if (req.reinstate_index)
    argv.push_back("--index");
  if (auto ref = clean_opt(req.ref))
    argv.push_back(*ref);

  RunOptions o;
  o.timeout_ms = timeouts::kStashPop;
  o.ok_codes = {0, 1};
  const auto r = runner_.run(repo, argv, o);

  StashPopResult res;
  res.output = combined_output(r);
  if (auto outcome = markers::match(res.output, markers::stash_pop())) {
    switch (*outcome) {
    case Outcome::Conflict:
      res.conflicts = true;
      break;
    case Outcome::NoStashEntries:
      res.no_stash = true;
      break;
    case Outcome::Error:
      res.ok = false;
      break;
    default:
      break;
    }
  }
  return res;
}

CommandOutput RepositoryOperations::commit(const CommitRequest &req) {
  const auto repo = resolve_repo(req.path);
  const auto git = resolver_.resolve(repo);

  std::vector<std::string> argv{git};
  if (auto name = clean_opt(req.user_name))
    argv.insert(argv.end(), {"-c", "user.name=" + *name});
  if (auto email = clean_opt(req.user_email))
    argv.insert(argv.end(), {"-c", "user.email=" + *email});
  argv.push_back("commit");
  if (req.amend)
    argv.push_back("--amend");
  if (req.signoff)
    argv.push_back("--signoff");
  const auto message = trim(req.message);
  if (!message.empty())
    argv.insert(argv.end(), {"-m", message});

  auto r = exec(repo, argv, timeouts::kCommit);
  return CommandOutput{true, std::move(r.out), std::move(r.err)};
}

CommandOutput RepositoryOperations::push(const PushRequest &req) {
  const auto repo = resolve_repo(req.path);
  const auto git = resolver_.resolve(repo);
  const auto remote = clean_opt(req.remote);
  const auto branch = clean_opt(req.branch);
  const auto header = auth_header(repo, git, req.token, remote, Direction::Push);

  std::vector<std::string> argv{git};
  if (header)
    argv.insert(argv.end(), {"-c", "http.extraHeader=" + *header});
  argv.push_back("push");
  if (req.set_upstream)
    argv.push_back("--set-upstream");
  if (remote)
    argv.push_back(*remote);
  if (branch)
    argv.push_back(*branch);

  spdlog::info("[ops] push {} (token auth: {})", repo.string(), header ? "yes" : "no");
  auto r = exec(repo, argv, timeouts::kPush);
  return CommandOutput{true, std::move(r.out), std::move(r.err)};
}

CommandOutput RepositoryOperations::pull(const PullRequest &req) {
  const auto repo = resolve_repo(req.path);
  const auto git = resolver_.resolve(repo);
  const auto remote = clean_opt(req.remote);
  const auto branch = clean_opt(req.branch);
  const auto header = auth_header(repo, git, req.token, remote, Direction::Pull);

  std::vector<std::string> argv{git};
  if (header)
    argv.insert(argv.end(), {"-c", "http.extraHeader=" + *header});
  argv.push_back("pull");
  // ff-only unless a reconcile strategy was asked for
  if (req.ff_only)
    argv.push_back("--ff-only");
  else
    argv.insert(argv.end(), {req.rebase ? "--rebase=true" : "--rebase=false", "--ff"});
  if (remote)
    argv.push_back(*remote);
  if (branch)
    argv.push_back(*branch);

  spdlog::info("[ops] pull {} (token auth: {})", repo.string(), header ? "yes" : "no");
  auto r = exec(repo, argv, timeouts::kPull);
  return CommandOutput{true, std::move(r.out), std::move(r.err)};
}

DiagnoseResult RepositoryOperations::diagnose(const std::string &path) {
  DiagnoseResult d;
  d.repo_path = resolve_repo(path);
  std::error_code ec;
  d.cwd = fs::current_path(ec);
  d.configured = resolver_.override_path();
  if (const char *p = std::getenv("PATH"))
    d.env_path = std::string(p);
  d.candidates = resolver_.probe_all(d.repo_path);
  try {
    d.selected = resolver_.resolve(d.repo_path);
  } catch (const Error &e) {
    d.selected_error = e.what();
  }
  d.ok = d.selected.has_value();
  return d;
}

IdentityResult RepositoryOperations::identity(const std::string &path) {
  IdentityResult res;
  res.repo_path = resolve_repo(path);
  const auto git = resolver_.resolve(res.repo_path);

  auto get = [&](std::vector<std::string> key) -> std::optional<std::string> {
    std::vector<std::string> argv{git, "config", "--get"};
    argv.insert(argv.end(), key.begin(), key.end());
    try {
      return non_empty(trim(exec(res.repo_path, argv, timeouts::kMetadata).out));
    } catch (const CommandFailure &) {
      // exit code 1: key not set
      return std::nullopt;
    }
  };

  res.local = Identity{get({"user.name"}), get({"user.email"})};
  res.global = Identity{get({"--global", "user.name"}), get({"--global", "user.email"})};
  res.effective.name = res.local.name ? res.local.name : res.global.name;
  res.effective.email = res.local.email ? res.local.email : res.global.email;

  if (res.local.name || res.local.email)
    res.source = "local";
  else if (res.global.name || res.global.email)
    res.source = "global";
  res.ok = res.effective.name && res.effective.email;
  return res;
}

SetIdentityResult RepositoryOperations::set_identity(const SetIdentityRequest &req) {
  const auto repo = resolve_repo(req.path);
  const auto git = resolver_.resolve(repo);
  const auto name = clean_config_value(req.name);
  const auto email = clean_config_value(req.email);
  if (name.empty())
    throw InvalidInputError("Missing user.name");
  if (email.empty())
    throw InvalidInputError("Missing user.email");

  std::vector<std::string> prefix{git, "config"};
  if (req.scope == IdentityScope::Global)
    prefix.push_back("--global");
  auto set = [&](const char *key, const std::string &value) {
    auto argv = prefix;
    argv.insert(argv.end(), {key, value});
    exec(repo, argv, timeouts::kMetadata);
  };
  set("user.name", name);
  set("user.email", email);
  spdlog::info("[ops] identity set ({}) for {}", to_string(req.scope), repo.string());
  return SetIdentityResult{true, req.scope, repo};
}

OverviewResult RepositoryOperations::repos_overview(const std::string &path, int max_repos) {
  OverviewResult res;
  res.repos_root = resolve_repo(path);
  const auto git = resolver_.resolve(res.repos_root);
  OverviewOptions opts;
  opts.max_repos = static_cast<std::size_t>(
      std::clamp(max_repos, 1, static_cast<int>(OverviewAggregator::kMaxReposCap)));
  res.repos = OverviewAggregator(runner_, git).build(res.repos_root, opts);
  return res;
}

} // namespace gitbridge
