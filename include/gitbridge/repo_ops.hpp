#pragma once
#include <gitbridge/auth.hpp>
#include <gitbridge/binary.hpp>
#include <gitbridge/overview.hpp>
#include <gitbridge/paths.hpp>
#include <gitbridge/process.hpp>
#include <gitbridge/queries.hpp>
#include <gitbridge/status.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gitbridge {

struct StatusResult {
  bool ok = true;
  CategorizedStatus status;
};

struct CommandOutput {
  bool ok = true;
  std::string out;
  std::string err;
};

struct DiffRequest {
  std::string path;
  std::string file;
  bool cached = false;
  std::optional<std::string> ref;
};

struct ConflictVersions {
  std::string file;
  std::string base;
  std::string ours;
  std::string theirs;
  std::optional<std::string> base_error;
  std::optional<std::string> ours_error;
  std::optional<std::string> theirs_error;
};

enum class ConflictSide { Ours, Theirs };

struct CheckIgnoreMatch {
  std::string source;
  std::optional<int> line;
  std::string pattern;
  std::string path;
};

struct CheckIgnoreResult {
  bool ok = true;
  std::vector<CheckIgnoreMatch> matches;
};

struct StashRequest {
  std::string path;
  bool include_untracked = true;
  std::string message;
};

struct StashResult {
  bool ok = true;
  bool created = false;
  std::optional<std::string> ref;
  std::string output;
};

struct StashPopRequest {
  std::string path;
  std::optional<std::string> ref;
  bool reinstate_index = true;
};

struct StashPopResult {
  bool ok = true;
  bool conflicts = false;
  bool no_stash = false;
  std::string output;
};

struct CommitRequest {
  std::string path;
  std::string message;
  bool amend = false;
  bool signoff = false;
  std::optional<std::string> user_name;
  std::optional<std::string> user_email;
};

struct PushRequest {
  std::string path;
  std::optional<std::string> remote;
  std::optional<std::string> branch;
  bool set_upstream = false;
  std::optional<std::string> token;
};

struct PullRequest {
  std::string path;
  std::optional<std::string> remote;
  std::optional<std::string> branch;
  bool rebase = false;
  bool ff_only = true;
  std::optional<std::string> token;
};

struct Identity {
  std::optional<std::string> name;
  std::optional<std::string> email;
};

struct IdentityResult {
  bool ok = false;
  std::filesystem::path repo_path;
  Identity effective;
  std::string source = "none"; // local | global | none
  Identity local;
  Identity global;
};

enum class IdentityScope { Local, Global };

struct SetIdentityRequest {
  std::string path;
  IdentityScope scope = IdentityScope::Local;
  std::string name;
  std::string email;
};

struct SetIdentityResult {
  bool ok = true;
  IdentityScope scope = IdentityScope::Local;
  std::filesystem::path repo_path;
};

struct DiagnoseResult {
  bool ok = false;
  std::filesystem::path repo_path;
  std::filesystem::path cwd;
  std::optional<std::string> configured;
  std::optional<std::string> env_path;
  std::optional<std::string> selected;
  std::optional<std::string> selected_error;
  std::vector<ProbeRow> candidates;
};

struct OverviewResult {
  bool ok = true;
  std::filesystem::path repos_root;
  std::vector<OverviewRow> repos;
};

// Public surface. Every call validates the repository path, validates file
// arguments, resolves git and then runs one or more git invocations.
class RepositoryOperations {
public:
  static constexpr std::size_t kConfigValueMax = 200;

  RepositoryOperations(ProcessRunner &runner, BinaryResolver &resolver, PathValidator validator)
      : runner_(runner), resolver_(resolver), validator_(std::move(validator)) {}

  RepoInfo info(const std::string &path);
  StatusResult status(const std::string &path);
  StatusResult status_overview(const std::string &path, bool include_untracked = false);

  // Raw patch text.
  std::string diff(const DiffRequest &req);

  void stage(const std::string &path, const std::vector<std::string> &files);
  void unstage(const std::string &path, const std::vector<std::string> &files);
  void untrack(const std::string &path, const std::vector<std::string> &files);
  CheckIgnoreResult check_ignore(const std::string &path, const std::vector<std::string> &files);
  void restore(const std::string &path, const std::vector<std::string> &files);

  ConflictVersions conflict_versions(const std::string &path, const std::string &file);
  void checkout_conflict(const std::string &path, const std::string &file, ConflictSide side);

  StashResult stash(const StashRequest &req);
  StashPopResult stash_pop(const StashPopRequest &req);

  CommandOutput commit(const CommitRequest &req);
  CommandOutput push(const PushRequest &req);
  CommandOutput pull(const PullRequest &req);

  DiagnoseResult diagnose(const std::string &path);
  IdentityResult identity(const std::string &path);
  SetIdentityResult set_identity(const SetIdentityRequest &req);

  OverviewResult repos_overview(const std::string &path, int max_repos = 200);

private:
  std::filesystem::path resolve_repo(const std::string &path) const;
  std::optional<std::string> auth_header(const std::filesystem::path &repo, const std::string &git,
                                         const std::optional<std::string> &token,
                                         const std::optional<std::string> &remote,
                                         Direction direction);

  SubprocessResult exec(const std::filesystem::path &repo, const std::vector<std::string> &argv,
                        int timeout_ms = timeouts::kDefault);

  ProcessRunner &runner_;
  BinaryResolver &resolver_;
  PathValidator validator_;
};

// Tries each recipe in order. A CommandFailure moves on to the next recipe;
// the last recipe's failure and every other error propagate.
void run_fallbacks(const char *op, const std::vector<std::function<void()>> &recipes);

// Parses `check-ignore -v -n -z` output: groups of source, line, pattern, path.
// Groups with an empty source (non-matching paths) are skipped.
std::vector<CheckIgnoreMatch> parse_check_ignore_z(const std::string &raw);

// Trims a git config value and rejects control characters or oversize input.
std::string clean_config_value(const std::string &value);

const char *to_string(IdentityScope s);

} // namespace gitbridge
