#include <catch2/catch_all.hpp>
#include <gitbridge/errors.hpp>
#include <gitbridge/repo_ops.hpp>

#include <filesystem>
#include <fstream>

#include <stdlib.h>

using namespace gitbridge;
namespace fs = std::filesystem;

static bool have_git() {
  SubprocessRunner r;
  try {
    r.run(fs::temp_directory_path(), {"git", "--version"}, RunOptions{});
    return true;
  } catch (const Error &) {
    return false;
  }
}

static void write(const fs::path &p, const std::string &text) {
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  o << text;
}

TEST_CASE("round trip against a real repository") {
  if (!have_git()) {
    WARN("git not installed; skipping");
    return;
  }

  auto root = fs::temp_directory_path() / "gitbridge_it";
  fs::remove_all(root);
  auto repo = root / "proj";
  fs::create_directories(repo);

  SubprocessRunner runner;
  runner.run(repo, {"git", "init", "-q"}, RunOptions{});

  BinaryResolver resolver(runner, std::nullopt);
  RootPathValidator validator({root});
  RepositoryOperations ops(runner, resolver, validator);

  ops.set_identity(SetIdentityRequest{repo.string(), IdentityScope::Local, "Test User",
                                      "test@example.com"});
  auto id = ops.identity(repo.string());
  REQUIRE(id.ok);
  REQUIRE(id.source == "local");

  write(repo / "a.txt", "one\n");
  ops.stage(repo.string(), {"a.txt"});
  auto st = ops.status(repo.string());
  REQUIRE(st.status.staged.size() == 1);

  CommitRequest c;
  c.path = repo.string();
  c.message = "initial";
  ops.commit(c);

  auto info = ops.info(repo.string());
  REQUIRE(info.ok);
  REQUIRE(info.branch.has_value());
  REQUIRE_FALSE(info.upstream.has_value());

  write(repo / "a.txt", "one\nchanged\n");
  write(repo / "b.txt", "new\n");
  st = ops.status("proj");
  REQUIRE(st.status.unstaged.size() == 1);
  REQUIRE(st.status.untracked.size() == 1);
  REQUIRE(st.status.untracked[0].path == "b.txt");

  auto patch = ops.diff(DiffRequest{repo.string(), "a.txt", false, std::nullopt});
  REQUIRE(patch.find("+changed") != std::string::npos);
  auto added = ops.diff(DiffRequest{repo.string(), "b.txt", false, std::string("HEAD")});
  REQUIRE(added.find("+new") != std::string::npos);

  auto ignored = ops.check_ignore(repo.string(), {"a.txt"});
  REQUIRE(ignored.matches.empty());

  auto stash = ops.stash(StashRequest{repo.string(), true, "wip"});
  REQUIRE(stash.created);
  REQUIRE(stash.ref == std::optional<std::string>("stash@{0}"));
  REQUIRE(ops.status(repo.string()).status.unstaged.empty());

  auto again = ops.stash(StashRequest{repo.string(), true, ""});
  REQUIRE_FALSE(again.created);

  auto pop = ops.stash_pop(StashPopRequest{repo.string(), std::nullopt, true});
  REQUIRE(pop.ok);
  REQUIRE_FALSE(pop.conflicts);
  REQUIRE(ops.status(repo.string()).status.unstaged.size() == 1);

  ops.restore(repo.string(), {"a.txt"});
  REQUIRE(ops.status(repo.string()).status.unstaged.empty());

  auto overview = ops.repos_overview(root.string());
  REQUIRE(overview.repos.size() == 1);
  REQUIRE(overview.repos[0].repo.relative_path == "proj");
  REQUIRE(overview.repos[0].ok);
  REQUIRE_FALSE(overview.repos[0].dirty);
}

TEST_CASE("check_ignore reports matching paths only") {
  if (!have_git()) {
    WARN("git not installed; skipping");
    return;
  }
  auto repo = fs::temp_directory_path() / "gitbridge_it_ignore";
  fs::remove_all(repo);
  fs::create_directories(repo);

  SubprocessRunner runner;
  runner.run(repo, {"git", "init", "-q"}, RunOptions{});
  write(repo / ".gitignore", "*.log\n");
  write(repo / "a.log", "x\n");
  write(repo / "b.txt", "y\n");

  BinaryResolver resolver(runner, std::nullopt);
  RepositoryOperations ops(runner, resolver, [](const std::string &p) { return fs::path(p); });

  auto res = ops.check_ignore(repo.string(), {"b.txt", "a.log"});
  REQUIRE(res.ok);
  REQUIRE(res.matches.size() == 1);
  REQUIRE(res.matches[0].source == ".gitignore");
  REQUIRE(res.matches[0].line == std::optional<int>(1));
  REQUIRE(res.matches[0].pattern == "*.log");
  REQUIRE(res.matches[0].path == "a.log");

  REQUIRE(ops.check_ignore(repo.string(), {"b.txt"}).matches.empty());
}

TEST_CASE("overview lists ignored paths of a clean repository") {
  if (!have_git()) {
    WARN("git not installed; skipping");
    return;
  }
  auto root = fs::temp_directory_path() / "gitbridge_it_clean";
  fs::remove_all(root);
  auto repo = root / "r";
  fs::create_directories(repo);

  SubprocessRunner runner;
  runner.run(repo, {"git", "init", "-q"}, RunOptions{});
  write(repo / ".gitignore", "*.log\n");
  write(repo / "a.log", "x\n");
  runner.run(repo, {"git", "add", ".gitignore"}, RunOptions{});
  runner.run(repo,
             {"git", "-c", "user.name=T", "-c", "user.email=t@example.com", "commit", "-q", "-m",
              "ignore logs"},
             RunOptions{});

  BinaryResolver resolver(runner, std::nullopt);
  RepositoryOperations ops(runner, resolver, [](const std::string &p) { return fs::path(p); });
  auto overview = ops.repos_overview(root.string(), 10);
  REQUIRE(overview.repos.size() == 1);
  REQUIRE_FALSE(overview.repos[0].dirty);
  REQUIRE(overview.repos[0].ignored == std::vector<std::string>{"a.log"});
  REQUIRE(overview.repos[0].ignored_count == 1);
}

TEST_CASE("status outside a repository reports not-a-repository") {
  if (!have_git()) {
    WARN("git not installed; skipping");
    return;
  }
  auto dir = fs::temp_directory_path() / "gitbridge_it_plain";
  fs::remove_all(dir);
  fs::create_directories(dir);
  // keep discovery from walking into an enclosing checkout
  ::setenv("GIT_CEILING_DIRECTORIES", dir.parent_path().string().c_str(), 1);

  SubprocessRunner runner;
  BinaryResolver resolver(runner, std::nullopt);
  RepositoryOperations ops(runner, resolver, [](const std::string &p) { return fs::path(p); });
  REQUIRE_THROWS_AS(ops.status(dir.string()), NotARepositoryError);
  REQUIRE_FALSE(ops.info(dir.string()).ok);
  ::unsetenv("GIT_CEILING_DIRECTORIES");
}
