#include <catch2/catch_all.hpp>
#include <gitbridge/overview.hpp>

#include "fake_runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <locale>
#include <stdexcept>
#include <thread>

using namespace gitbridge;
using namespace std::string_literals;
using gitbridge::testing::Call;
using gitbridge::testing::FakeRunner;
namespace fs = std::filesystem;

static fs::path fresh(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("gitbridge_overview_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

// Tracks how many invocations are in flight at once.
class CountingRunner : public FakeRunner {
public:
  SubprocessResult run(const fs::path &dir, const std::vector<std::string> &argv,
                       const RunOptions &opts) override {
    const int now = ++active_;
    int prev = peak_.load();
    while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    try {
      auto r = FakeRunner::run(dir, argv, opts);
      --active_;
      return r;
    } catch (...) {
      --active_;
      throw;
    }
  }
  int peak() const { return peak_.load(); }

private:
  std::atomic<int> active_{0};
  std::atomic<int> peak_{0};
};

static void script_clean_repo(FakeRunner &r) {
  r.reply({"--is-inside-work-tree"}, "true\n");
  r.reply({"--abbrev-ref", "HEAD"}, "main\n");
  r.fail({"@{u}"}, "fatal: no upstream configured");
  r.reply({"remote"}, "origin\n");
  r.reply({"status"}, "");
}

TEST_CASE("no more than four repositories are summarized at once") {
  auto root = fresh("peak");
  for (int i = 0; i < 12; ++i)
    fs::create_directories(root / ("repo" + std::to_string(i)) / ".git");

  CountingRunner runner;
  script_clean_repo(runner);
  OverviewAggregator agg(runner, "git");
  auto rows = agg.build(root);

  REQUIRE(rows.size() == 12);
  REQUIRE(runner.peak() >= 1);
  REQUIRE(runner.peak() <= OverviewAggregator::kWorkers);
  for (const auto &row : rows) {
    REQUIRE(row.ok);
    REQUIRE(row.branch == std::optional<std::string>("main"));
    REQUIRE_FALSE(row.dirty);
  }
}

TEST_CASE("rows are sorted by relative path") {
  auto root = fresh("order");
  for (auto n : {"c", "a", "b"})
    fs::create_directories(root / n / ".git");

  FakeRunner runner;
  script_clean_repo(runner);
  auto rows = OverviewAggregator(runner, "git").build(root);
  REQUIRE(rows.size() == 3);
  REQUIRE(rows[0].repo.relative_path == "a");
  REQUIRE(rows[1].repo.relative_path == "b");
  REQUIRE(rows[2].repo.relative_path == "c");
}

TEST_CASE("empty root yields no rows and spawns nothing") {
  auto root = fresh("empty");
  FakeRunner runner;
  auto rows = OverviewAggregator(runner, "git").build(root);
  REQUIRE(rows.empty());
  REQUIRE(runner.calls().empty());
}

TEST_CASE("clean repository still reports ignored paths") {
  FakeRunner runner;
  runner.reply({"--untracked-files=normal", "--ignored=matching"}, "!! build/\0"s);
  script_clean_repo(runner);

  RepositoryHandle h{"/x/r", "r", "r"};
  auto row = OverviewAggregator(runner, "git").summarize(h, false);
  REQUIRE(row.ok);
  REQUIRE_FALSE(row.dirty);
  REQUIRE(row.ignored == std::vector<std::string>{"build/"});
  REQUIRE(row.ignored_count == 1);
  REQUIRE(runner.last({"-uno"}).argv ==
          std::vector<std::string>{"git", "--no-optional-locks", "status", "--porcelain=v1", "-z",
                                   "-uno"});
}

TEST_CASE("changes_by_path follows path collation order") {
  std::locale saved;
  try {
    std::locale::global(std::locale("en_US.UTF-8"));
  } catch (const std::runtime_error &) {
    WARN("en_US.UTF-8 locale unavailable; checking the active collation only");
  }

  CategorizedStatus st;
  for (auto p : {"b.txt", "B.txt", "a.txt", "_z.txt"})
    st.unstaged.push_back(StatusEntry{p, ' ', 'M', std::nullopt});
  auto m = merge_changes(st, 800);

  std::vector<std::string> keys;
  for (const auto &kv : m)
    keys.push_back(kv.first);
  auto expected = keys;
  std::sort(expected.begin(), expected.end(), path_less);
  std::locale::global(saved);

  REQUIRE(keys.size() == 4);
  REQUIRE(keys == expected);
}

TEST_CASE("non-worktree repository gives a not-ok row") {
  FakeRunner runner;
  runner.reply({"--is-inside-work-tree"}, "false\n");
  RepositoryHandle h{"/x/bare", "bare", "bare"};
  auto row = OverviewAggregator(runner, "git").summarize(h, false);
  REQUIRE_FALSE(row.ok);
  REQUIRE(row.repo.name == "bare");
  REQUIRE(runner.count({"status"}) == 0);
}

TEST_CASE("dirty repository gets full status details") {
  FakeRunner runner;
  runner.reply({"--is-inside-work-tree"}, "true\n");
  runner.reply({"--abbrev-ref", "HEAD"}, "dev\n");
  runner.fail({"@{u}"}, "no upstream");
  runner.reply({"remote"}, "");
  runner.reply({"--no-optional-locks", "status"}, "M  a.txt\0"s);
  runner.reply({"status", "--porcelain=v1", "-z", "-uall", "--ignored=matching"},
               "M  a.txt\0MM b.txt\0?? c.txt\0UU d.txt\0!! build/\0R  old.txt\0new.txt\0"s);

  RepositoryHandle h{"/x/r", "r", "r"};
  auto row = OverviewAggregator(runner, "git").summarize(h, false);
  REQUIRE(row.ok);
  REQUIRE(row.dirty);
  REQUIRE(row.counts.staged == 3);
  REQUIRE(row.counts.unstaged == 1);
  REQUIRE(row.counts.untracked == 1);
  REQUIRE(row.counts.conflicted == 1);
  REQUIRE(row.ignored_count == 1);
  REQUIRE(row.ignored == std::vector<std::string>{"build/"});

  REQUIRE(row.changes_by_path.at("b.txt").kind == ChangeKind::StagedAndUnstaged);
  REQUIRE(row.changes_by_path.at("c.txt").kind == ChangeKind::Untracked);
  REQUIRE(row.changes_by_path.at("d.txt").kind == ChangeKind::Conflicted);
  REQUIRE(row.changes_by_path.at("a.txt").kind == ChangeKind::Staged);
  REQUIRE(row.changes_by_path.at("new.txt").original_path == std::optional<std::string>("old.txt"));
  REQUIRE(row.changes_by_path.count("build/") == 0);
  REQUIRE(row.sample.staged.size() == 3);
}

TEST_CASE("full status failure keeps the shallow result") {
  FakeRunner runner;
  runner.reply({"--is-inside-work-tree"}, "true\n");
  runner.reply({"--abbrev-ref", "HEAD"}, "main\n");
  runner.fail({"@{u}"}, "no upstream");
  runner.reply({"remote"}, "");
  runner.reply({"--no-optional-locks", "status"}, " M a.txt\0"s);
  runner.fail({"status", "--porcelain=v1", "-z", "-uall"}, "index.lock exists");

  RepositoryHandle h{"/x/r", "r", "r"};
  auto row = OverviewAggregator(runner, "git").summarize(h, false);
  REQUIRE(row.ok);
  REQUIRE(row.dirty);
  REQUIRE(row.counts.unstaged == 1);
  REQUIRE(row.changes_by_path.at("a.txt").kind == ChangeKind::Unstaged);
}

TEST_CASE("shallow status failure degrades to a minimal row") {
  FakeRunner runner;
  runner.reply({"--is-inside-work-tree"}, "true\n");
  runner.reply({"--abbrev-ref", "HEAD"}, "main\n");
  runner.fail({"@{u}"}, "no upstream");
  runner.reply({"remote"}, "");
  runner.fail({"status"}, "boom");

  RepositoryHandle h{"/x/r", "r", "r"};
  auto row = OverviewAggregator(runner, "git").summarize(h, false);
  REQUIRE(row.ok);
  REQUIRE_FALSE(row.dirty);
  REQUIRE(row.branch == std::optional<std::string>("main"));
  REQUIRE(row.changes_by_path.empty());
}

TEST_CASE("merge_changes keeps informative state characters") {
  CategorizedStatus st;
  st.staged.push_back(StatusEntry{"f.txt", 'M', 'M', std::nullopt});
  st.unstaged.push_back(StatusEntry{"f.txt", 'M', 'M', std::nullopt});
  st.untracked.push_back(StatusEntry{"n.txt", '?', '?', std::nullopt});

  auto m = merge_changes(st, 800);
  REQUIRE(m.size() == 2);
  REQUIRE(m.at("f.txt").flags.staged);
  REQUIRE(m.at("f.txt").flags.unstaged);
  REQUIRE(m.at("f.txt").index_state == 'M');
  REQUIRE(m.at("f.txt").worktree_state == 'M');
  REQUIRE(m.at("n.txt").kind == ChangeKind::Untracked);
  REQUIRE(m.at("n.txt").index_state == '?');
}

TEST_CASE("merge_changes honours the per-bucket limit") {
  CategorizedStatus st;
  for (int i = 0; i < 10; ++i)
    st.untracked.push_back(StatusEntry{"u" + std::to_string(i), '?', '?', std::nullopt});
  REQUIRE(merge_changes(st, 4).size() == 4);
}

TEST_CASE("change kind names") {
  REQUIRE(std::string(to_string(ChangeKind::StagedAndUnstaged)) == "staged+unstaged");
  REQUIRE(std::string(to_string(ChangeKind::Unknown)) == "unknown");
}
