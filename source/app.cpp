#include <gitbridge/app.hpp>
#include <gitbridge/binary.hpp>
#include <gitbridge/errors.hpp>
#include <gitbridge/json.hpp>
#include <gitbridge/paths.hpp>
#include <gitbridge/process.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <type_traits>

#ifndef GITBRIDGE_COMMIT
#define GITBRIDGE_COMMIT "unknown"
#endif
#ifndef GITBRIDGE_BUILD_TIME
#define GITBRIDGE_BUILD_TIME "unknown"
#endif

namespace gitbridge {

static void print_help() {
  std::cout <<
      R"(gitbridge - git operations for tool-calling clients

Usage:
  gitbridge <tool> --path <repo> [options]

Tools:
  git_info | git_status | git_status_overview [--include-untracked]
  git_diff --file F [--cached] [--ref R]
  git_stage | git_unstage | git_untrack | git_check_ignore | git_restore [--files a,b]
  git_conflict_versions --file F
  git_checkout_conflict --file F --source ours|theirs
  git_stash [--no-include-untracked] [--message M]
  git_stash_pop [--ref R] [--no-reinstate-index]
  git_commit [--message M] [--amend] [--signoff] [--user-name N] [--user-email E]
  git_push [--remote R] [--branch B] [--set-upstream] [--token T]
  git_pull [--remote R] [--branch B] [--rebase] [--no-ff-only] [--token T]
  git_diagnose | git_identity
  git_set_identity --name N --email E [--scope local|global]
  git_repos_overview [--max-repos N]

Environment:
  GITBRIDGE_GIT_BINARY  GITBRIDGE_FS_ROOT  GITBRIDGE_LOG_LEVEL  GITBRIDGE_TOKEN
)";
}

static void setup_logging(const Config &cfg) {
  // stdout carries the response
  auto logger = spdlog::stderr_color_mt("gitbridge");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  auto lvl = spdlog::level::from_str(cfg.log_level);
  if (lvl == spdlog::level::off && cfg.log_level != "off")
    lvl = spdlog::level::warn;
  spdlog::set_level(lvl);
}

std::string run_tool(RepositoryOperations &ops, const CmdTool &cmd, const Config &cfg) {
  const auto &t = cmd.tool;
  const auto &a = cmd.args;
  const auto token = a.token ? a.token : cfg.token;

  if (t == "git_info")
    return json::to_json(ops.info(a.path));
  if (t == "git_status")
    return json::to_json(ops.status(a.path));
  if (t == "git_status_overview")
    return json::to_json(ops.status_overview(a.path, a.include_untracked.value_or(false)));
  if (t == "git_diff")
    return ops.diff(DiffRequest{a.path, a.file.value_or(""), a.cached, a.ref});
  if (t == "git_stage") {
    ops.stage(a.path, a.files);
    return json::ok();
  }
  if (t == "git_unstage") {
    ops.unstage(a.path, a.files);
    return json::ok();
  }
  if (t == "git_untrack") {
    ops.untrack(a.path, a.files);
    return json::ok();
  }
  if (t == "git_check_ignore")
    return json::to_json(ops.check_ignore(a.path, a.files));
  if (t == "git_restore") {
    ops.restore(a.path, a.files);
    return json::ok();
  }
  if (t == "git_conflict_versions")
    return json::to_json(ops.conflict_versions(a.path, a.file.value_or("")));
  if (t == "git_checkout_conflict") {
    ops.checkout_conflict(a.path, a.file.value_or(""),
                          a.source.value_or("ours") == "theirs" ? ConflictSide::Theirs
                                                                 : ConflictSide::Ours);
    return json::ok();
  }
  if (t == "git_stash")
    return json::to_json(ops.stash(StashRequest{a.path, a.include_untracked.value_or(true), a.message}));
  if (t == "git_stash_pop")
    return json::to_json(ops.stash_pop(StashPopRequest{a.path, a.ref, a.reinstate_index}));
  if (t == "git_commit")
    return json::to_json(ops.commit(
        CommitRequest{a.path, a.message, a.amend, a.signoff, a.user_name, a.user_email}));
  if (t == "git_push")
    return json::to_json(
        ops.push(PushRequest{a.path, a.remote, a.branch, a.set_upstream, token}));
  if (t == "git_pull")
    return json::to_json(
        ops.pull(PullRequest{a.path, a.remote, a.branch, a.rebase, a.ff_only, token}));
  if (t == "git_diagnose")
    return json::to_json(ops.diagnose(a.path));
  if (t == "git_identity")
    return json::to_json(ops.identity(a.path));
  if (t == "git_set_identity")
    return json::to_json(ops.set_identity(SetIdentityRequest{
        a.path, a.scope == "global" ? IdentityScope::Global : IdentityScope::Local,
        a.name.value_or(""), a.email.value_or("")}));
  if (t == "git_repos_overview")
    return json::to_json(ops.repos_overview(a.path, a.max_repos));

  throw InvalidInputError("Unsupported tool: " + t);
}

int App::run(int argc, char **argv) {
  const auto cfg = Config::from_env();
  setup_logging(cfg);

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    std::cout << json::error_response(pr.error) << "\n";
    return 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("gitbridge {} (built {})\n", GITBRIDGE_COMMIT,
                                   GITBRIDGE_BUILD_TIME);
          return 0;

        } else {
          SubprocessRunner runner;
          BinaryResolver resolver(runner, cfg.git_binary);
          RepositoryOperations ops(runner, resolver, RootPathValidator(cfg.roots));
          try {
            std::cout << json::text_response(run_tool(ops, c, cfg)) << "\n";
            return 0;
          } catch (const std::exception &e) {
            spdlog::error("[{}] {}", c.tool, e.what());
            std::cout << json::error_response(e.what()) << "\n";
            return 1;
          }
        }
      },
      *pr.cmd);
}

} // namespace gitbridge
