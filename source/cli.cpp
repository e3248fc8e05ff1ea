#include <gitbridge/cli.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <string_view>

namespace gitbridge {

const std::vector<std::string> &tool_names() {
  static const std::vector<std::string> names = {
      "git_info",          "git_status",        "git_status_overview",
      "git_diff",          "git_stage",         "git_unstage",
      "git_untrack",       "git_check_ignore",  "git_restore",
      "git_conflict_versions", "git_checkout_conflict", "git_stash",
      "git_stash_pop",     "git_commit",        "git_push",
      "git_pull",          "git_diagnose",      "git_identity",
      "git_set_identity",  "git_repos_overview",
  };
  return names;
}

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static void split_files(std::string_view list, std::vector<std::string> &out) {
  std::size_t start = 0;
  while (start <= list.size()) {
    auto end = list.find(',', start);
    if (end == std::string_view::npos)
      end = list.size();
    if (end > start)
      out.emplace_back(list.substr(start, end - start));
    start = end + 1;
  }
}

std::string check_tool_args(const std::string &tool, const ToolArgs &a) {
  if (a.path.empty())
    return fmt::format("{} requires a \"path\" string.", tool);

  if (tool == "git_diff" || tool == "git_conflict_versions" || tool == "git_checkout_conflict") {
    if (!a.file || a.file->empty())
      return fmt::format("{} requires a \"file\" string.", tool);
  }
  if (tool == "git_checkout_conflict") {
    if (!a.source || (*a.source != "ours" && *a.source != "theirs"))
      return "git_checkout_conflict requires source to be \"ours\" or \"theirs\".";
  }
  if (tool == "git_set_identity") {
    if (!a.name || a.name->empty() || !a.email || a.email->empty())
      return "git_set_identity requires name and email.";
    if (a.scope != "local" && a.scope != "global")
      return "git_set_identity scope must be \"local\" or \"global\".";
  }
  return {};
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  const auto &names = tool_names();
  if (std::find(names.begin(), names.end(), cmd) == names.end()) {
    r.error = "Unsupported tool: " + cmd;
    return r;
  }

  CmdTool c{cmd, {}};
  ToolArgs &a = c.args;
  for (int i = 2; i < argc; ++i) {
    std::string_view f = argv[i];
    auto value = [&](std::string &dst) {
      if (!has_arg(i, argc)) {
        r.error = fmt::format("{} requires a value", f);
        return false;
      }
      dst = argv[++i];
      return true;
    };
    auto value_opt = [&](std::optional<std::string> &dst) {
      std::string v;
      if (!value(v))
        return false;
      dst = std::move(v);
      return true;
    };

    bool ok = true;
    if (f == "--path")
      ok = value(a.path);
    else if (f == "--file")
      ok = value_opt(a.file);
    else if (f == "--files") {
      std::string v;
      ok = value(v);
      if (ok)
        split_files(v, a.files);
    } else if (f == "--ref")
      ok = value_opt(a.ref);
    else if (f == "--cached")
      a.cached = true;
    else if (f == "--message" || f == "-m")
      ok = value(a.message);
    else if (f == "--amend")
      a.amend = true;
    else if (f == "--signoff")
      a.signoff = true;
    else if (f == "--user-name")
      ok = value_opt(a.user_name);
    else if (f == "--user-email")
      ok = value_opt(a.user_email);
    else if (f == "--remote")
      ok = value_opt(a.remote);
    else if (f == "--branch")
      ok = value_opt(a.branch);
    else if (f == "--set-upstream")
      a.set_upstream = true;
    else if (f == "--rebase")
      a.rebase = true;
    else if (f == "--no-ff-only")
      a.ff_only = false;
    else if (f == "--token")
      ok = value_opt(a.token);
    else if (f == "--include-untracked")
      a.include_untracked = true;
    else if (f == "--no-include-untracked")
      a.include_untracked = false;
    else if (f == "--no-reinstate-index")
      a.reinstate_index = false;
    else if (f == "--source")
      ok = value_opt(a.source);
    else if (f == "--scope")
      ok = value(a.scope);
    else if (f == "--name")
      ok = value_opt(a.name);
    else if (f == "--email")
      ok = value_opt(a.email);
    else if (f == "--max-repos") {
      std::string v;
      ok = value(v);
      if (ok) {
        char *end = nullptr;
        long n = std::strtol(v.c_str(), &end, 10);
        if (end == v.c_str() || *end != '\0') {
          r.error = fmt::format("--max-repos expects a number, got '{}'", v);
          ok = false;
        } else {
          a.max_repos = static_cast<int>(std::clamp<long>(n, -1, 100000));
        }
      }
    } else {
      r.error = fmt::format("{}: unknown option {}", cmd, f);
      ok = false;
    }
    if (!ok)
      return r;
  }

  r.error = check_tool_args(cmd, a);
  if (!r.error.empty())
    return r;
  r.cmd = std::move(c);
  return r;
}

} // namespace gitbridge
