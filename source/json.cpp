#include <gitbridge/json.hpp>

#include <fmt/format.h>

namespace gitbridge::json {

std::string escape(const std::string &s) {
  static const char *hexd = "0123456789abcdef";
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '"':
      o += "\\\"";
      break;
    case '\\':
      o += "\\\\";
      break;
    case '\b':
      o += "\\b";
      break;
    case '\f':
      o += "\\f";
      break;
    case '\n':
      o += "\\n";
      break;
    case '\r':
      o += "\\r";
      break;
    case '\t':
      o += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        o += "\\u00";
        o.push_back(hexd[(c >> 4) & 0xF]);
        o.push_back(hexd[c & 0xF]);
      } else {
        o.push_back(c);
      }
    }
  }
  return o;
}

static std::string str(const std::string &s) { return "\"" + escape(s) + "\""; }
static std::string str(char c) { return str(std::string(1, c)); }
static const char *boolean(bool b) { return b ? "true" : "false"; }

static std::string opt(const std::optional<std::string> &s) { return s ? str(*s) : "null"; }

static std::string list(const std::vector<std::string> &xs) {
  std::string out = "[";
  for (std::size_t i = 0; i < xs.size(); ++i) {
    if (i)
      out += ",";
    out += str(xs[i]);
  }
  return out + "]";
}

template <typename T> static std::string list_of(const std::vector<T> &xs) {
  std::string out = "[";
  for (std::size_t i = 0; i < xs.size(); ++i) {
    if (i)
      out += ",";
    out += to_json(xs[i]);
  }
  return out + "]";
}

std::string ok() { return R"({"ok":true})"; }

std::string to_json(const RepoInfo &v) {
  return fmt::format(R"({{"ok":{},"branch":{},"upstream":{},"remotes":{}}})", boolean(v.ok),
                     opt(v.branch), opt(v.upstream), list(v.remotes));
}

std::string to_json(const StatusEntry &v) {
  std::string out = fmt::format(R"({{"path":{},"x":{},"y":{})", str(v.path), str(v.index_state),
                                str(v.worktree_state));
  if (v.original_path)
    out += fmt::format(R"(,"original_path":{})", str(*v.original_path));
  return out + "}";
}

std::string to_json(const CategorizedStatus &v) {
  return fmt::format(
      R"({{"staged":{},"unstaged":{},"untracked":{},"conflicted":{},"ignored":{}}})",
      list_of(v.staged), list_of(v.unstaged), list_of(v.untracked), list_of(v.conflicted),
      list_of(v.ignored));
}

std::string to_json(const StatusResult &v) {
  return fmt::format(R"({{"ok":{},"status":{}}})", boolean(v.ok), to_json(v.status));
}

std::string to_json(const CommandOutput &v) {
  return fmt::format(R"({{"ok":{},"stdout":{},"stderr":{}}})", boolean(v.ok), str(v.out),
                     str(v.err));
}

std::string to_json(const CheckIgnoreResult &v) {
  std::string matches = "[";
  for (std::size_t i = 0; i < v.matches.size(); ++i) {
    const auto &m = v.matches[i];
    if (i)
      matches += ",";
    matches += fmt::format(R"({{"source":{},"line":{},"pattern":{},"path":{}}})", str(m.source),
                           m.line ? std::to_string(*m.line) : "null", str(m.pattern),
                           str(m.path));
  }
  matches += "]";
  return fmt::format(R"({{"ok":{},"matches":{}}})", boolean(v.ok), matches);
}

std::string to_json(const ConflictVersions &v) {
  return fmt::format(R"({{"ok":true,"file":{},"base":{},"ours":{},"theirs":{},)"
                     R"("base_error":{},"ours_error":{},"theirs_error":{}}})",
                     str(v.file), str(v.base), str(v.ours), str(v.theirs), opt(v.base_error),
                     opt(v.ours_error), opt(v.theirs_error));
}

std::string to_json(const StashResult &v) {
  return fmt::format(R"({{"ok":{},"created":{},"ref":{},"output":{}}})", boolean(v.ok),
                     boolean(v.created), opt(v.ref), str(v.output));
}

std::string to_json(const StashPopResult &v) {
  return fmt::format(R"({{"ok":{},"conflicts":{},"no_stash":{},"output":{}}})", boolean(v.ok),
                     boolean(v.conflicts), boolean(v.no_stash), str(v.output));
}

std::string to_json(const DiagnoseResult &v) {
  std::string rows = "[";
  for (std::size_t i = 0; i < v.candidates.size(); ++i) {
    const auto &c = v.candidates[i];
    if (i)
      rows += ",";
    rows += fmt::format(R"({{"candidate":{},"version":{},"error":{}}})", str(c.candidate),
                        opt(c.version), opt(c.error));
  }
  rows += "]";
  return fmt::format(R"({{"ok":{},"repo_path":{},"cwd":{},"configured":{},"env_path":{},)"
                     R"("selected":{},"selected_error":{},"candidates":{}}})",
                     boolean(v.ok), str(v.repo_path.string()), str(v.cwd.string()),
                     opt(v.configured), opt(v.env_path), opt(v.selected), opt(v.selected_error),
                     rows);
}

static std::string identity(const Identity &i) {
  return fmt::format(R"({{"name":{},"email":{}}})", opt(i.name), opt(i.email));
}

std::string to_json(const IdentityResult &v) {
  return fmt::format(R"({{"ok":{},"repo_path":{},"effective":{{"name":{},"email":{},)"
                     R"("source":{}}},"local":{},"global":{}}})",
                     boolean(v.ok), str(v.repo_path.string()), opt(v.effective.name),
                     opt(v.effective.email), str(v.source), identity(v.local),
                     identity(v.global));
}

std::string to_json(const SetIdentityResult &v) {
  return fmt::format(R"({{"ok":{},"scope":{},"repo_path":{}}})", boolean(v.ok),
                     str(to_string(v.scope)), str(v.repo_path.string()));
}

static std::string counts(const BucketCounts &c) {
  return fmt::format(R"({{"staged":{},"unstaged":{},"untracked":{},"conflicted":{}}})",
                     c.staged, c.unstaged, c.untracked, c.conflicted);
}

static std::string buckets(const BucketPaths &b) {
  return fmt::format(R"({{"staged":{},"unstaged":{},"untracked":{},"conflicted":{}}})",
                     list(b.staged), list(b.unstaged), list(b.untracked), list(b.conflicted));
}

static std::string change(const PathChange &c) {
  return fmt::format(R"({{"staged":{},"unstaged":{},"untracked":{},"conflicted":{},)"
                     R"("x":{},"y":{},"original_path":{},"kind":{}}})",
                     boolean(c.flags.staged), boolean(c.flags.unstaged),
                     boolean(c.flags.untracked), boolean(c.flags.conflicted),
                     str(c.index_state), str(c.worktree_state), opt(c.original_path),
                     str(to_string(c.kind)));
}

std::string to_json(const OverviewRow &v) {
  std::string out = fmt::format(
      R"({{"path":{},"relative_path":{},"name":{},"ok":{},"branch":{},"dirty":{},)"
      R"("counts":{},"sample":{})",
      str(v.repo.absolute_path.string()), str(v.repo.relative_path), str(v.repo.name),
      boolean(v.ok), opt(v.branch), boolean(v.dirty), counts(v.counts), buckets(v.sample));
  if (v.dirty) {
    std::string by_path = "{";
    bool first = true;
    for (const auto &[path, c] : v.changes_by_path) {
      if (!first)
        by_path += ",";
      first = false;
      by_path += str(path) + ":" + change(c);
    }
    by_path += "}";
    out += fmt::format(R"(,"changes_by_path":{},"changes":{})", by_path, buckets(v.changes));
  }
  out += fmt::format(R"(,"ignored":{},"ignored_count":{}}})", list(v.ignored), v.ignored_count);
  return out;
}

std::string to_json(const OverviewResult &v) {
  return fmt::format(R"({{"ok":{},"repos_root":{},"repos":{}}})", boolean(v.ok),
                     str(v.repos_root.string()), list_of(v.repos));
}

std::string text_response(const std::string &text) {
  return fmt::format(R"({{"content":[{{"type":"text","text":{}}}]}})", str(text));
}

std::string error_response(const std::string &message) {
  return fmt::format(R"({{"content":[{{"type":"text","text":{}}}],"isError":true}})",
                     str("Error: " + message));
}

} // namespace gitbridge::json
