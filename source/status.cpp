#include <gitbridge/status.hpp>

#include <algorithm>
#include <locale>

namespace gitbridge {

static std::vector<std::string_view> split_nul(std::string_view raw) {
  std::vector<std::string_view> tokens;
  size_t pos = 0;
  while (pos < raw.size()) {
    size_t end = raw.find('\0', pos);
    if (end == std::string_view::npos)
      end = raw.size();
    if (end > pos)
      tokens.push_back(raw.substr(pos, end - pos));
    pos = end + 1;
  }
  return tokens;
}

static bool is_rename_or_copy(char c) { return c == 'R' || c == 'C'; }

std::vector<StatusEntry> parse_status_z(std::string_view raw) {
  std::vector<StatusEntry> entries;
  const auto tokens = split_nul(raw);
  for (size_t i = 0; i < tokens.size(); ++i) {
    const auto tok = tokens[i];
    if (tok.size() < 3)
      continue;
    const char x = tok[0];
    const char y = tok[1];
    std::string path(tok.substr(3));

    if (is_rename_or_copy(x) || is_rename_or_copy(y)) {
      // the paired record is consumed even when this one has no path
      ++i;
      if (i < tokens.size()) {
        entries.push_back(StatusEntry{std::string(tokens[i]), x, y, std::move(path)});
      }
      continue;
    }
    if (path.empty())
      continue;
    entries.push_back(StatusEntry{std::move(path), x, y, std::nullopt});
  }
  return entries;
}

bool is_conflict_code(char x, char y) {
  return x == 'U' || y == 'U' || (x == 'A' && y == 'A') || (x == 'D' && y == 'D');
}

bool path_less(const std::string &a, const std::string &b) {
  const auto &coll = std::use_facet<std::collate<char>>(std::locale());
  const int c = coll.compare(a.data(), a.data() + a.size(), b.data(), b.data() + b.size());
  if (c != 0)
    return c < 0;
  // collation ties between distinct byte strings stay strictly ordered
  return a < b;
}

CategorizedStatus categorize(const std::vector<StatusEntry> &entries) {
  CategorizedStatus st;
  for (const auto &e : entries) {
    if (e.index_state == '!' && e.worktree_state == '!') {
      st.ignored.push_back(e);
      continue;
    }
    if (e.index_state == '?' && e.worktree_state == '?') {
      st.untracked.push_back(e);
      continue;
    }
    if (is_conflict_code(e.index_state, e.worktree_state)) {
      st.conflicted.push_back(e);
      continue;
    }
    if (e.index_state != ' ' && e.index_state != '\0')
      st.staged.push_back(e);
    if (e.worktree_state != ' ' && e.worktree_state != '\0')
      st.unstaged.push_back(e);
  }

  auto by_path = [](const StatusEntry &a, const StatusEntry &b) {
    return path_less(a.path, b.path);
  };
  for (auto *bucket : {&st.staged, &st.unstaged, &st.untracked, &st.conflicted, &st.ignored})
    std::stable_sort(bucket->begin(), bucket->end(), by_path);
  return st;
}

} // namespace gitbridge
