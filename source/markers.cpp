#include <gitbridge/markers.hpp>

#include <cctype>

namespace gitbridge {

std::string to_lower(std::string_view s) {
  std::string o;
  o.reserve(s.size());
  for (char c : s)
    o.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return o;
}

namespace markers {

const std::vector<Marker> &command_error() {
  static const std::vector<Marker> t = {
      {"not a git repository", Outcome::NotARepository},
  };
  return t;
}

// Locale dependent: a translated git never prints this text.
const std::vector<Marker> &stash_push() {
  static const std::vector<Marker> t = {
      {"no local changes", Outcome::NothingToStash},
  };
  return t;
}

const std::vector<Marker> &stash_pop() {
  static const std::vector<Marker> t = {
      {"conflict", Outcome::Conflict},
      {"unmerged", Outcome::Conflict},
      {"no stash entries found", Outcome::NoStashEntries},
      {"error:", Outcome::Error},
      {"fatal:", Outcome::Error},
  };
  return t;
}

std::optional<Outcome> match(std::string_view text,
                             const std::vector<Marker> &table) {
  const std::string lower = to_lower(text);
  for (const auto &m : table) {
    if (lower.find(m.needle) != std::string::npos)
      return m.outcome;
  }
  return std::nullopt;
}

} // namespace markers
} // namespace gitbridge
