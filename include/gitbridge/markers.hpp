#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitbridge {

// git has no structured error output, so outcomes are recognized by
// substrings of its combined stdout/stderr. Tables are matched
// case-insensitively, first entry wins.
enum class Outcome {
  NotARepository,
  NothingToStash,
  Conflict,
  NoStashEntries,
  Error
};

struct Marker {
  std::string_view needle;
  Outcome outcome;
};

namespace markers {

const std::vector<Marker> &command_error();
const std::vector<Marker> &stash_push();
const std::vector<Marker> &stash_pop();

std::optional<Outcome> match(std::string_view text,
                             const std::vector<Marker> &table);

} // namespace markers

std::string to_lower(std::string_view s);

} // namespace gitbridge
