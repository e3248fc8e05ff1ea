#include <gitbridge/config.hpp>
#include <gitbridge/process.hpp>

#include <cstdlib>

namespace fs = std::filesystem;

namespace gitbridge {

static std::optional<std::string> env(const char *name) {
  if (const char *e = std::getenv(name)) {
    auto v = trim(e);
    if (!v.empty())
      return v;
  }
  return std::nullopt;
}

std::vector<fs::path> split_roots(const std::string &value) {
  std::vector<fs::path> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(':', start);
    if (end == std::string::npos)
      end = value.size();
    auto part = trim(std::string_view(value).substr(start, end - start));
    if (!part.empty())
      out.emplace_back(part);
    start = end + 1;
  }
  return out;
}

Config Config::from_env() {
  Config c;
  c.git_binary = env("GITBRIDGE_GIT_BINARY");
  if (!c.git_binary)
    c.git_binary = env("GIT_BINARY");

  auto roots = env("GITBRIDGE_FS_ROOT");
  if (!roots)
    roots = env("WORKSPACE_ROOT");
  if (roots)
    c.roots = split_roots(*roots);
  if (c.roots.empty())
    c.roots.push_back(fs::current_path());

  if (auto lvl = env("GITBRIDGE_LOG_LEVEL"))
    c.log_level = *lvl;
  c.token = env("GITBRIDGE_TOKEN");
  return c;
}

} // namespace gitbridge
