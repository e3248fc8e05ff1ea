#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitbridge {

struct Config {
  std::optional<std::string> git_binary;
  std::vector<std::filesystem::path> roots;
  std::string log_level = "warn";
  std::optional<std::string> token;

  static Config from_env();
};

std::vector<std::filesystem::path> split_roots(const std::string &value);

} // namespace gitbridge
