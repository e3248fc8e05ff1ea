#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitbridge {

struct RunOptions {
  int timeout_ms = 20000;
  std::vector<int> ok_codes{0};
  std::optional<std::string> stdin_payload;
};

struct SubprocessResult {
  std::string out;
  std::string err;
};

// Runs argv[0] with argv[1..] inside working_dir.
// Throws ExecutableNotFoundError, TimeoutError, NotARepositoryError or
// CommandFailure.
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;
  virtual SubprocessResult run(const std::filesystem::path &working_dir,
                               const std::vector<std::string> &argv,
                               const RunOptions &opts) = 0;
};

class SubprocessRunner : public ProcessRunner {
public:
  SubprocessResult run(const std::filesystem::path &working_dir,
                       const std::vector<std::string> &argv,
                       const RunOptions &opts) override;
};

// Combined "<stdout>\n<stderr>", trimmed.
std::string combined_output(const SubprocessResult &r);

std::string trim(std::string_view s);

// argv rendered for logs; credential headers are masked.
std::string redact_argv(const std::vector<std::string> &argv);

} // namespace gitbridge
