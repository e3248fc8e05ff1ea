#pragma once
#include <gitbridge/process.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gitbridge {

struct ProbeRow {
  std::string candidate;
  std::optional<std::string> version;
  std::optional<std::string> error;
};

// Locates the git executable. One instance per process; it remembers the
// last (working dir, executable) pair only.
class BinaryResolver {
public:
  static const std::vector<std::string> &default_candidates();
  static constexpr int kProbeTimeoutMs = 5000;

  BinaryResolver(ProcessRunner &runner, std::optional<std::string> override_path,
                 std::vector<std::string> candidates = default_candidates());

  std::string resolve(const std::filesystem::path &working_dir);

  // Probes every candidate (not the override) without touching the cache.
  std::vector<ProbeRow> probe_all(const std::filesystem::path &working_dir);

  const std::optional<std::string> &override_path() const { return override_; }

private:
  std::string detect(const std::filesystem::path &working_dir);
  std::string probe(const std::filesystem::path &working_dir,
                    const std::string &candidate);

  ProcessRunner &runner_;
  std::optional<std::string> override_;
  std::vector<std::string> candidates_;

  std::mutex mu_;
  std::optional<std::filesystem::path> cached_dir_;
  std::string cached_binary_;
};

} // namespace gitbridge
