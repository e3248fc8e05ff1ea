#pragma once
#include <gitbridge/errors.hpp>
#include <gitbridge/process.hpp>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace gitbridge::testing {

struct Call {
  std::filesystem::path dir;
  std::vector<std::string> argv;
  RunOptions opts;
};

inline bool contains_seq(const std::vector<std::string> &argv,
                         const std::vector<std::string> &needle) {
  if (needle.empty())
    return true;
  return std::search(argv.begin(), argv.end(), needle.begin(), needle.end()) != argv.end();
}

// Scripted runner: the first rule whose argument sequence occurs in argv
// answers the call. Unmatched calls fail like a rejected git command.
class FakeRunner : public ProcessRunner {
public:
  using Handler = std::function<SubprocessResult(const Call &)>;

  void on(std::vector<std::string> needle, Handler h) {
    rules_.push_back({std::move(needle), std::move(h)});
  }

  void reply(std::vector<std::string> needle, std::string out, std::string err = {}) {
    on(std::move(needle), [out, err](const Call &) { return SubprocessResult{out, err}; });
  }

  void fail(std::vector<std::string> needle, std::string msg, int code = 1) {
    on(std::move(needle), [msg, code](const Call &) -> SubprocessResult {
      throw CommandFailure(msg, code, {}, msg);
    });
  }

  SubprocessResult run(const std::filesystem::path &working_dir,
                       const std::vector<std::string> &argv, const RunOptions &opts) override {
    Call call{working_dir, argv, opts};
    const Handler *h = nullptr;
    {
      std::lock_guard<std::mutex> lk(mu_);
      calls_.push_back(call);
      for (const auto &r : rules_) {
        if (contains_seq(argv, r.needle)) {
          h = &r.handler;
          break;
        }
      }
    }
    if (!h)
      throw CommandFailure("unexpected invocation: " + redact_argv(argv), 1);
    return (*h)(call);
  }

  std::vector<Call> calls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return calls_;
  }

  std::size_t count(const std::vector<std::string> &needle) const {
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<std::size_t>(std::count_if(
        calls_.begin(), calls_.end(), [&](const Call &c) { return contains_seq(c.argv, needle); }));
  }

  // Last call matching needle; empty argv when there is none.
  Call last(const std::vector<std::string> &needle) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = calls_.rbegin(); it != calls_.rend(); ++it)
      if (contains_seq(it->argv, needle))
        return *it;
    return {};
  }

private:
  struct Rule {
    std::vector<std::string> needle;
    Handler handler;
  };
  std::vector<Rule> rules_;
  mutable std::mutex mu_;
  std::vector<Call> calls_;
};

// Accepts any path and uses it verbatim.
inline std::filesystem::path accept_any(const std::string &p) { return p; }

} // namespace gitbridge::testing
