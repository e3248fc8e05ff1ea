#pragma once
#include <gitbridge/cli.hpp>
#include <gitbridge/config.hpp>
#include <gitbridge/repo_ops.hpp>

#include <string>

namespace gitbridge {

// Runs one tool against the facade and returns the response text: the JSON
// result, or the raw patch for git_diff. Errors propagate.
std::string run_tool(RepositoryOperations &ops, const CmdTool &cmd, const Config &cfg);

class App {
public:
  int run(int argc, char **argv);
};

} // namespace gitbridge
