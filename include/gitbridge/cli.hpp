#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gitbridge {

struct ToolArgs {
  std::string path;
  std::optional<std::string> file;
  std::vector<std::string> files;
  std::optional<std::string> ref;
  bool cached = false;
  std::string message;
  bool amend = false;
  bool signoff = false;
  std::optional<std::string> user_name;
  std::optional<std::string> user_email;
  std::optional<std::string> remote;
  std::optional<std::string> branch;
  bool set_upstream = false;
  bool rebase = false;
  bool ff_only = true;
  std::optional<std::string> token;
  std::optional<bool> include_untracked;
  bool reinstate_index = true;
  std::optional<std::string> source; // ours | theirs
  std::string scope = "local";
  std::optional<std::string> name;
  std::optional<std::string> email;
  int max_repos = 200;
};

struct CmdTool {
  std::string tool;
  ToolArgs args;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdTool, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

const std::vector<std::string> &tool_names();

ParseResult parse_cli(int argc, char **argv);

// Per-tool argument requirements; returns an error message or "".
std::string check_tool_args(const std::string &tool, const ToolArgs &args);

} // namespace gitbridge
