#pragma once
#include <gitbridge/overview.hpp>
#include <gitbridge/queries.hpp>
#include <gitbridge/repo_ops.hpp>
#include <gitbridge/status.hpp>

#include <string>

namespace gitbridge::json {

std::string escape(const std::string &s);

std::string to_json(const RepoInfo &v);
std::string to_json(const StatusEntry &v);
std::string to_json(const CategorizedStatus &v);
std::string to_json(const StatusResult &v);
std::string to_json(const CommandOutput &v);
std::string to_json(const CheckIgnoreResult &v);
std::string to_json(const ConflictVersions &v);
std::string to_json(const StashResult &v);
std::string to_json(const StashPopResult &v);
std::string to_json(const DiagnoseResult &v);
std::string to_json(const IdentityResult &v);
std::string to_json(const SetIdentityResult &v);
std::string to_json(const OverviewRow &v);
std::string to_json(const OverviewResult &v);

// {"ok":true}
std::string ok();

// Response envelope around a text payload.
std::string text_response(const std::string &text);
std::string error_response(const std::string &message);

} // namespace gitbridge::json
