#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace siteaudit::cli {

// Options shared by `siteaudit audit` and in-process callers (tests).
struct AuditOptions {
  std::string scenario_path;
  std::string settings_path;
  std::string tier = "standard_audit";
  std::string verdict_mode = "expert";
  std::string site_type;
  bool run_security = true;
  std::filesystem::path output_dir = "out";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct AuditRunResult {
  std::string audit_id;
  std::filesystem::path audit_dir;
  std::filesystem::path events_jsonl_path;
  std::filesystem::path report_json_path;
  std::filesystem::path reputation_json_path;
  std::filesystem::path breakers_json_path;
  std::optional<int> final_score;
  std::string risk_level;
};

// Runs one simulated audit and writes its artifacts under
// `<output_dir>/<audit_id>/`. Returns a process exit code.
int ExecuteAudit(const AuditOptions& options, AuditRunResult* run_result);

// Routes `siteaudit` subcommands and returns process exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => settings file invalid
//   20 => site scenario invalid
//   40 => audit ended in ERROR
int Dispatch(int argc, char** argv);

} // namespace siteaudit::cli
