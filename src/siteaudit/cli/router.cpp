#include "siteaudit/cli/router.hpp"

#include "agents/agent_contracts.hpp"
#include "agents/sim/sim_agents.hpp"
#include "agents/sim/site_scenario.hpp"
#include "audit/audit_config.hpp"
#include "audit/audit_orchestrator.hpp"
#include "audit/audit_services.hpp"
#include "audit/audit_state.hpp"
#include "core/clock.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "events/event_sink.hpp"
#include "resilience/breaker_registry.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace siteaudit::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitScenarioInvalid =
    core::errors::ToInt(core::errors::ExitCode::kScenarioInvalid);
constexpr int kExitAuditError = core::errors::ToInt(core::errors::ExitCode::kAuditError);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  siteaudit audit <site_scenario.json> [--tier <quick_scan|standard_audit|deep_forensic>] "
         "[--mode <expert|simple>] [--site-type <type>] [--no-security] [--settings <file>] "
         "[--out <dir>] [--log-level <debug|info|warn|error>]\n"
      << "  siteaudit validate <settings.json>\n"
      << "  siteaudit version\n";
}

// Filesystem preflight shared by scenario and settings inputs, so path
// problems are reported apart from field-level issues.
bool ValidateJsonPath(std::string_view label, const std::string& path_text, std::string& error) {
  if (path_text.empty()) {
    error = std::string(label) + " path cannot be empty";
    return false;
  }

  const fs::path path(path_text);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = std::string(label) + " file not found: " + path_text;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = std::string(label) + " path must point to a regular file: " + path_text;
    return false;
  }
  if (path.extension() != ".json") {
    error = std::string(label) + " file must use .json extension: " + path_text;
    return false;
  }

  std::ifstream file(path);
  if (!file) {
    error = "unable to open " + std::string(label) + " file: " + path_text;
    return false;
  }
  if (file.peek() == std::ifstream::traits_type::eof()) {
    error = std::string(label) + " file is empty: " + path_text;
    return false;
  }
  return true;
}

void PrintValidationIssues(const audit::ValidationReport& report) {
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "siteaudit 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <settings.json>\n";
    return kExitUsage;
  }

  std::string error;
  const std::string settings_path(args.front());
  if (!ValidateJsonPath("settings", settings_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  audit::AuditSettings settings;
  audit::ValidationReport report;
  if (!audit::LoadAuditSettingsFile(settings_path, settings, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (!report.valid) {
    std::cerr << "invalid settings: " << settings_path << '\n';
    PrintValidationIssues(report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << settings_path << '\n';
  return kExitSuccess;
}

// Parse `audit` args:
// - exactly one scenario path
// - value flags take the next token
// Unknown flags and extra positional args are usage errors.
bool ParseAuditOptions(const std::vector<std::string_view>& args, AuditOptions& options,
                       std::string& error) {
  auto take_value = [&args, &error](std::size_t& i, std::string_view flag, std::string& out) {
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(flag);
      return false;
    }
    out = std::string(args[i + 1]);
    ++i;
    return true;
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--no-security") {
      options.run_security = false;
      continue;
    }
    if (token == "--tier") {
      if (!take_value(i, token, options.tier)) {
        return false;
      }
      continue;
    }
    if (token == "--mode") {
      if (!take_value(i, token, options.verdict_mode)) {
        return false;
      }
      continue;
    }
    if (token == "--site-type") {
      if (!take_value(i, token, options.site_type)) {
        return false;
      }
      continue;
    }
    if (token == "--settings") {
      if (!take_value(i, token, options.settings_path)) {
        return false;
      }
      continue;
    }
    if (token == "--out") {
      std::string out;
      if (!take_value(i, token, out)) {
        return false;
      }
      options.output_dir = fs::path(out);
      continue;
    }
    if (token == "--log-level") {
      std::string raw;
      if (!take_value(i, token, raw)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(raw, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.scenario_path.empty()) {
      error = "audit accepts exactly 1 scenario path";
      return false;
    }
    options.scenario_path = std::string(token);
  }

  if (options.scenario_path.empty()) {
    error = "audit requires exactly 1 argument: <site_scenario.json>";
    return false;
  }

  audit::AuditTier tier = audit::AuditTier::kStandardAudit;
  if (!audit::ParseAuditTier(options.tier, tier, error)) {
    return false;
  }
  agents::VerdictMode mode = agents::VerdictMode::kExpert;
  if (!agents::ParseVerdictMode(options.verdict_mode, mode, error)) {
    return false;
  }
  return true;
}

std::string BuildBreakerStatsJson(const resilience::BreakerRegistry& breakers) {
  std::ostringstream out;
  out << "{\n  \"breakers\": [";
  bool first = true;
  for (const auto& entry : breakers.Snapshots()) {
    const auto& snapshot = entry.snapshot;
    out << (first ? "\n" : ",\n") << "    {\"name\": " << core::QuoteJson(entry.name)
        << ", \"state\": " << core::QuoteJson(resilience::ToString(snapshot.state))
        << ", \"consecutive_failures\": " << snapshot.consecutive_failures
        << ", \"open_cycles\": " << snapshot.open_cycles
        << ", \"current_backoff_ms\": " << snapshot.current_backoff.count()
        << ", \"total_calls\": " << snapshot.total_calls
        << ", \"total_failures\": " << snapshot.total_failures
        << ", \"short_circuits\": " << snapshot.short_circuits << "}";
    first = false;
  }
  out << (first ? "]\n}\n" : "\n  ]\n}\n");
  return out.str();
}

int CommandAudit(const std::vector<std::string_view>& args) {
  AuditOptions options;
  std::string error;
  if (!ParseAuditOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  AuditRunResult result;
  const int exit_code = ExecuteAudit(options, &result);
  if (exit_code == kExitSuccess || exit_code == kExitAuditError) {
    std::cout << "audit_id: " << result.audit_id << '\n'
              << "artifacts: " << result.audit_dir.string() << '\n';
  }
  if (exit_code == kExitSuccess && result.final_score.has_value()) {
    std::cout << "trust_score: " << *result.final_score << " (" << result.risk_level << ")\n";
  }
  return exit_code;
}

} // namespace

int ExecuteAudit(const AuditOptions& options, AuditRunResult* run_result) {
  core::logging::Logger logger(options.log_level);
  if (run_result != nullptr) {
    *run_result = AuditRunResult{};
  }

  logger.Info("audit requested", {{"scenario_path", options.scenario_path},
                                  {"settings_path", options.settings_path},
                                  {"tier", options.tier},
                                  {"output_root", options.output_dir.string()}});

  std::string error;
  audit::AuditTier tier = audit::AuditTier::kStandardAudit;
  agents::VerdictMode mode = agents::VerdictMode::kExpert;
  if (!audit::ParseAuditTier(options.tier, tier, error) ||
      !agents::ParseVerdictMode(options.verdict_mode, mode, error)) {
    logger.Error("invalid audit options", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  audit::AuditSettings settings;
  audit::ValidationReport settings_report;
  if (!options.settings_path.empty() &&
      !ValidateJsonPath("settings", options.settings_path, error)) {
    logger.Error("settings path validation failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!audit::LoadAuditSettingsFile(options.settings_path, settings, settings_report, error)) {
    logger.Error("failed to load settings", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!settings_report.valid) {
    logger.Error("settings invalid", {{"settings_path", options.settings_path},
                                      {"issues", std::to_string(settings_report.issues.size())}});
    std::cerr << "invalid settings: " << options.settings_path << '\n';
    PrintValidationIssues(settings_report);
    return kExitConfigInvalid;
  }

  if (!ValidateJsonPath("scenario", options.scenario_path, error)) {
    logger.Error("scenario path validation failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  auto scenario = std::make_shared<agents::sim::SiteScenario>();
  if (!agents::sim::LoadSiteScenario(options.scenario_path, *scenario, error)) {
    logger.Error("site scenario invalid",
                 {{"scenario_path", options.scenario_path}, {"error", error}});
    std::cerr << "invalid scenario: " << options.scenario_path << ": " << error << '\n';
    return kExitScenarioInvalid;
  }

  audit::AuditServices services(std::move(settings), core::SystemClock::Instance(), logger,
                                agents::sim::SimBrowserEngineFactory());
  std::shared_ptr<const agents::sim::SiteScenario> shared_scenario = scenario;
  audit::AgentSet agent_set{
      .scout = std::make_shared<agents::sim::SimScoutAgent>(shared_scenario, &services.browser()),
      .vision = std::make_shared<agents::sim::SimVisionAgent>(shared_scenario),
      .graph = std::make_shared<agents::sim::SimGraphAgent>(shared_scenario),
      .security = std::make_shared<agents::sim::SimSecurityAgent>(shared_scenario)};

  audit::AuditRequest request;
  request.url = scenario->url;
  request.tier = tier;
  request.verdict_mode = mode;
  request.site_type = options.site_type;
  request.run_security = options.run_security;
  request.audit_id = services.NextAuditId();

  const fs::path audit_dir = options.output_dir / request.audit_id;
  const fs::path events_path = audit_dir / "events.jsonl";
  const fs::path report_path = audit_dir / "audit_report.json";
  const fs::path reputation_path = audit_dir / "reputation.json";
  const fs::path breakers_path = audit_dir / "breakers.json";
  if (run_result != nullptr) {
    run_result->audit_id = request.audit_id;
    run_result->audit_dir = audit_dir;
    run_result->events_jsonl_path = events_path;
  }

  events::JsonlEventSink sink(events_path);
  audit::AuditOrchestrator orchestrator(services, std::move(agent_set), sink);

  audit::AuditState state;
  std::string audit_error;
  const bool audit_ok = orchestrator.Run(request, state, audit_error);

  if (!services.browser().Shutdown()) {
    logger.Warn("browser still leased at shutdown");
  }

  if (!core::WriteTextFileAtomic(report_path, state.ToJson(), error)) {
    logger.Error("failed to write audit report", {{"error", error}});
    std::cerr << "error: failed to write audit_report.json: " << error << '\n';
    return kExitFailure;
  }
  if (!core::WriteTextFileAtomic(reputation_path, services.reputation().SnapshotJson(), error)) {
    logger.Error("failed to write reputation snapshot", {{"error", error}});
    std::cerr << "error: failed to write reputation.json: " << error << '\n';
    return kExitFailure;
  }
  if (!core::WriteTextFileAtomic(breakers_path, BuildBreakerStatsJson(services.breakers()),
                                 error)) {
    logger.Error("failed to write breaker stats", {{"error", error}});
    std::cerr << "error: failed to write breakers.json: " << error << '\n';
    return kExitFailure;
  }
  if (run_result != nullptr) {
    run_result->report_json_path = report_path;
    run_result->reputation_json_path = reputation_path;
    run_result->breakers_json_path = breakers_path;
  }

  if (!audit_ok) {
    logger.Error("audit ended in error", {{"error", audit_error}});
    std::cerr << "error: audit failed: " << audit_error << '\n';
    return kExitAuditError;
  }

  if (run_result != nullptr && state.trust.has_value()) {
    run_result->final_score = state.trust->final_score();
    run_result->risk_level = scoring::ToString(state.trust->risk_level());
  }
  logger.Info("audit artifacts written", {{"audit_dir", audit_dir.string()}});
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "audit") {
    return CommandAudit(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace siteaudit::cli
