#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/scenario_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace common = siteaudit::tests::common;

using common::AssertContains;
using common::AssertTrue;
using common::Fail;

namespace {

struct DispatchOutput {
  int exit_code = 0;
  std::string out;
  std::string err;
};

DispatchOutput RunCli(const std::vector<std::string>& argv) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  const int exit_code = common::DispatchArgs(argv);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  return DispatchOutput{.exit_code = exit_code, .out = captured_out.str(), .err = captured_err.str()};
}

std::vector<std::string> ReadNonEmptyLines(const fs::path& file_path) {
  std::ifstream input(file_path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + file_path.string());
  }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

fs::path ResolveSingleAuditDir(const fs::path& out_root) {
  std::vector<fs::path> audit_dirs;
  for (const auto& entry : fs::directory_iterator(out_root)) {
    if (entry.is_directory() && entry.path().filename().string().rfind("audit-", 0) == 0U) {
      audit_dirs.push_back(entry.path());
    }
  }
  if (audit_dirs.size() != 1U) {
    Fail("expected exactly one audit directory under " + out_root.string());
  }
  return audit_dirs.front();
}

void CheckUsageErrors(const fs::path& scenario_path) {
  DispatchOutput result = RunCli({"siteaudit"});
  AssertTrue(result.exit_code == 2, "missing subcommand is a usage error");
  AssertContains(result.err, "usage:");

  result = RunCli({"siteaudit", "frobnicate"});
  AssertTrue(result.exit_code == 2, "unknown subcommand is a usage error");
  AssertContains(result.err, "unknown subcommand: frobnicate");

  result = RunCli({"siteaudit", "audit"});
  AssertTrue(result.exit_code == 2, "audit without a scenario is a usage error");
  AssertContains(result.err, "audit requires exactly 1 argument");

  result = RunCli({"siteaudit", "audit", scenario_path.string(), "--turbo"});
  AssertTrue(result.exit_code == 2, "unknown flag is a usage error");
  AssertContains(result.err, "unknown option: --turbo");

  result = RunCli({"siteaudit", "audit", scenario_path.string(), "--tier", "exhaustive"});
  AssertTrue(result.exit_code == 2, "unknown tier is a usage error");
  AssertContains(result.err, "unknown audit tier 'exhaustive'");

  result = RunCli({"siteaudit", "audit", scenario_path.string(), "--out"});
  AssertTrue(result.exit_code == 2, "dangling flag is a usage error");
  AssertContains(result.err, "missing value for --out");

  result = RunCli({"siteaudit", "version", "extra"});
  AssertTrue(result.exit_code == 2, "version takes no arguments");
}

void CheckVersionAndValidate(const fs::path& temp_root) {
  DispatchOutput result = RunCli({"siteaudit", "version"});
  AssertTrue(result.exit_code == 0, "version succeeds");
  AssertContains(result.out, "siteaudit 0.1.0");

  const fs::path bad_settings = temp_root / "bad_settings.json";
  common::WriteFixtureFile(bad_settings,
                           R"({"confidence_threshold": 1.5, "timeout_strategy": "yolo",)"
                           R"( "tiers": {"standard_audit": {"max_pages": 0}}, "colour": "red"})");
  result = RunCli({"siteaudit", "validate", bad_settings.string()});
  AssertTrue(result.exit_code == 10, "invalid settings exit with 10");
  AssertContains(result.err, "invalid settings:");
  AssertContains(result.err, "confidence_threshold: must be a number in [0,1]");
  AssertContains(result.err, "timeout_strategy: must be one of");
  AssertContains(result.err, "tiers.standard_audit.max_pages: must be greater than 0");
  AssertContains(result.err, "colour: unknown settings key");

  const fs::path good_settings = temp_root / "good_settings.json";
  common::WriteFixtureFile(good_settings, R"({"timeout_strategy": "adaptive"})");
  result = RunCli({"siteaudit", "validate", good_settings.string()});
  AssertTrue(result.exit_code == 0, "valid settings pass");
  AssertContains(result.out, "valid: ");

  result = RunCli({"siteaudit", "validate", (temp_root / "absent.json").string()});
  AssertTrue(result.exit_code == 1, "missing settings file is a command failure");
  AssertContains(result.err, "settings file not found");
}

void CheckInvalidScenario(const fs::path& temp_root) {
  const fs::path scenario_path = temp_root / "no_url.json";
  common::WriteFixtureFile(scenario_path, R"({"pages": []})");
  const DispatchOutput result = RunCli(
      {"siteaudit", "audit", scenario_path.string(), "--out", (temp_root / "unused").string()});
  AssertTrue(result.exit_code == 20, "invalid scenario exits with 20");
  AssertContains(result.err, "invalid scenario:");
  AssertContains(result.err, "url is required");
  AssertTrue(!fs::exists(temp_root / "unused"), "no artifacts for rejected scenarios");
}

void CheckHealthyAuditArtifacts(const fs::path& temp_root, const fs::path& scenario_path) {
  const fs::path out_root = temp_root / "out";
  const DispatchOutput result = RunCli({"siteaudit", "audit", scenario_path.string(), "--out",
                                        out_root.string(), "--mode", "simple", "--log-level",
                                        "warn"});
  if (result.exit_code != 0) {
    Fail("healthy audit should exit 0, stderr: " + result.err);
  }
  AssertContains(result.out, "audit_id: audit-");
  AssertContains(result.out, "trust_score: ");
  AssertContains(result.out, "(trusted)");

  const fs::path audit_dir = ResolveSingleAuditDir(out_root);
  for (const char* name :
       {"events.jsonl", "audit_report.json", "reputation.json", "breakers.json"}) {
    AssertTrue(fs::exists(audit_dir / name), name);
  }

  const std::vector<std::string> lines = ReadNonEmptyLines(audit_dir / "events.jsonl");
  AssertTrue(lines.size() >= 4U, "events trace too short");
  AssertContains(lines.front(), "\"type\":\"audit_started\"");
  AssertContains(lines.back(), "\"type\":\"audit_complete\"");
  AssertContains(lines.back(), "\"risk_level\":\"trusted\"");

  const std::string report = common::ReadFileToString(audit_dir / "audit_report.json");
  AssertContains(report, "\"state\": \"DONE\"");
  AssertContains(report, "\"verdict_mode\": \"simple\"");
  AssertContains(report, "\"url\": \"https://shop.example.com/\"");
  AssertContains(report, "\"narrative\": \"This site looks ");

  const std::string reputation = common::ReadFileToString(audit_dir / "reputation.json");
  AssertContains(reputation, "\"source\": \"whois\"");
  AssertContains(reputation, "\"total_predictions\": 1");

  const std::string breakers = common::ReadFileToString(audit_dir / "breakers.json");
  AssertContains(breakers, "\"name\": \"vision\"");
  AssertContains(breakers, "\"state\": \"closed\"");
}

} // namespace

int main() {
  const fs::path temp_root = common::CreateUniqueTempDir("siteaudit-cli-audit");
  const fs::path scenario_path = temp_root / "healthy_shop.json";
  common::WriteFixtureFile(scenario_path, common::kHealthyShopScenarioJson);

  CheckUsageErrors(scenario_path);
  CheckVersionAndValidate(temp_root);
  CheckInvalidScenario(temp_root);
  CheckHealthyAuditArtifacts(temp_root, scenario_path);

  common::RemovePathBestEffort(temp_root);
  std::cout << "cli_audit_smoke: ok\n";
  return 0;
}
