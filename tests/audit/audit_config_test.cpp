#include "audit/audit_config.hpp"
#include "common/scenario_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using Catch::Approx;
using siteaudit::audit::AuditSettings;
using siteaudit::audit::AuditTier;
using siteaudit::audit::DefaultAuditSettings;
using siteaudit::audit::LoadAuditSettingsFile;
using siteaudit::audit::ParseAuditSettingsText;
using siteaudit::audit::ParseAuditTier;
using siteaudit::audit::ValidationReport;
using siteaudit::scoring::SignalKind;
using siteaudit::timing::TimeoutStrategy;

namespace common = siteaudit::tests::common;

namespace {

bool HasIssue(const ValidationReport& report, const std::string& path) {
  for (const auto& issue : report.issues) {
    if (issue.path == path) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("Tier names parse including the deep alias", "[audit][config]") {
  AuditTier tier = AuditTier::kStandardAudit;
  std::string error;
  REQUIRE(ParseAuditTier("quick_scan", tier, error));
  REQUIRE(tier == AuditTier::kQuickScan);
  REQUIRE(ParseAuditTier("deep", tier, error));
  REQUIRE(tier == AuditTier::kDeepForensic);
  REQUIRE_FALSE(ParseAuditTier("forensic", tier, error));
  REQUIRE(error.find("unknown audit tier 'forensic'") == 0U);
}

TEST_CASE("Default settings carry tier budgets and breaker defaults", "[audit][config]") {
  const AuditSettings settings = DefaultAuditSettings();
  REQUIRE(settings.timeout_strategy == TimeoutStrategy::kAdaptive);
  REQUIRE(settings.BudgetFor(AuditTier::kQuickScan).max_pages == 1U);
  REQUIRE(settings.BudgetFor(AuditTier::kQuickScan).max_external_calls == 3U);
  REQUIRE(settings.BudgetFor(AuditTier::kStandardAudit).max_external_calls == 12U);
  REQUIRE(settings.BudgetFor(AuditTier::kDeepForensic).max_pages == 10U);
  REQUIRE(settings.BudgetFor(AuditTier::kDeepForensic).max_elapsed == std::chrono::minutes(5));
  REQUIRE(settings.BreakerFor("graph").failure_threshold == 5U);
  REQUIRE(settings.BreakerFor("osint").base_backoff == std::chrono::seconds(90));
  REQUIRE(settings.profiles.count("darknet_suspicious") == 1U);
}

TEST_CASE("Valid settings overlay the defaults", "[audit][config]") {
  const std::string json = R"({
    "timeout_strategy": "conservative",
    "cancel_grace_ms": 100,
    "confidence_threshold": 0.75,
    "tiers": {"quick_scan": {"max_external_calls": 4}},
    "breakers": {"vision": {"failure_threshold": 2, "base_backoff_ms": 5000}},
    "site_types": {
      "news": {"weights": {"visual": 0.2, "structural": 0.2, "temporal": 0.1,
                           "graph": 0.3, "meta": 0.1, "security": 0.1}},
      "financial": {"paranoia": true}
    },
    "security_modules": ["tls"]
  })";

  AuditSettings settings;
  ValidationReport report;
  std::string error;
  REQUIRE(ParseAuditSettingsText(json, settings, report, error));
  REQUIRE(report.valid);
  REQUIRE(settings.timeout_strategy == TimeoutStrategy::kConservative);
  REQUIRE(settings.cancel_grace == std::chrono::milliseconds(100));
  REQUIRE(settings.confidence_threshold == Approx(0.75));
  REQUIRE(settings.BudgetFor(AuditTier::kQuickScan).max_external_calls == 4U);
  REQUIRE(settings.BudgetFor(AuditTier::kQuickScan).max_pages == 1U);
  REQUIRE(settings.BreakerFor("vision").failure_threshold == 2U);
  REQUIRE(settings.BreakerFor("vision").base_backoff == std::chrono::seconds(5));
  REQUIRE(settings.profiles.at("news").weights.at(SignalKind::kGraph) == Approx(0.3));
  REQUIRE(settings.profiles.at("financial").paranoia);
  REQUIRE(settings.security_modules.size() == 1U);
}

TEST_CASE("Invalid settings report every offending path", "[audit][config]") {
  const std::string json = R"({
    "timeout_strategy": "turbo",
    "confidence_threshold": 2,
    "retries": 3,
    "tiers": {"instant": {}, "standard_audit": {"max_pages": 0}},
    "breakers": {"graph": {"base_backoff_ms": 900000}},
    "site_types": {"news": {"weights": {"colour": 0.5}}},
    "security_modules": [1]
  })";

  AuditSettings settings = DefaultAuditSettings();
  settings.confidence_threshold = 0.33;
  ValidationReport report;
  std::string error;
  REQUIRE(ParseAuditSettingsText(json, settings, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "timeout_strategy"));
  REQUIRE(HasIssue(report, "confidence_threshold"));
  REQUIRE(HasIssue(report, "retries"));
  REQUIRE(HasIssue(report, "tiers.instant"));
  REQUIRE(HasIssue(report, "tiers.standard_audit.max_pages"));
  REQUIRE(HasIssue(report, "breakers.graph"));
  REQUIRE(HasIssue(report, "site_types.news.weights.colour"));
  REQUIRE(HasIssue(report, "security_modules"));
  // Output untouched on failure.
  REQUIRE(settings.confidence_threshold == Approx(0.33));
}

TEST_CASE("Weights carried only by the security signal are rejected", "[audit][config]") {
  const std::string json = R"({
    "site_types": {
      "vault": {"weights": {"visual": 0, "structural": 0, "temporal": 0,
                            "graph": 0, "meta": 0, "security": 1.0}}
    }
  })";

  AuditSettings settings = DefaultAuditSettings();
  ValidationReport report;
  std::string error;
  REQUIRE(ParseAuditSettingsText(json, settings, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "site_types.vault.weights"));
  REQUIRE(settings.profiles.count("vault") == 0U);
}

TEST_CASE("Malformed JSON yields a single root issue", "[audit][config]") {
  AuditSettings settings;
  ValidationReport report;
  std::string error;
  REQUIRE(ParseAuditSettingsText("{\"tiers\": ", settings, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(report.issues.size() == 1U);
  REQUIRE(report.issues[0].path == "$");
}

TEST_CASE("Settings files load from disk and empty paths mean defaults", "[audit][config]") {
  AuditSettings settings;
  ValidationReport report;
  std::string error;
  REQUIRE(LoadAuditSettingsFile("", settings, report, error));
  REQUIRE(report.valid);
  REQUIRE(settings.profiles.size() == DefaultAuditSettings().profiles.size());

  const auto dir = common::CreateUniqueTempDir("siteaudit-config-test");
  const auto path = dir / "settings.json";
  common::WriteFixtureFile(path,
                           R"({"min_adaptive_samples": 5, "min_adaptive_deadline_ms": 750})");
  REQUIRE(LoadAuditSettingsFile(path.string(), settings, report, error));
  REQUIRE(report.valid);
  REQUIRE(settings.timeouts.min_adaptive_samples == 5U);
  REQUIRE(settings.timeouts.min_adaptive_deadline == std::chrono::milliseconds(750));

  REQUIRE_FALSE(LoadAuditSettingsFile((dir / "missing.json").string(), settings, report, error));
  REQUIRE_FALSE(error.empty());
  common::RemovePathBestEffort(dir);
}
