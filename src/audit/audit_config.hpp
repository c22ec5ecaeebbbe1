#pragma once

#include "resilience/circuit_breaker.hpp"
#include "scoring/signal_weights.hpp"
#include "timing/complexity_analyzer.hpp"
#include "timing/timeout_manager.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::audit {

enum class AuditTier {
  kQuickScan,
  kStandardAudit,
  kDeepForensic,
};

const char* ToString(AuditTier tier);
// Accepts quick_scan, standard_audit, deep_forensic and the alias deep.
bool ParseAuditTier(std::string_view raw, AuditTier& tier, std::string& error);

struct AuditBudget {
  std::uint32_t max_iterations = 5;
  std::chrono::milliseconds max_elapsed{300'000};
  std::uint32_t max_external_calls = 12;
  std::uint32_t max_pages = 5;
};

// quick_scan 1 page / 3 calls, standard_audit 5 / 12, deep_forensic 10 / 30;
// all tiers 5 iterations and 5 minutes.
AuditBudget DefaultBudgetForTier(AuditTier tier);

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Engine-wide settings shared by every audit in the process.
struct AuditSettings {
  timing::TimeoutStrategy timeout_strategy = timing::TimeoutStrategy::kAdaptive;
  timing::TimeoutManagerConfig timeouts;
  // How long a timed-out stage may keep running after cancellation before
  // it is abandoned.
  std::chrono::milliseconds cancel_grace{250};
  // Judge confidence at which the loop stops investigating.
  double confidence_threshold = 0.6;
  std::map<AuditTier, AuditBudget> budgets;
  std::map<std::string, resilience::BreakerConfig, std::less<>> breakers;
  scoring::ProfileTable profiles;
  std::vector<std::string> security_modules;

  AuditBudget BudgetFor(AuditTier tier) const;
  resilience::BreakerConfig BreakerFor(std::string_view agent) const;
};

AuditSettings DefaultAuditSettings();

// Validates settings JSON and, when valid, overlays it on the defaults.
//
// Contract:
// - Returns true when validation completed (even if the settings are invalid).
// - `report.valid` tells whether `settings` was populated.
// - On parse errors, emits one issue under path `$`.
bool ParseAuditSettingsText(std::string_view json_text, AuditSettings& settings,
                            ValidationReport& report, std::string& error);

// Loads settings from `path`. An empty path yields the defaults.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report` (and `settings` when valid).
bool LoadAuditSettingsFile(const std::string& path, AuditSettings& settings,
                           ValidationReport& report, std::string& error);

} // namespace siteaudit::audit
