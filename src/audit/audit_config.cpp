#include "audit/audit_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <set>

namespace siteaudit::audit {

namespace {

using JsonValue = core::json::Value;

constexpr std::array<AuditTier, 3> kAllTiers{AuditTier::kQuickScan, AuditTier::kStandardAudit,
                                             AuditTier::kDeepForensic};

const std::set<std::string, std::less<>>& KnownTopLevelKeys() {
  static const std::set<std::string, std::less<>> kKeys{
      "timeout_strategy",     "min_adaptive_samples", "min_adaptive_deadline_ms",
      "unknown_agent_deadline_ms", "cancel_grace_ms", "confidence_threshold",
      "tiers",                "breakers",             "site_types",
      "security_modules",
  };
  return kKeys;
}

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

// Reads an optional positive integer. Missing keys leave `out` untouched.
template <typename T>
void ReadPositiveInteger(const JsonValue& object, std::string_view key, const std::string& path,
                         T& out, ValidationReport& report) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed)) {
    AddIssue(report, path, "must be a positive integer");
    return;
  }
  if (parsed == 0U) {
    AddIssue(report, path, "must be greater than 0");
    return;
  }
  out = static_cast<T>(parsed);
}

void ReadPositiveMillis(const JsonValue& object, std::string_view key, const std::string& path,
                        std::chrono::milliseconds& out, ValidationReport& report) {
  std::uint64_t parsed = 0;
  ReadPositiveInteger(object, key, path, parsed, report);
  if (parsed > 0U) {
    out = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
  }
}

void ValidateTiers(const JsonValue& tiers, AuditSettings& settings, ValidationReport& report) {
  if (!tiers.IsObject()) {
    AddIssue(report, "tiers", "must be an object keyed by tier name");
    return;
  }
  for (const auto& [name, value] : tiers.object_value) {
    const std::string path = "tiers." + name;
    AuditTier tier = AuditTier::kStandardAudit;
    std::string tier_error;
    if (!ParseAuditTier(name, tier, tier_error)) {
      AddIssue(report, path, tier_error);
      continue;
    }
    if (!value.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }
    AuditBudget budget = settings.BudgetFor(tier);
    ReadPositiveInteger(value, "max_iterations", path + ".max_iterations", budget.max_iterations,
                        report);
    ReadPositiveInteger(value, "max_external_calls", path + ".max_external_calls",
                        budget.max_external_calls, report);
    ReadPositiveInteger(value, "max_pages", path + ".max_pages", budget.max_pages, report);
    ReadPositiveMillis(value, "max_elapsed_ms", path + ".max_elapsed_ms", budget.max_elapsed,
                       report);
    settings.budgets[tier] = budget;
  }
}

void ValidateBreakers(const JsonValue& breakers, AuditSettings& settings,
                      ValidationReport& report) {
  if (!breakers.IsObject()) {
    AddIssue(report, "breakers", "must be an object keyed by agent name");
    return;
  }
  for (const auto& [agent, value] : breakers.object_value) {
    const std::string path = "breakers." + agent;
    if (!value.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }
    resilience::BreakerConfig config = settings.BreakerFor(agent);
    ReadPositiveInteger(value, "failure_threshold", path + ".failure_threshold",
                        config.failure_threshold, report);
    ReadPositiveMillis(value, "base_backoff_ms", path + ".base_backoff_ms", config.base_backoff,
                       report);
    ReadPositiveMillis(value, "max_backoff_ms", path + ".max_backoff_ms", config.max_backoff,
                       report);
    std::string config_error;
    if (!resilience::ValidateBreakerConfig(config, config_error)) {
      AddIssue(report, path, config_error);
      continue;
    }
    settings.breakers[agent] = config;
  }
}

void ValidateSiteTypes(const JsonValue& site_types, AuditSettings& settings,
                       ValidationReport& report) {
  if (!site_types.IsObject()) {
    AddIssue(report, "site_types", "must be an object keyed by site type");
    return;
  }
  for (const auto& [name, value] : site_types.object_value) {
    const std::string path = "site_types." + name;
    if (!value.IsObject()) {
      AddIssue(report, path, "must be an object with weights");
      continue;
    }

    scoring::SiteTypeProfile profile;
    if (const auto existing = settings.profiles.find(name); existing != settings.profiles.end()) {
      profile = existing->second;
    } else {
      profile.name = name;
      profile.weights = scoring::DefaultSignalWeights();
    }
    profile.paranoia = core::json::BoolOr(value, "paranoia", profile.paranoia);

    if (const JsonValue* weights = core::json::FindMember(value, "weights"); weights != nullptr) {
      if (!weights->IsObject()) {
        AddIssue(report, path + ".weights", "must be an object keyed by signal name");
        continue;
      }
      for (const auto& [signal_name, weight] : weights->object_value) {
        const std::string weight_path = path + ".weights." + signal_name;
        scoring::SignalKind kind = scoring::SignalKind::kVisual;
        if (!scoring::ParseSignalKind(signal_name, kind)) {
          AddIssue(report, weight_path,
                   "unknown signal (expected visual|structural|temporal|graph|meta|security)");
          continue;
        }
        if (!weight.IsNumber() || !std::isfinite(weight.number_value) ||
            weight.number_value < 0.0) {
          AddIssue(report, weight_path, "must be a non-negative number");
          continue;
        }
        profile.weights[kind] = weight.number_value;
      }
    }

    std::string weights_error;
    if (!scoring::ValidateSignalWeights(profile.weights, weights_error)) {
      AddIssue(report, path + ".weights", weights_error);
      continue;
    }
    settings.profiles[name] = std::move(profile);
  }
}

void ValidateSettingsObject(const JsonValue& root, AuditSettings& settings,
                            ValidationReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, "$", "settings root must be a JSON object");
    return;
  }

  for (const auto& [key, value] : root.object_value) {
    if (KnownTopLevelKeys().find(key) == KnownTopLevelKeys().end()) {
      AddIssue(report, key, "unknown settings key");
    }
  }

  if (const JsonValue* strategy = core::json::FindMember(root, "timeout_strategy");
      strategy != nullptr) {
    std::string strategy_error;
    if (!strategy->IsString() ||
        !timing::ParseTimeoutStrategy(strategy->string_value, settings.timeout_strategy,
                                      strategy_error)) {
      AddIssue(report, "timeout_strategy", "must be one of fast|standard|conservative|adaptive");
    }
  }

  ReadPositiveInteger(root, "min_adaptive_samples", "min_adaptive_samples",
                      settings.timeouts.min_adaptive_samples, report);
  ReadPositiveMillis(root, "min_adaptive_deadline_ms", "min_adaptive_deadline_ms",
                     settings.timeouts.min_adaptive_deadline, report);
  ReadPositiveMillis(root, "unknown_agent_deadline_ms", "unknown_agent_deadline_ms",
                     settings.timeouts.unknown_agent_deadline, report);
  ReadPositiveMillis(root, "cancel_grace_ms", "cancel_grace_ms", settings.cancel_grace, report);

  if (const JsonValue* threshold = core::json::FindMember(root, "confidence_threshold");
      threshold != nullptr) {
    if (!threshold->IsNumber() || !std::isfinite(threshold->number_value) ||
        threshold->number_value < 0.0 || threshold->number_value > 1.0) {
      AddIssue(report, "confidence_threshold", "must be a number in [0,1]");
    } else {
      settings.confidence_threshold = threshold->number_value;
    }
  }

  if (const JsonValue* tiers = core::json::FindMember(root, "tiers"); tiers != nullptr) {
    ValidateTiers(*tiers, settings, report);
  }
  if (const JsonValue* breakers = core::json::FindMember(root, "breakers"); breakers != nullptr) {
    ValidateBreakers(*breakers, settings, report);
  }
  if (const JsonValue* site_types = core::json::FindMember(root, "site_types");
      site_types != nullptr) {
    ValidateSiteTypes(*site_types, settings, report);
  }
  if (const JsonValue* modules = core::json::FindMember(root, "security_modules");
      modules != nullptr) {
    const bool all_strings =
        modules->IsArray() &&
        std::all_of(modules->array_value.begin(), modules->array_value.end(),
                    [](const JsonValue& item) { return item.IsString(); });
    if (!all_strings) {
      AddIssue(report, "security_modules", "must be an array of strings");
    } else {
      settings.security_modules = core::json::StringArrayOr(root, "security_modules");
    }
  }
}

} // namespace

const char* ToString(AuditTier tier) {
  switch (tier) {
  case AuditTier::kQuickScan:
    return "quick_scan";
  case AuditTier::kStandardAudit:
    return "standard_audit";
  case AuditTier::kDeepForensic:
    return "deep_forensic";
  }

  return "standard_audit";
}

bool ParseAuditTier(std::string_view raw, AuditTier& tier, std::string& error) {
  if (raw == "quick_scan") {
    tier = AuditTier::kQuickScan;
    return true;
  }
  if (raw == "standard_audit") {
    tier = AuditTier::kStandardAudit;
    return true;
  }
  if (raw == "deep_forensic" || raw == "deep") {
    tier = AuditTier::kDeepForensic;
    return true;
  }
  error = "unknown audit tier '" + std::string(raw) +
          "' (expected quick_scan|standard_audit|deep_forensic)";
  return false;
}

AuditBudget DefaultBudgetForTier(AuditTier tier) {
  switch (tier) {
  case AuditTier::kQuickScan:
    return AuditBudget{.max_external_calls = 3, .max_pages = 1};
  case AuditTier::kStandardAudit:
    return AuditBudget{.max_external_calls = 12, .max_pages = 5};
  case AuditTier::kDeepForensic:
    return AuditBudget{.max_external_calls = 30, .max_pages = 10};
  }

  return AuditBudget{};
}

AuditBudget AuditSettings::BudgetFor(AuditTier tier) const {
  const auto it = budgets.find(tier);
  return it == budgets.end() ? DefaultBudgetForTier(tier) : it->second;
}

resilience::BreakerConfig AuditSettings::BreakerFor(std::string_view agent) const {
  const auto it = breakers.find(agent);
  return it == breakers.end() ? resilience::DefaultBreakerConfigFor(agent) : it->second;
}

AuditSettings DefaultAuditSettings() {
  AuditSettings settings;
  for (const AuditTier tier : kAllTiers) {
    settings.budgets[tier] = DefaultBudgetForTier(tier);
  }
  settings.profiles = scoring::DefaultProfileTable();
  settings.security_modules = {"tls", "headers", "js_analysis", "form_validation"};
  return settings;
}

bool ParseAuditSettingsText(std::string_view json_text, AuditSettings& settings,
                            ValidationReport& report, std::string& error) {
  report = ValidationReport{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$",
             parse_error + " (fix JSON syntax and rerun 'siteaudit validate <settings.json>')");
    report.valid = false;
    return true;
  }

  AuditSettings working = DefaultAuditSettings();
  ValidateSettingsObject(root, working, report);
  report.valid = report.issues.empty();
  if (report.valid) {
    settings = std::move(working);
  }
  return true;
}

bool LoadAuditSettingsFile(const std::string& path, AuditSettings& settings,
                           ValidationReport& report, std::string& error) {
  if (path.empty()) {
    settings = DefaultAuditSettings();
    report = ValidationReport{.valid = true, .issues = {}};
    return true;
  }

  std::string contents;
  if (!core::ReadTextFile(std::filesystem::path(path), contents, error)) {
    return false;
  }
  if (contents.empty()) {
    report = ValidationReport{};
    AddIssue(report, "$", "settings file is empty; provide a valid JSON object");
    report.valid = false;
    return true;
  }
  return ParseAuditSettingsText(contents, settings, report, error);
}

} // namespace siteaudit::audit
