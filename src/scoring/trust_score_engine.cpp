#include "scoring/trust_score_engine.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "resilience/quality_penalty.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace siteaudit::scoring {

namespace {

constexpr double kMissingSignalScore = 0.5;
constexpr double kMissingSignalConfidence = 0.25;

struct Rule {
  const char* name;
  OverrideAction action;
  int value;
};

int ApplyRule(const Rule& rule, const int score) {
  if (rule.action == OverrideAction::kCap) {
    return std::min(score, rule.value);
  }
  return std::max(0, score - rule.value);
}

const SubSignal* FindIn(const std::vector<SubSignal>& signals, const SignalKind kind) {
  for (const auto& signal : signals) {
    if (signal.kind == kind) {
      return &signal;
    }
  }
  return nullptr;
}

std::vector<Rule> FiredRules(const HardStopConditions& stops, const std::vector<SubSignal>& signals,
                             const bool paranoia) {
  std::vector<Rule> fired;
  const SubSignal* visual = FindIn(signals, SignalKind::kVisual);
  const SubSignal* graph = FindIn(signals, SignalKind::kGraph);
  const bool graph_measured = graph != nullptr && graph->measured;
  const bool age_known = stops.domain_age_days >= 0;
  const bool no_ssl = stops.has_ssl.has_value() && !*stops.has_ssl;

  if (no_ssl) {
    fired.push_back({"no_ssl", OverrideAction::kCap, 50});
  }
  if (stops.invalid_certificate) {
    fired.push_back({"invalid_certificate", OverrideAction::kCap, 49});
  }
  if (age_known && stops.domain_age_days < 7 && graph_measured && graph->score < 0.3) {
    fired.push_back({"new_domain_low_graph", OverrideAction::kCap, 30});
  }
  if (stops.fake_timer_detected) {
    fired.push_back({"fake_timer_detected", OverrideAction::kDeduct, 25});
  }
  if (stops.domain_blacklisted) {
    fired.push_back({"domain_blacklisted", OverrideAction::kCap, 15});
  }
  if (stops.fake_badge_count > 0U && stops.verified_badge_count == 0U) {
    fired.push_back({"all_fake_badges", OverrideAction::kDeduct, 15});
  }
  if (stops.captcha_blocked) {
    fired.push_back({"captcha_blocked", OverrideAction::kCap, 65});
  }
  if (stops.critical_indicator_confirmed) {
    fired.push_back({"critical_indicator", OverrideAction::kCap, 39});
  }
  if (visual != nullptr && visual->measured && visual->score >= 0.7 && graph_measured &&
      graph->score <= 0.3) {
    fired.push_back({"graph_overrides_vision", OverrideAction::kCap, 69});
  }

  if (!paranoia) {
    return fired;
  }
  if (no_ssl) {
    fired.push_back({"paranoia_no_ssl", OverrideAction::kCap, 25});
  }
  if (age_known && stops.domain_age_days < 30) {
    fired.push_back({"paranoia_new_domain", OverrideAction::kCap, 40});
  }
  if (stops.whois_hidden && age_known && stops.domain_age_days < 90) {
    fired.push_back({"paranoia_hidden_whois_new", OverrideAction::kCap, 35});
  }
  if (stops.phishing_hit) {
    fired.push_back({"paranoia_phishing_hit", OverrideAction::kCap, 5});
  }
  if (stops.js_obfuscation_risk > 0.7) {
    fired.push_back({"paranoia_js_obfuscation", OverrideAction::kDeduct, 30});
  }
  if (stops.cross_domain_sensitive_forms) {
    fired.push_back({"paranoia_cross_domain_forms", OverrideAction::kDeduct, 25});
  }
  return fired;
}

std::string BuildExplanation(const int final_score, const RiskLevel level,
                             const int pre_override, const double penalty,
                             const std::vector<SubSignal>& signals,
                             const std::map<SignalKind, double>& breakdown,
                             const std::vector<AppliedOverride>& overrides) {
  std::ostringstream out;
  out << "Trust score " << final_score << "/100 (" << ToString(level) << "); pre-override "
      << pre_override << "; degradation penalty " << core::FormatFixedDouble(penalty, 2) << ".";
  for (const auto& signal : signals) {
    const auto it = breakdown.find(signal.kind);
    const double contribution = it == breakdown.end() ? 0.0 : it->second;
    out << " " << ToString(signal.kind) << "=" << core::FormatFixedDouble(signal.score, 2)
        << " (conf " << core::FormatFixedDouble(signal.confidence, 2)
        << (signal.measured ? "" : ", neutral substitute") << ") -> "
        << core::FormatFixedDouble(contribution * 100.0, 1) << ";";
  }
  if (!overrides.empty()) {
    out << " Overrides:";
    for (const auto& applied : overrides) {
      out << " " << applied.rule << "(" << ToString(applied.action) << " " << applied.value
          << " -> " << applied.resulting_score << ")";
    }
  }
  return out.str();
}

} // namespace

TrustScoreEngine::TrustScoreEngine(ProfileTable profiles, core::logging::Logger& logger)
    : profiles_(std::move(profiles)), logger_(logger) {}

bool TrustScoreEngine::Score(const ScoreRequest& request, std::optional<TrustScoreResult>& result,
                             std::string& error) const {
  result.reset();
  error.clear();

  SiteTypeProfile profile;
  if (!ResolveSiteTypeProfile(profiles_, request.site_type, profile, error)) {
    logger_.Error("trust scoring configuration error", {{"error", error}});
    return false;
  }

  std::vector<SubSignal> signals;
  std::map<SignalKind, bool> present;
  for (const SignalKind kind : kAllSignals) {
    const auto it = request.signals.find(kind);
    if (it == request.signals.end()) {
      if (IsRequiredSignal(kind)) {
        signals.push_back({.kind = kind,
                           .score = kMissingSignalScore,
                           .confidence = kMissingSignalConfidence,
                           .measured = false,
                           .detail = "missing"});
        present[kind] = true;
      }
      continue;
    }
    const double score = std::isfinite(it->second.score) ? it->second.score : 0.0;
    const double confidence =
        std::isfinite(it->second.confidence) ? it->second.confidence : 0.0;
    signals.push_back({.kind = kind,
                       .score = std::clamp(score, 0.0, 1.0),
                       .confidence = std::clamp(confidence, 0.0, 1.0),
                       .measured = true,
                       .detail = it->second.detail});
    present[kind] = true;
  }

  const SignalWeights weights = Renormalize(profile.weights, present);
  double raw = 0.0;
  double confidence = 0.0;
  std::map<SignalKind, double> breakdown;
  for (const auto& signal : signals) {
    const auto it = weights.find(signal.kind);
    const double weight = it == weights.end() ? 0.0 : it->second;
    breakdown[signal.kind] = weight * signal.score;
    raw += weight * signal.score;
    confidence += weight * signal.confidence;
  }

  const double penalty = std::max(0.0, request.quality_penalty);
  const double raw_score = raw * 100.0;
  const double scaled = resilience::ApplyQualityPenalty(raw_score, penalty);
  const int pre_override = std::clamp(static_cast<int>(std::lround(scaled)), 0, 100);
  confidence *= 1.0 - std::min(resilience::kMaxAggregatePenalty, penalty);

  int final_score = pre_override;
  std::vector<AppliedOverride> applied;
  for (const Rule& rule : FiredRules(request.hard_stops, signals, profile.paranoia)) {
    const int resulting = ApplyRule(rule, pre_override);
    applied.push_back({.rule = rule.name,
                       .action = rule.action,
                       .value = rule.value,
                       .resulting_score = resulting});
    final_score = std::min(final_score, resulting);
    logger_.Info("trust override fired",
                 {{"rule", rule.name},
                  {"action", ToString(rule.action)},
                  {"value", std::to_string(rule.value)},
                  {"resulting_score", std::to_string(resulting)}});
  }

  const RiskLevel level = RiskLevelForScore(final_score);
  std::string explanation =
      BuildExplanation(final_score, level, pre_override, penalty, signals, breakdown, applied);

  result = TrustScoreResult::Create({
      .final_score = final_score,
      .pre_override_score = pre_override,
      .raw_score = raw_score,
      .quality_penalty = penalty,
      .confidence = confidence,
      .site_type = profile.name,
      .sub_signals = std::move(signals),
      .weighted_breakdown = std::move(breakdown),
      .overrides_applied = std::move(applied),
      .explanation = std::move(explanation),
  });
  return true;
}

} // namespace siteaudit::scoring
