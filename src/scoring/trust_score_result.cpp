#include "scoring/trust_score_result.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <sstream>

namespace siteaudit::scoring {

const char* ToString(const RiskLevel level) {
  switch (level) {
  case RiskLevel::kTrusted:
    return "trusted";
  case RiskLevel::kProbablySafe:
    return "probably_safe";
  case RiskLevel::kSuspicious:
    return "suspicious";
  case RiskLevel::kHighRisk:
    return "high_risk";
  case RiskLevel::kDangerous:
    return "dangerous";
  }
  return "dangerous";
}

RiskLevel RiskLevelForScore(int score) {
  score = std::clamp(score, 0, 100);
  if (score >= 90) {
    return RiskLevel::kTrusted;
  }
  if (score >= 70) {
    return RiskLevel::kProbablySafe;
  }
  if (score >= 40) {
    return RiskLevel::kSuspicious;
  }
  if (score >= 20) {
    return RiskLevel::kHighRisk;
  }
  return RiskLevel::kDangerous;
}

const char* ToString(const OverrideAction action) {
  switch (action) {
  case OverrideAction::kCap:
    return "cap";
  case OverrideAction::kDeduct:
    return "deduct";
  }
  return "cap";
}

TrustScoreResult TrustScoreResult::Create(Fields fields) {
  fields.final_score = std::clamp(fields.final_score, 0, 100);
  fields.pre_override_score = std::clamp(fields.pre_override_score, 0, 100);
  fields.confidence = std::clamp(fields.confidence, 0.0, 1.0);
  const RiskLevel level = RiskLevelForScore(fields.final_score);
  return TrustScoreResult(std::move(fields), level);
}

TrustScoreResult::TrustScoreResult(Fields fields, const RiskLevel risk_level)
    : fields_(std::move(fields)), risk_level_(risk_level) {}

std::vector<std::string> TrustScoreResult::OverrideNames() const {
  std::vector<std::string> names;
  names.reserve(fields_.overrides_applied.size());
  for (const auto& applied : fields_.overrides_applied) {
    names.push_back(applied.rule);
  }
  return names;
}

const SubSignal* TrustScoreResult::FindSignal(const SignalKind kind) const {
  for (const auto& signal : fields_.sub_signals) {
    if (signal.kind == kind) {
      return &signal;
    }
  }
  return nullptr;
}

std::string TrustScoreResult::ToJson() const {
  std::ostringstream out;
  out << "{\"final_score\":" << fields_.final_score
      << ",\"risk_level\":" << core::QuoteJson(ToString(risk_level_))
      << ",\"pre_override_score\":" << fields_.pre_override_score
      << ",\"raw_score\":" << core::FormatFixedDouble(fields_.raw_score, 2)
      << ",\"quality_penalty\":" << core::FormatFixedDouble(fields_.quality_penalty, 2)
      << ",\"confidence\":" << core::FormatFixedDouble(fields_.confidence, 3)
      << ",\"site_type\":" << core::QuoteJson(fields_.site_type) << ",\"sub_signals\":[";
  for (std::size_t i = 0; i < fields_.sub_signals.size(); ++i) {
    const auto& signal = fields_.sub_signals[i];
    out << (i == 0U ? "" : ",") << "{\"name\":" << core::QuoteJson(ToString(signal.kind))
        << ",\"score\":" << core::FormatFixedDouble(signal.score, 3)
        << ",\"confidence\":" << core::FormatFixedDouble(signal.confidence, 3)
        << ",\"measured\":" << (signal.measured ? "true" : "false")
        << ",\"detail\":" << core::QuoteJson(signal.detail) << "}";
  }
  out << "],\"weighted_breakdown\":{";
  bool first = true;
  for (const auto& [kind, contribution] : fields_.weighted_breakdown) {
    out << (first ? "" : ",") << core::QuoteJson(ToString(kind)) << ":"
        << core::FormatFixedDouble(contribution, 4);
    first = false;
  }
  out << "},\"overrides_applied\":[";
  for (std::size_t i = 0; i < fields_.overrides_applied.size(); ++i) {
    const auto& applied = fields_.overrides_applied[i];
    out << (i == 0U ? "" : ",") << "{\"rule\":" << core::QuoteJson(applied.rule)
        << ",\"action\":" << core::QuoteJson(ToString(applied.action))
        << ",\"value\":" << applied.value << ",\"resulting_score\":" << applied.resulting_score
        << "}";
  }
  out << "],\"explanation\":" << core::QuoteJson(fields_.explanation) << "}";
  return out.str();
}

} // namespace siteaudit::scoring
