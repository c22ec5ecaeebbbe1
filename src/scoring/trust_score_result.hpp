#pragma once

#include "scoring/signal_weights.hpp"

#include <map>
#include <string>
#include <vector>

namespace siteaudit::scoring {

enum class RiskLevel {
  kTrusted,
  kProbablySafe,
  kSuspicious,
  kHighRisk,
  kDangerous,
};

const char* ToString(RiskLevel level);

// >=90 trusted, >=70 probably safe, >=40 suspicious, >=20 high risk, else
// dangerous. Out-of-range input is clamped to [0,100] first.
RiskLevel RiskLevelForScore(int score);

struct SubSignal {
  SignalKind kind = SignalKind::kVisual;
  double score = 0.5;
  double confidence = 1.0;
  // False when the signal was missing and a neutral value stood in.
  bool measured = true;
  std::string detail;
};

enum class OverrideAction {
  kCap,
  kDeduct,
};

const char* ToString(OverrideAction action);

struct AppliedOverride {
  std::string rule;
  OverrideAction action = OverrideAction::kCap;
  int value = 0;
  // Score this rule alone would produce from the pre-override score.
  int resulting_score = 0;
};

// Immutable scoring outcome. Only Create() builds one, and it derives
// risk_level from the clamped final score, so the two can never disagree.
class TrustScoreResult {
public:
  struct Fields {
    int final_score = 0;
    int pre_override_score = 0;
    double raw_score = 0.0;
    double quality_penalty = 0.0;
    double confidence = 0.0;
    std::string site_type;
    std::vector<SubSignal> sub_signals;
    std::map<SignalKind, double> weighted_breakdown;
    std::vector<AppliedOverride> overrides_applied;
    std::string explanation;
  };

  static TrustScoreResult Create(Fields fields);

  int final_score() const {
    return fields_.final_score;
  }
  RiskLevel risk_level() const {
    return risk_level_;
  }
  int pre_override_score() const {
    return fields_.pre_override_score;
  }
  double raw_score() const {
    return fields_.raw_score;
  }
  double quality_penalty() const {
    return fields_.quality_penalty;
  }
  double confidence() const {
    return fields_.confidence;
  }
  const std::string& site_type() const {
    return fields_.site_type;
  }
  const std::vector<SubSignal>& sub_signals() const {
    return fields_.sub_signals;
  }
  const std::map<SignalKind, double>& weighted_breakdown() const {
    return fields_.weighted_breakdown;
  }
  const std::vector<AppliedOverride>& overrides_applied() const {
    return fields_.overrides_applied;
  }
  const std::string& explanation() const {
    return fields_.explanation;
  }

  std::vector<std::string> OverrideNames() const;
  const SubSignal* FindSignal(SignalKind kind) const;

  std::string ToJson() const;

private:
  TrustScoreResult(Fields fields, RiskLevel risk_level);

  Fields fields_;
  RiskLevel risk_level_;
};

} // namespace siteaudit::scoring
