#pragma once

#include <algorithm>

namespace siteaudit::resilience {

// Per-stage penalty bounds for a degraded agent result.
constexpr double kMinQualityPenalty = 0.2;
constexpr double kMaxQualityPenalty = 0.7;

// Aggregate penalties never remove more than 90% of the score.
constexpr double kMaxAggregatePenalty = 0.9;

// A positive raw score never scales below this many points, so a fully
// degraded audit still reports a non-zero, clearly low-confidence score.
constexpr double kDegradedScoreFloor = 1.0;

inline double ClampStagePenalty(double penalty) {
  return std::clamp(penalty, kMinQualityPenalty, kMaxQualityPenalty);
}

// final = raw x (1 - min(0.9, sum of stage penalties)), floor-clamped.
inline double ApplyQualityPenalty(double raw_score, double total_penalty) {
  const double factor = 1.0 - std::min(kMaxAggregatePenalty, std::max(0.0, total_penalty));
  double scaled = raw_score * factor;
  if (raw_score > 0.0 && scaled < kDegradedScoreFloor) {
    scaled = std::min(raw_score, kDegradedScoreFloor);
  }
  return scaled;
}

} // namespace siteaudit::resilience
