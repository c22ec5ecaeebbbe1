#pragma once

#include "audit/audit_config.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace siteaudit::audit {

// Loop outcomes in strict priority order. When several conditions hold the
// first one listed wins, so reports always carry one stable reason.
enum class LoopReason {
  kContinue,
  kMaxIterations,
  kElapsedBudget,
  kExternalCallBudget,
  kPageBudget,
  kNoCandidates,
  kConfidenceReached,
};

const char* ToString(LoopReason reason);

struct LoopDecisionConfig {
  double confidence_threshold = 0.6;
  // Visual and graph scores further apart than this keep the audit going
  // (while below `conflict_iteration_limit`) even at high confidence.
  double conflict_gap = 0.4;
  std::uint32_t conflict_iteration_limit = 3;
  std::uint32_t max_urls_per_iteration = 2;
};

struct LoopDecisionInput {
  AuditBudget budget;
  std::uint32_t iterations_completed = 0;
  std::chrono::milliseconds elapsed{0};
  std::uint32_t external_calls_used = 0;
  // External calls one more investigate stage would cost.
  std::uint32_t external_calls_per_iteration = 0;
  std::uint32_t pages_captured = 0;
  std::vector<std::string> candidate_urls;
  double confidence = 0.0;
  // Set only when the signal was actually measured this audit.
  std::optional<double> visual_score;
  std::optional<double> graph_score;
};

struct LoopDecision {
  bool should_continue = false;
  LoopReason reason = LoopReason::kContinue;
  std::string explanation;
  std::vector<std::string> next_urls;
};

// Evaluates, in order:
// 1) iteration budget
// 2) elapsed budget
// 3) external-call budget (for one more iteration)
// 4) page budget
// 5) no candidate pages left
// 6) confidence threshold reached (unless visual and graph disagree early on)
// otherwise continue with up to `max_urls_per_iteration` candidates, never
// more than the remaining page budget.
//
// Contract:
// - true: decision is valid and `error` is empty.
// - false: config or input invalid; `error` explains why.
bool EvaluateLoopDecision(const LoopDecisionConfig& config, const LoopDecisionInput& input,
                          LoopDecision& decision, std::string& error);

} // namespace siteaudit::audit
