#pragma once

#include "agents/agent_contracts.hpp"
#include "agents/evidence.hpp"
#include "audit/audit_config.hpp"
#include "resilience/degradation_manager.hpp"
#include "scoring/trust_score_result.hpp"
#include "timing/complexity_analyzer.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace siteaudit::audit {

enum class PipelineState {
  kScout,
  kInvestigate,
  kJudge,
  kLoop,
  kDone,
  kError,
};

const char* ToString(PipelineState state);

struct DegradationRecord {
  std::uint32_t iteration = 0;
  std::string stage;
  resilience::DegradedResult result;
};

// Everything one audit run has gathered. Owned by a single orchestrator run.
struct AuditState {
  std::string audit_id;
  std::string url;
  std::string site_type;
  AuditTier tier = AuditTier::kStandardAudit;
  agents::VerdictMode verdict_mode = agents::VerdictMode::kExpert;
  AuditBudget budget;
  PipelineState state = PipelineState::kScout;
  // Iterations started so far (1 during the first pass).
  std::uint32_t iteration = 0;

  std::vector<agents::PageCapture> pages;
  std::vector<std::string> entities;
  std::map<std::string, std::string> metadata;
  std::string site_type_hint;

  // Merged evidence. `*_measured` is false while only fallback payloads exist.
  agents::VisionResult vision;
  bool vision_measured = false;
  agents::GraphResult graph;
  bool graph_measured = false;
  std::optional<agents::SecurityResult> security;
  bool security_measured = false;

  std::vector<DegradationRecord> degradations;
  double quality_penalty = 0.0;
  std::vector<timing::ComplexityMetrics> complexity_history;

  std::optional<scoring::TrustScoreResult> trust;
  std::string narrative;
  std::vector<agents::PredictionRef> predictions;

  std::vector<std::string> investigated_urls;
  std::vector<std::string> pending_urls;
  std::uint32_t external_calls_used = 0;
  std::string loop_reason;
  std::vector<std::string> errors;
  std::chrono::milliseconds elapsed{0};

  // Unique agent names with at least one degradation, in first-seen order.
  std::vector<std::string> DegradedAgents() const;

  std::string ToJson() const;
};

// Folds a later vision pass into earlier evidence: scores are averaged by
// screenshots analysed, findings and badge counts accumulate.
agents::VisionResult MergeVisionResults(const agents::VisionResult& prior,
                                        const agents::VisionResult& next);

} // namespace siteaudit::audit
