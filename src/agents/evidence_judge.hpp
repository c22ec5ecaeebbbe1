#pragma once

#include "agents/agent_contracts.hpp"
#include "scoring/trust_score_engine.hpp"

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace siteaudit::reputation {
class ReputationManager;
}

namespace siteaudit::core::logging {
class Logger;
}

namespace siteaudit::agents {

// Maximum follow-up pages proposed per iteration.
constexpr std::size_t kMaxCandidatesPerIteration = 2U;

// Path fragments worth a follow-up capture, most valuable first.
const std::vector<std::string>& PriorityPagePatterns();

// Turns gathered evidence into scoring sub-signals. Agents listed in
// `degraded_agents` still contribute their neutral payload, at reduced
// confidence. With a reputation manager, graph source claims below the
// source's confidence threshold are ignored and the rest are blended into the
// graph signal by consensus weight.
scoring::SignalInputs BuildSignals(const JudgeInput& input,
                                   reputation::ReputationManager* reputation);

scoring::HardStopConditions BuildHardStops(const JudgeInput& input);

// Discovered links not yet investigated or captured. Links matching a
// priority pattern come first in pattern order; the rest follow in discovery
// order.
std::vector<std::string> SelectCandidateUrls(const JudgeInput& input,
                                             std::size_t max_candidates = kMaxCandidatesPerIteration);

std::string ComposeNarrative(const JudgeInput& input, const scoring::TrustScoreResult& trust);

// Built-in judge: scores evidence with the TrustScoreEngine and records each
// graph source claim once per audit as a reputation prediction. One instance
// serves one audit.
class EvidenceJudge final : public IJudgeAgent {
public:
  EvidenceJudge(const scoring::TrustScoreEngine& engine,
                reputation::ReputationManager& reputation, core::logging::Logger& logger);

  bool Deliberate(const JudgeInput& input, const core::CancelToken& cancel,
                  JudgeVerdict& verdict, std::string& error) override;

private:
  std::vector<PredictionRef> RecordNewPredictions(const GraphResult& graph);

  const scoring::TrustScoreEngine& engine_;
  reputation::ReputationManager& reputation_;
  core::logging::Logger& logger_;
  std::mutex mu_;
  std::set<std::string> recorded_claims_;
};

} // namespace siteaudit::agents
