#include "audit/loop_decision.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace siteaudit::audit {

namespace {

bool ValidateConfig(const LoopDecisionConfig& config, std::string& error) {
  if (!std::isfinite(config.confidence_threshold) || config.confidence_threshold < 0.0 ||
      config.confidence_threshold > 1.0) {
    error = "confidence_threshold must be in [0,1]";
    return false;
  }
  if (!std::isfinite(config.conflict_gap) || config.conflict_gap < 0.0) {
    error = "conflict_gap must be a non-negative number";
    return false;
  }
  if (config.max_urls_per_iteration == 0U) {
    error = "max_urls_per_iteration must be greater than 0";
    return false;
  }
  return true;
}

bool ValidateInput(const LoopDecisionInput& input, std::string& error) {
  if (input.budget.max_iterations == 0U || input.budget.max_pages == 0U) {
    error = "loop budget must allow at least one iteration and one page";
    return false;
  }
  if (!std::isfinite(input.confidence) || input.confidence < 0.0 || input.confidence > 1.0) {
    error = "confidence must be in [0,1]";
    return false;
  }
  return true;
}

LoopDecision Stop(LoopReason reason, std::string explanation) {
  return LoopDecision{.should_continue = false, .reason = reason,
                      .explanation = std::move(explanation), .next_urls = {}};
}

} // namespace

const char* ToString(LoopReason reason) {
  switch (reason) {
  case LoopReason::kContinue:
    return "continue";
  case LoopReason::kMaxIterations:
    return "max_iterations";
  case LoopReason::kElapsedBudget:
    return "elapsed_budget";
  case LoopReason::kExternalCallBudget:
    return "external_call_budget";
  case LoopReason::kPageBudget:
    return "page_budget";
  case LoopReason::kNoCandidates:
    return "no_candidates";
  case LoopReason::kConfidenceReached:
    return "confidence_reached";
  }

  return "continue";
}

bool EvaluateLoopDecision(const LoopDecisionConfig& config, const LoopDecisionInput& input,
                          LoopDecision& decision, std::string& error) {
  decision = LoopDecision{};
  error.clear();

  if (!ValidateConfig(config, error) || !ValidateInput(input, error)) {
    return false;
  }

  const AuditBudget& budget = input.budget;
  if (input.iterations_completed >= budget.max_iterations) {
    decision = Stop(LoopReason::kMaxIterations,
                    "completed " + std::to_string(input.iterations_completed) + " of " +
                        std::to_string(budget.max_iterations) + " iterations");
    return true;
  }
  if (input.elapsed >= budget.max_elapsed) {
    decision = Stop(LoopReason::kElapsedBudget,
                    "elapsed " + core::FormatMillis(input.elapsed) + "ms of " +
                        core::FormatMillis(budget.max_elapsed) + "ms");
    return true;
  }
  if (input.external_calls_used + input.external_calls_per_iteration >
      budget.max_external_calls) {
    decision = Stop(LoopReason::kExternalCallBudget,
                    "used " + std::to_string(input.external_calls_used) + " of " +
                        std::to_string(budget.max_external_calls) +
                        " external calls; next iteration needs " +
                        std::to_string(input.external_calls_per_iteration));
    return true;
  }
  if (input.pages_captured >= budget.max_pages) {
    decision = Stop(LoopReason::kPageBudget,
                    "captured " + std::to_string(input.pages_captured) + " of " +
                        std::to_string(budget.max_pages) + " pages");
    return true;
  }
  if (input.candidate_urls.empty()) {
    decision = Stop(LoopReason::kNoCandidates, "no uninvestigated pages left");
    return true;
  }

  const bool conflicting = input.visual_score.has_value() && input.graph_score.has_value() &&
                           std::abs(*input.visual_score - *input.graph_score) > config.conflict_gap &&
                           input.iterations_completed < config.conflict_iteration_limit;
  if (input.confidence >= config.confidence_threshold && !conflicting) {
    decision = Stop(LoopReason::kConfidenceReached,
                    "confidence " + core::FormatFixedDouble(input.confidence, 2) +
                        " >= threshold " +
                        core::FormatFixedDouble(config.confidence_threshold, 2));
    return true;
  }

  const std::size_t page_room = budget.max_pages - input.pages_captured;
  const std::size_t take = std::min<std::size_t>(
      {static_cast<std::size_t>(config.max_urls_per_iteration), page_room,
       input.candidate_urls.size()});
  decision.should_continue = true;
  decision.reason = LoopReason::kContinue;
  decision.next_urls.assign(input.candidate_urls.begin(),
                            input.candidate_urls.begin() + static_cast<std::ptrdiff_t>(take));
  decision.explanation =
      conflicting ? "visual and graph signals disagree; investigating " +
                        std::to_string(take) + " more page(s)"
                  : "confidence " + core::FormatFixedDouble(input.confidence, 2) +
                        " below threshold; investigating " + std::to_string(take) +
                        " more page(s)";
  return true;
}

} // namespace siteaudit::audit
