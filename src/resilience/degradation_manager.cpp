#include "resilience/degradation_manager.hpp"

#include "core/time_utils.hpp"

namespace siteaudit::resilience {

const char* ToString(const FallbackMode mode) {
  switch (mode) {
  case FallbackMode::kNone:
    return "none";
  case FallbackMode::kSimplified:
    return "simplified";
  case FallbackMode::kCached:
    return "cached";
  case FallbackMode::kPartial:
    return "partial";
  case FallbackMode::kAlternative:
    return "alternative";
  }
  return "none";
}

const char* ToString(const FailureKind kind) {
  switch (kind) {
  case FailureKind::kNone:
    return "none";
  case FailureKind::kCircuitOpen:
    return "circuit_open";
  case FailureKind::kTimeout:
    return "timeout";
  case FailureKind::kError:
    return "error";
  case FailureKind::kBudgetExhausted:
    return "budget_exhausted";
  }
  return "none";
}

DegradationManager::DegradationManager(BreakerRegistry& breakers,
                                       timing::TimeoutManager& timeouts,
                                       core::logging::Logger& logger,
                                       const std::chrono::milliseconds cancel_grace)
    : breakers_(breakers), timeouts_(timeouts), logger_(logger), cancel_grace_(cancel_grace) {}

std::optional<DegradationManager::FallbackEntry>
DegradationManager::FindFallback(std::string_view agent) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = fallbacks_.find(agent);
  if (it == fallbacks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void DegradationManager::LogDegradation(const DegradedResult& degraded) {
  std::string missing;
  for (const auto& field : degraded.missing_data) {
    if (!missing.empty()) {
      missing += ',';
    }
    missing += field;
  }
  logger_.Warn("stage degraded",
               {{"agent", degraded.agent},
                {"failure", ToString(degraded.failure)},
                {"fallback_mode", ToString(degraded.fallback_mode)},
                {"quality_penalty", core::FormatFixedDouble(degraded.quality_penalty, 2)},
                {"missing_data", missing},
                {"error", degraded.error}});
}

} // namespace siteaudit::resilience
