#include "timing/timeout_manager.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>
#include <utility>

namespace siteaudit::timing {

namespace {

struct TierRow {
  std::string_view agent;
  int fast_s;
  int standard_s;
  int conservative_s;
};

constexpr std::array<TierRow, 6> kTierTable{{
    {"scout", 10, 20, 35},
    {"vision", 15, 30, 50},
    {"security", 8, 15, 25},
    {"graph", 5, 10, 15},
    {"judge", 5, 10, 15},
    {"osint", 15, 25, 40},
}};

} // namespace

TimeoutManager::TimeoutManager(TimeoutManagerConfig config) : config_(std::move(config)) {}

std::chrono::milliseconds TimeoutManager::TierDeadline(std::string_view agent,
                                                       const TimeoutStrategy tier) const {
  for (const auto& row : kTierTable) {
    if (row.agent != agent) {
      continue;
    }
    switch (tier) {
    case TimeoutStrategy::kFast:
      return std::chrono::seconds(row.fast_s);
    case TimeoutStrategy::kStandard:
    case TimeoutStrategy::kAdaptive:
      return std::chrono::seconds(row.standard_s);
    case TimeoutStrategy::kConservative:
      return std::chrono::seconds(row.conservative_s);
    }
  }
  return config_.unknown_agent_deadline;
}

std::chrono::milliseconds TimeoutManager::DeadlineFor(std::string_view agent,
                                                      const ComplexityMetrics& metrics,
                                                      const TimeoutStrategy strategy) const {
  std::lock_guard<std::mutex> lock(mu_);
  return DeadlineForLocked(agent, metrics, strategy);
}

std::chrono::milliseconds TimeoutManager::DeadlineForLocked(std::string_view agent,
                                                            const ComplexityMetrics& metrics,
                                                            const TimeoutStrategy strategy) const {
  if (strategy != TimeoutStrategy::kAdaptive) {
    return TierDeadline(agent, strategy);
  }

  const auto it = history_.find(agent);
  if (it != history_.end() && !it->second.durations.empty() &&
      it->second.durations.size() >= config_.min_adaptive_samples) {
    const auto& durations = it->second.durations;
    const double total = std::accumulate(
        durations.begin(), durations.end(), 0.0,
        [](double acc, std::chrono::milliseconds d) { return acc + static_cast<double>(d.count()); });
    const double mean = total / static_cast<double>(durations.size());
    const std::chrono::milliseconds learned(
        static_cast<std::chrono::milliseconds::rep>(std::llround(mean * kAdaptiveSafetyFactor)));
    return std::max(learned, config_.min_adaptive_deadline);
  }

  return TierDeadline(agent, SuggestStrategy(metrics.CompositeScore()));
}

void TimeoutManager::RecordExecution(std::string_view agent,
                                     const std::chrono::milliseconds duration,
                                     const bool success) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = history_.find(agent);
  if (it == history_.end()) {
    it = history_.emplace(std::string(agent), AgentHistory{}).first;
  }
  AgentHistory& entry = it->second;
  entry.durations.push_back(duration.count() < 0 ? std::chrono::milliseconds(0) : duration);
  while (entry.durations.size() > kExecutionHistoryCapacity) {
    entry.durations.pop_front();
  }
  if (!success) {
    ++entry.failures;
  }
}

std::chrono::milliseconds
TimeoutManager::EstimateRemaining(const std::vector<std::string>& pending_agents,
                                  const ComplexityMetrics& metrics,
                                  const TimeoutStrategy strategy) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::chrono::milliseconds total{0};
  for (const auto& agent : pending_agents) {
    total += DeadlineForLocked(agent, metrics, strategy);
  }
  return total;
}

std::vector<std::chrono::milliseconds> TimeoutManager::History(std::string_view agent) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = history_.find(agent);
  if (it == history_.end()) {
    return {};
  }
  return {it->second.durations.begin(), it->second.durations.end()};
}

std::size_t TimeoutManager::FailureCount(std::string_view agent) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = history_.find(agent);
  return it == history_.end() ? 0U : it->second.failures;
}

} // namespace siteaudit::timing
