#pragma once

#include "timing/complexity_analyzer.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::timing {

constexpr std::size_t kExecutionHistoryCapacity = 10U;
constexpr double kAdaptiveSafetyFactor = 1.2;

struct TimeoutManagerConfig {
  // ADAPTIVE falls back to the complexity tier until an agent has this many
  // recorded executions.
  std::size_t min_adaptive_samples = 3;
  // Lower bound for ADAPTIVE deadlines. Agents that finish in under a
  // millisecond would otherwise learn a zero deadline.
  std::chrono::milliseconds min_adaptive_deadline{500};
  std::chrono::milliseconds unknown_agent_deadline{10'000};
};

// Per-agent deadline budgeting.
//
// FAST/STANDARD/CONSERVATIVE return the fixed table entry for that tier.
// ADAPTIVE returns mean(history) x 1.2, floored at `min_adaptive_deadline`,
// once enough samples exist, otherwise the tier suggested by the complexity
// score. Thread-safe; one instance is
// shared by all audits in the process.
class TimeoutManager {
public:
  explicit TimeoutManager(TimeoutManagerConfig config = {});

  std::chrono::milliseconds DeadlineFor(std::string_view agent, const ComplexityMetrics& metrics,
                                        TimeoutStrategy strategy) const;

  // Appends one finished execution, success or failure. The history is a
  // bounded FIFO of 10 per agent.
  void RecordExecution(std::string_view agent, std::chrono::milliseconds duration, bool success);

  std::chrono::milliseconds EstimateRemaining(const std::vector<std::string>& pending_agents,
                                              const ComplexityMetrics& metrics,
                                              TimeoutStrategy strategy) const;

  std::vector<std::chrono::milliseconds> History(std::string_view agent) const;
  // Failed executions recorded for `agent` since process start.
  std::size_t FailureCount(std::string_view agent) const;

  // Fixed table lookup. Unknown agents get `unknown_agent_deadline`.
  std::chrono::milliseconds TierDeadline(std::string_view agent, TimeoutStrategy tier) const;

  const TimeoutManagerConfig& config() const {
    return config_;
  }

private:
  struct AgentHistory {
    std::deque<std::chrono::milliseconds> durations;
    std::size_t failures = 0;
  };

  std::chrono::milliseconds DeadlineForLocked(std::string_view agent,
                                              const ComplexityMetrics& metrics,
                                              TimeoutStrategy strategy) const;

  const TimeoutManagerConfig config_;
  mutable std::mutex mu_;
  std::map<std::string, AgentHistory, std::less<>> history_;
};

} // namespace siteaudit::timing
