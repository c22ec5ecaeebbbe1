#pragma once

#include "core/cancellation.hpp"
#include "core/deadline_runner.hpp"
#include "core/logging/logger.hpp"
#include "resilience/breaker_registry.hpp"
#include "resilience/quality_penalty.hpp"
#include "timing/timeout_manager.hpp"

#include <any>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::resilience {

enum class FallbackMode {
  kNone,
  kSimplified,
  kCached,
  kPartial,
  kAlternative,
};

enum class FailureKind {
  kNone,
  kCircuitOpen,
  kTimeout,
  kError,
  kBudgetExhausted,
};

const char* ToString(FallbackMode mode);
const char* ToString(FailureKind kind);

// Describes why a stage payload is a substitute rather than real agent output.
struct DegradedResult {
  std::string agent;
  std::vector<std::string> missing_data;
  double quality_penalty = kMinQualityPenalty;
  FallbackMode fallback_mode = FallbackMode::kSimplified;
  FailureKind failure = FailureKind::kError;
  std::string error;
};

// Result of one stage. `data` is always usable: real output on success,
// fallback output otherwise, in which case `degraded` is set.
template <typename T>
struct StageOutcome {
  T data{};
  std::optional<DegradedResult> degraded;
  std::chrono::milliseconds elapsed{0};

  bool IsDegraded() const {
    return degraded.has_value();
  }
};

template <typename T>
using StageOperation =
    std::function<bool(const core::CancelToken& cancel, T& result, std::string& error)>;

// Builds the substitute payload for a failed stage. Returning false (or
// throwing) drops to the neutral default payload with the maximum penalty.
template <typename T>
using FallbackProducer =
    std::function<bool(const DegradedResult& failure, T& data, std::string& error)>;

// Graceful degradation wrapper around every agent call.
//
// Execute() runs the operation inside the agent's circuit breaker, bounded by
// the given deadline and a cancel token. Any failure (short circuit, timeout,
// error, exception) turns into a registered fallback payload plus a
// DegradedResult. Elapsed time of every executed call is recorded in the
// TimeoutManager history for adaptive budgeting.
class DegradationManager {
public:
  DegradationManager(BreakerRegistry& breakers, timing::TimeoutManager& timeouts,
                     core::logging::Logger& logger, std::chrono::milliseconds cancel_grace);

  DegradationManager(const DegradationManager&) = delete;
  DegradationManager& operator=(const DegradationManager&) = delete;

  template <typename T>
  void RegisterFallback(std::string agent, FallbackMode mode, double penalty,
                        std::vector<std::string> missing_data, FallbackProducer<T> producer) {
    std::lock_guard<std::mutex> lock(mu_);
    fallbacks_[std::move(agent)] = FallbackEntry{
        .mode = mode,
        .penalty = ClampStagePenalty(penalty),
        .missing_data = std::move(missing_data),
        .producer = std::move(producer),
    };
  }

  template <typename T>
  StageOutcome<T> Execute(std::string_view agent, StageOperation<T> operation,
                          std::chrono::milliseconds deadline) {
    auto slot = std::make_shared<T>();
    core::DeadlineOutcome deadline_outcome;
    bool ran = false;

    CircuitBreaker& breaker = breakers_.Get(agent);
    const CallOutcome call = breaker.Call([&](std::string& error) {
      ran = true;
      return core::RunWithDeadline(
          [slot, operation](const core::CancelToken& cancel, std::string& op_error) {
            return operation(cancel, *slot, op_error);
          },
          deadline, cancel_grace_, deadline_outcome, error);
    });

    const std::chrono::milliseconds elapsed = ran ? deadline_outcome.elapsed
                                                  : std::chrono::milliseconds(0);
    if (ran) {
      timeouts_.RecordExecution(agent, elapsed,
                                call.disposition == CallDisposition::kSucceeded);
    }

    if (call.disposition == CallDisposition::kSucceeded) {
      StageOutcome<T> outcome;
      outcome.data = std::move(*slot);
      outcome.elapsed = elapsed;
      return outcome;
    }

    FailureKind kind = FailureKind::kError;
    if (call.disposition == CallDisposition::kShortCircuited) {
      kind = FailureKind::kCircuitOpen;
    } else if (deadline_outcome.status == core::DeadlineStatus::kTimedOut) {
      kind = FailureKind::kTimeout;
    }
    return BuildFallback<T>(agent, kind, call.error, elapsed);
  }

  // Fallback payload without running anything or touching the breaker. Used
  // when the audit budget no longer allows a stage to start.
  template <typename T>
  StageOutcome<T> Degrade(std::string_view agent, FailureKind kind, std::string reason) {
    return BuildFallback<T>(agent, kind, std::move(reason), std::chrono::milliseconds(0));
  }

private:
  struct FallbackEntry {
    FallbackMode mode = FallbackMode::kSimplified;
    double penalty = kMinQualityPenalty;
    std::vector<std::string> missing_data;
    std::any producer;
  };

  std::optional<FallbackEntry> FindFallback(std::string_view agent) const;
  void LogDegradation(const DegradedResult& degraded);

  template <typename T>
  StageOutcome<T> BuildFallback(std::string_view agent, FailureKind kind, std::string error,
                                std::chrono::milliseconds elapsed) {
    StageOutcome<T> outcome;
    outcome.elapsed = elapsed;

    DegradedResult degraded;
    degraded.agent = std::string(agent);
    degraded.failure = kind;
    degraded.error = std::move(error);

    bool produced = false;
    const std::optional<FallbackEntry> entry = FindFallback(agent);
    if (entry.has_value()) {
      degraded.fallback_mode = entry->mode;
      degraded.quality_penalty = entry->penalty;
      degraded.missing_data = entry->missing_data;

      const auto* producer = std::any_cast<FallbackProducer<T>>(&entry->producer);
      if (producer == nullptr) {
        logger_.Error("fallback producer registered with mismatched payload type",
                      {{"agent", agent}});
      } else {
        std::string producer_error;
        try {
          produced = (*producer)(degraded, outcome.data, producer_error);
        } catch (const std::exception& ex) {
          produced = false;
          producer_error = std::string("fallback threw: ") + ex.what();
        }
        if (!produced) {
          logger_.Warn("fallback producer failed, using neutral defaults",
                       {{"agent", agent}, {"error", producer_error}});
        }
      }
    }

    if (!produced) {
      outcome.data = T{};
      degraded.fallback_mode = FallbackMode::kPartial;
      degraded.quality_penalty = kMaxQualityPenalty;
      if (degraded.missing_data.empty()) {
        degraded.missing_data.push_back("all");
      }
    }

    degraded.quality_penalty = ClampStagePenalty(degraded.quality_penalty);
    LogDegradation(degraded);
    outcome.degraded = std::move(degraded);
    return outcome;
  }

  BreakerRegistry& breakers_;
  timing::TimeoutManager& timeouts_;
  core::logging::Logger& logger_;
  const std::chrono::milliseconds cancel_grace_;

  mutable std::mutex mu_;
  std::map<std::string, FallbackEntry, std::less<>> fallbacks_;
};

} // namespace siteaudit::resilience
