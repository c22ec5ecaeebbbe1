#pragma once

#include "core/clock.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace siteaudit::core::logging {
class Logger;
}

namespace siteaudit::resilience {

enum class BreakerState {
  kClosed,
  kOpen,
  kHalfOpen,
};

const char* ToString(BreakerState state);

struct BreakerConfig {
  std::uint32_t failure_threshold = 3;
  // Recovery delay for the first open cycle. Every reopen from HALF_OPEN
  // doubles it until `max_backoff`.
  std::chrono::milliseconds base_backoff{30'000};
  std::chrono::milliseconds max_backoff{600'000};
};

// Per-dependency defaults: vision 3/60s, graph 5/30s, security 3/45s,
// osint 5/90s, everything else 3/30s.
BreakerConfig DefaultBreakerConfigFor(std::string_view dependency);

bool ValidateBreakerConfig(const BreakerConfig& config, std::string& error);

enum class CallDisposition {
  kSucceeded,
  kFailed,
  kShortCircuited,
};

const char* ToString(CallDisposition disposition);

struct CallOutcome {
  CallDisposition disposition = CallDisposition::kSucceeded;
  // True when this call was the single HALF_OPEN trial.
  bool trial = false;
  std::string error;
};

// Failure-isolation state machine for one named dependency.
//
// Transitions: CLOSED -> OPEN -> HALF_OPEN -> {CLOSED | OPEN}.
// - CLOSED: operations run; `failure_threshold` consecutive failures open
//   the circuit and schedule recovery at now + base backoff.
// - OPEN: calls before the recovery time short-circuit to the fallback and
//   never run the operation.
// - HALF_OPEN: the first call at/after recovery time runs as the only trial.
//   Concurrent callers short-circuit while it is in flight. Trial success
//   closes the circuit and resets backoff; trial failure reopens it with the
//   backoff doubled (capped at `max_backoff`).
//
// Exceptions thrown by an operation are converted into failures.
class CircuitBreaker {
public:
  using Operation = std::function<bool(std::string& error)>;
  using Fallback = std::function<void(const CallOutcome& outcome)>;

  CircuitBreaker(std::string name, BreakerConfig config, const core::IClock& clock,
                 core::logging::Logger& logger);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  // Runs `operation` under breaker policy. `fallback` (optional) is invoked
  // once for every failed or short-circuited call, after state is updated.
  CallOutcome Call(const Operation& operation, const Fallback& fallback = {});

  void Reset();

  struct Snapshot {
    BreakerState state = BreakerState::kClosed;
    std::uint32_t consecutive_failures = 0;
    std::uint32_t open_cycles = 0;
    std::chrono::milliseconds current_backoff{0};
    bool trial_in_flight = false;
    std::uint64_t total_calls = 0;
    std::uint64_t total_failures = 0;
    std::uint64_t short_circuits = 0;
  };

  Snapshot GetSnapshot() const;
  BreakerState State() const;
  const std::string& name() const {
    return name_;
  }
  const BreakerConfig& config() const {
    return config_;
  }

private:
  enum class Admission {
    kRun,
    kRunTrial,
    kReject,
  };

  // `generation` identifies the admitted trial; Reset() invalidates it.
  Admission Admit(std::uint64_t& generation);
  bool IsCurrentTrialLocked(bool trial, std::uint64_t generation) const;
  void OnSuccess(bool trial, std::uint64_t generation);
  void OnFailure(bool trial, std::uint64_t generation, const std::string& error);
  void OpenLocked(std::chrono::milliseconds backoff);

  const std::string name_;
  const BreakerConfig config_;
  const core::IClock& clock_;
  core::logging::Logger& logger_;

  mutable std::mutex mu_;
  BreakerState state_ = BreakerState::kClosed;
  std::uint32_t consecutive_failures_ = 0;
  std::uint32_t open_cycles_ = 0;
  std::chrono::milliseconds current_backoff_{0};
  core::IClock::SteadyTimePoint recovery_at_{};
  core::IClock::SteadyTimePoint last_failure_at_{};
  bool trial_in_flight_ = false;
  std::uint64_t trial_generation_ = 0;
  std::uint64_t total_calls_ = 0;
  std::uint64_t total_failures_ = 0;
  std::uint64_t short_circuits_ = 0;
};

} // namespace siteaudit::resilience
