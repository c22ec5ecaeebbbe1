#include "resilience/circuit_breaker.hpp"

#include "core/logging/logger.hpp"

#include <algorithm>
#include <exception>

namespace siteaudit::resilience {

const char* ToString(const BreakerState state) {
  switch (state) {
  case BreakerState::kClosed:
    return "closed";
  case BreakerState::kOpen:
    return "open";
  case BreakerState::kHalfOpen:
    return "half_open";
  }
  return "closed";
}

const char* ToString(const CallDisposition disposition) {
  switch (disposition) {
  case CallDisposition::kSucceeded:
    return "succeeded";
  case CallDisposition::kFailed:
    return "failed";
  case CallDisposition::kShortCircuited:
    return "short_circuited";
  }
  return "succeeded";
}

BreakerConfig DefaultBreakerConfigFor(std::string_view dependency) {
  using std::chrono::seconds;
  BreakerConfig config;
  if (dependency == "vision") {
    config.failure_threshold = 3;
    config.base_backoff = seconds(60);
  } else if (dependency == "graph") {
    config.failure_threshold = 5;
    config.base_backoff = seconds(30);
  } else if (dependency == "security") {
    config.failure_threshold = 3;
    config.base_backoff = seconds(45);
  } else if (dependency == "osint") {
    config.failure_threshold = 5;
    config.base_backoff = seconds(90);
  }
  return config;
}

bool ValidateBreakerConfig(const BreakerConfig& config, std::string& error) {
  if (config.failure_threshold == 0U) {
    error = "failure_threshold must be greater than 0";
    return false;
  }
  if (config.base_backoff.count() <= 0) {
    error = "base_backoff must be greater than 0";
    return false;
  }
  if (config.max_backoff < config.base_backoff) {
    error = "max_backoff must be >= base_backoff";
    return false;
  }
  return true;
}

CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig config, const core::IClock& clock,
                               core::logging::Logger& logger)
    : name_(std::move(name)), config_(config), clock_(clock), logger_(logger),
      current_backoff_(config.base_backoff) {}

CallOutcome CircuitBreaker::Call(const Operation& operation, const Fallback& fallback) {
  CallOutcome outcome;
  std::uint64_t generation = 0;
  const Admission admission = Admit(generation);
  if (admission == Admission::kReject) {
    outcome.disposition = CallDisposition::kShortCircuited;
    outcome.error = "circuit '" + name_ + "' is open";
    if (fallback) {
      fallback(outcome);
    }
    return outcome;
  }

  outcome.trial = admission == Admission::kRunTrial;
  bool ok = false;
  std::string error;
  try {
    ok = operation ? operation(error) : false;
    if (!operation) {
      error = "operation is empty";
    }
  } catch (const std::exception& ex) {
    ok = false;
    error = std::string("operation threw: ") + ex.what();
  } catch (...) {
    ok = false;
    error = "operation threw a non-standard exception";
  }

  if (ok) {
    OnSuccess(outcome.trial, generation);
    outcome.disposition = CallDisposition::kSucceeded;
    return outcome;
  }

  if (error.empty()) {
    error = "operation failed";
  }
  OnFailure(outcome.trial, generation, error);
  outcome.disposition = CallDisposition::kFailed;
  outcome.error = std::move(error);
  if (fallback) {
    fallback(outcome);
  }
  return outcome;
}

CircuitBreaker::Admission CircuitBreaker::Admit(std::uint64_t& generation) {
  std::lock_guard<std::mutex> lock(mu_);
  ++total_calls_;

  switch (state_) {
  case BreakerState::kClosed:
    return Admission::kRun;
  case BreakerState::kOpen:
    if (clock_.NowSteady() < recovery_at_) {
      ++short_circuits_;
      return Admission::kReject;
    }
    state_ = BreakerState::kHalfOpen;
    trial_in_flight_ = true;
    generation = ++trial_generation_;
    logger_.Info("circuit half-open, admitting trial call",
                 {{"breaker", name_}, {"open_cycles", std::to_string(open_cycles_)}});
    return Admission::kRunTrial;
  case BreakerState::kHalfOpen:
    // Only one trial may run. A HALF_OPEN breaker always has its trial in
    // flight because the trial result moves it out of HALF_OPEN.
    ++short_circuits_;
    return Admission::kReject;
  }

  return Admission::kReject;
}

bool CircuitBreaker::IsCurrentTrialLocked(const bool trial, const std::uint64_t generation) const {
  return trial && trial_in_flight_ && state_ == BreakerState::kHalfOpen &&
         generation == trial_generation_;
}

void CircuitBreaker::OnSuccess(const bool trial, const std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mu_);
  if (trial && !IsCurrentTrialLocked(trial, generation)) {
    logger_.Debug("discarding stale trial success", {{"breaker", name_}});
    return;
  }
  if (trial) {
    trial_in_flight_ = false;
    state_ = BreakerState::kClosed;
    consecutive_failures_ = 0;
    open_cycles_ = 0;
    current_backoff_ = config_.base_backoff;
    logger_.Info("circuit closed after successful trial", {{"breaker", name_}});
    return;
  }

  // A late success from a call admitted before the circuit opened does not
  // close an OPEN circuit.
  if (state_ == BreakerState::kClosed) {
    consecutive_failures_ = 0;
  }
}

void CircuitBreaker::OnFailure(const bool trial, const std::uint64_t generation,
                               const std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  ++total_failures_;
  last_failure_at_ = clock_.NowSteady();

  // A trial that outlived a manual reset no longer owns the breaker state.
  if (trial && !IsCurrentTrialLocked(trial, generation)) {
    logger_.Debug("discarding stale trial failure", {{"breaker", name_}, {"error", error}});
    return;
  }
  if (trial) {
    trial_in_flight_ = false;
    ++open_cycles_;
    const auto doubled = current_backoff_ * 2;
    OpenLocked(std::min(doubled, config_.max_backoff));
    logger_.Warn("circuit trial failed, reopening",
                 {{"breaker", name_},
                  {"backoff_ms", std::to_string(current_backoff_.count())},
                  {"open_cycles", std::to_string(open_cycles_)},
                  {"error", error}});
    return;
  }

  ++consecutive_failures_;
  if (state_ != BreakerState::kClosed) {
    return;
  }

  logger_.Debug("circuit recorded failure",
                {{"breaker", name_},
                 {"consecutive_failures", std::to_string(consecutive_failures_)},
                 {"error", error}});
  if (consecutive_failures_ >= config_.failure_threshold) {
    open_cycles_ = 1;
    OpenLocked(config_.base_backoff);
    logger_.Warn("circuit opened",
                 {{"breaker", name_},
                  {"consecutive_failures", std::to_string(consecutive_failures_)},
                  {"backoff_ms", std::to_string(current_backoff_.count())}});
  }
}

void CircuitBreaker::OpenLocked(const std::chrono::milliseconds backoff) {
  state_ = BreakerState::kOpen;
  current_backoff_ = backoff;
  recovery_at_ = clock_.NowSteady() + backoff;
}

void CircuitBreaker::Reset() {
  std::lock_guard<std::mutex> lock(mu_);
  state_ = BreakerState::kClosed;
  consecutive_failures_ = 0;
  open_cycles_ = 0;
  current_backoff_ = config_.base_backoff;
  recovery_at_ = {};
  trial_in_flight_ = false;
  ++trial_generation_;
  logger_.Info("circuit manually reset", {{"breaker", name_}});
}

CircuitBreaker::Snapshot CircuitBreaker::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .state = state_,
      .consecutive_failures = consecutive_failures_,
      .open_cycles = open_cycles_,
      .current_backoff = current_backoff_,
      .trial_in_flight = trial_in_flight_,
      .total_calls = total_calls_,
      .total_failures = total_failures_,
      .short_circuits = short_circuits_,
  };
}

BreakerState CircuitBreaker::State() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

} // namespace siteaudit::resilience
