#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace siteaudit::core {

enum class DeadlineStatus {
  kCompleted,
  kTimedOut,
};

const char* ToString(DeadlineStatus status);

// Outcome details for one bounded execution.
struct DeadlineOutcome {
  DeadlineStatus status = DeadlineStatus::kCompleted;
  // True when the worker ignored cancellation past the grace period and was
  // left to finish on its own.
  bool abandoned = false;
  std::chrono::milliseconds elapsed{0};
};

using CancellableOperation = std::function<bool(const CancelToken& cancel, std::string& error)>;

// Runs `operation` on a worker thread and waits at most `deadline`.
//
// On expiry the token handed to the operation is cancelled and the caller
// waits up to `grace` for the worker to acknowledge. A worker still running
// after that is detached; it keeps its own copy of the operation and of the
// shared completion state, so callers must hand results back through
// shared ownership rather than stack references.
//
// Contract:
// - true: the operation finished before the deadline and reported success.
// - false: the operation failed (its own `error`) or timed out
//   (`outcome.status == kTimedOut`, `error` names the deadline).
bool RunWithDeadline(CancellableOperation operation, std::chrono::milliseconds deadline,
                     std::chrono::milliseconds grace, DeadlineOutcome& outcome,
                     std::string& error);

} // namespace siteaudit::core
