#include "core/deadline_runner.hpp"

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

namespace siteaudit::core {

namespace {

struct Completion {
  std::mutex mu;
  std::condition_variable cv;
  bool done = false;
  bool ok = false;
  std::string error;
};

} // namespace

const char* ToString(DeadlineStatus status) {
  switch (status) {
  case DeadlineStatus::kCompleted:
    return "completed";
  case DeadlineStatus::kTimedOut:
    return "timed_out";
  }
  return "completed";
}

bool RunWithDeadline(CancellableOperation operation, const std::chrono::milliseconds deadline,
                     const std::chrono::milliseconds grace, DeadlineOutcome& outcome,
                     std::string& error) {
  outcome = DeadlineOutcome{};
  error.clear();

  if (!operation) {
    error = "operation is empty";
    return false;
  }

  const auto started = std::chrono::steady_clock::now();
  auto completion = std::make_shared<Completion>();
  CancelSource cancel_source;
  const CancelToken token = cancel_source.Token();

  std::thread worker([completion, token, op = std::move(operation)]() {
    bool ok = false;
    std::string op_error;
    try {
      ok = op(token, op_error);
    } catch (const std::exception& ex) {
      ok = false;
      op_error = std::string("operation threw: ") + ex.what();
    } catch (...) {
      ok = false;
      op_error = "operation threw a non-standard exception";
    }
    {
      std::lock_guard<std::mutex> lock(completion->mu);
      completion->done = true;
      completion->ok = ok;
      completion->error = std::move(op_error);
    }
    completion->cv.notify_all();
  });
  worker.detach();

  const auto elapsed_since_start = [started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
  };

  std::unique_lock<std::mutex> lock(completion->mu);
  const auto effective_deadline = deadline.count() > 0 ? deadline : std::chrono::milliseconds(0);
  if (completion->cv.wait_for(lock, effective_deadline, [&] { return completion->done; })) {
    outcome.status = DeadlineStatus::kCompleted;
    outcome.elapsed = elapsed_since_start();
    if (!completion->ok) {
      error = completion->error.empty() ? "operation failed" : completion->error;
      return false;
    }
    return true;
  }

  // Deadline expired. Cancellation is always requested, and a late
  // completion inside the grace window still counts as a timeout.
  lock.unlock();
  cancel_source.Cancel();
  lock.lock();
  const bool stopped = completion->cv.wait_for(lock, grace, [&] { return completion->done; });

  outcome.status = DeadlineStatus::kTimedOut;
  outcome.abandoned = !stopped;
  outcome.elapsed = elapsed_since_start();
  error = "deadline of " + std::to_string(deadline.count()) + "ms exceeded";
  if (outcome.abandoned) {
    error += " (worker abandoned after " + std::to_string(grace.count()) + "ms grace)";
  }
  return false;
}

} // namespace siteaudit::core
