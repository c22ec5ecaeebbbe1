#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace siteaudit::core {

namespace detail {

struct CancelState {
  std::mutex mu;
  std::condition_variable cv;
  bool cancelled = false;
};

} // namespace detail

// Read side of a per-stage cancellation flag. Copies share one state, so an
// agent running on an abandoned worker still observes the cancel request.
class CancelToken {
public:
  CancelToken() : state_(std::make_shared<detail::CancelState>()) {}

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->cancelled;
  }

  // Sleeps up to `timeout`. Returns true as soon as cancellation is observed.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(state_->mu);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
  }

private:
  friend class CancelSource;

  explicit CancelToken(std::shared_ptr<detail::CancelState> state) : state_(std::move(state)) {}

  std::shared_ptr<detail::CancelState> state_;
};

// Owning side. The orchestrator creates one source per stage invocation and
// cancels it when the stage deadline expires.
class CancelSource {
public:
  CancelSource() : state_(std::make_shared<detail::CancelState>()) {}

  CancelToken Token() const {
    return CancelToken(state_);
  }

  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->cancelled;
  }

private:
  std::shared_ptr<detail::CancelState> state_;
};

} // namespace siteaudit::core
