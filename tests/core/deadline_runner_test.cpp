#include "core/deadline_runner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using siteaudit::core::CancelToken;
using siteaudit::core::DeadlineOutcome;
using siteaudit::core::DeadlineStatus;
using siteaudit::core::RunWithDeadline;

TEST_CASE("Operation finishing in time reports its own result", "[core][deadline]") {
  DeadlineOutcome outcome;
  std::string error;

  REQUIRE(RunWithDeadline([](const CancelToken&, std::string&) { return true; }, 1s, 100ms,
                          outcome, error));
  REQUIRE(outcome.status == DeadlineStatus::kCompleted);
  REQUIRE_FALSE(outcome.abandoned);

  REQUIRE_FALSE(RunWithDeadline(
      [](const CancelToken&, std::string& op_error) {
        op_error = "dns lookup failed";
        return false;
      },
      1s, 100ms, outcome, error));
  REQUIRE(outcome.status == DeadlineStatus::kCompleted);
  REQUIRE(error == "dns lookup failed");
}

TEST_CASE("Cooperative operation observes cancellation at the deadline", "[core][deadline]") {
  auto observed = std::make_shared<std::atomic<bool>>(false);
  DeadlineOutcome outcome;
  std::string error;

  REQUIRE_FALSE(RunWithDeadline(
      [observed](const CancelToken& cancel, std::string&) {
        if (cancel.WaitFor(10s)) {
          observed->store(true);
          return false;
        }
        return true;
      },
      30ms, 1s, outcome, error));

  REQUIRE(outcome.status == DeadlineStatus::kTimedOut);
  REQUIRE_FALSE(outcome.abandoned);
  REQUIRE(observed->load());
  REQUIRE(error.find("deadline of 30ms exceeded") != std::string::npos);
}

TEST_CASE("Operation ignoring cancellation is abandoned after the grace period",
          "[core][deadline]") {
  DeadlineOutcome outcome;
  std::string error;

  REQUIRE_FALSE(RunWithDeadline(
      [](const CancelToken&, std::string&) {
        std::this_thread::sleep_for(300ms);
        return true;
      },
      20ms, 20ms, outcome, error));

  REQUIRE(outcome.status == DeadlineStatus::kTimedOut);
  REQUIRE(outcome.abandoned);
  REQUIRE(outcome.elapsed < 300ms);
  REQUIRE(error.find("abandoned") != std::string::npos);
}

TEST_CASE("Exceptions are reported as operation errors", "[core][deadline]") {
  DeadlineOutcome outcome;
  std::string error;

  REQUIRE_FALSE(RunWithDeadline(
      [](const CancelToken&, std::string&) -> bool { throw std::runtime_error("tls handshake"); },
      1s, 100ms, outcome, error));
  REQUIRE(outcome.status == DeadlineStatus::kCompleted);
  REQUIRE(error.find("tls handshake") != std::string::npos);
}
