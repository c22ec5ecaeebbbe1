#include "core/logging/logger.hpp"
#include "core/testing/manual_clock.hpp"
#include "resilience/breaker_registry.hpp"
#include "resilience/degradation_manager.hpp"
#include "timing/timeout_manager.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;
using siteaudit::core::CancelToken;
using siteaudit::core::logging::LogLevel;
using siteaudit::core::logging::Logger;
using siteaudit::core::testing::ManualClock;
using siteaudit::resilience::BreakerConfig;
using siteaudit::resilience::BreakerRegistry;
using siteaudit::resilience::DegradationManager;
using siteaudit::resilience::DegradedResult;
using siteaudit::resilience::FailureKind;
using siteaudit::resilience::FallbackMode;
using siteaudit::resilience::StageOutcome;
using siteaudit::timing::TimeoutManager;

namespace {

struct Payload {
  double score = 0.5;
  std::string source = "neutral";
};

struct Fixture {
  std::ostringstream log;
  Logger logger{LogLevel::kWarn, log};
  ManualClock clock;
  BreakerRegistry breakers{clock, logger};
  TimeoutManager timeouts;
  DegradationManager manager{breakers, timeouts, logger, 100ms};

  void RegisterSimplified(double penalty) {
    manager.RegisterFallback<Payload>(
        "vision", FallbackMode::kSimplified, penalty, {"visual_score"},
        [](const DegradedResult&, Payload& data, std::string&) {
          data.score = 0.5;
          data.source = "fallback";
          return true;
        });
  }
};

bool FailingOperation(const CancelToken&, Payload&, std::string& error) {
  error = "model endpoint returned 500";
  return false;
}

} // namespace

TEST_CASE("Successful stage returns real data without degradation", "[resilience][degradation]") {
  Fixture fx;
  fx.RegisterSimplified(0.3);

  const StageOutcome<Payload> outcome = fx.manager.Execute<Payload>(
      "vision",
      [](const CancelToken&, Payload& result, std::string&) {
        result.score = 0.92;
        result.source = "agent";
        return true;
      },
      2s);

  REQUIRE_FALSE(outcome.IsDegraded());
  REQUIRE(outcome.data.source == "agent");
  REQUIRE(outcome.data.score == 0.92);
  REQUIRE(fx.timeouts.History("vision").size() == 1U);
}

TEST_CASE("Failed stage yields the registered fallback with bounded penalty",
          "[resilience][degradation]") {
  Fixture fx;
  fx.RegisterSimplified(0.3);

  const StageOutcome<Payload> outcome =
      fx.manager.Execute<Payload>("vision", FailingOperation, 2s);

  REQUIRE(outcome.IsDegraded());
  REQUIRE(outcome.data.source == "fallback");
  const DegradedResult& degraded = *outcome.degraded;
  REQUIRE(degraded.agent == "vision");
  REQUIRE(degraded.failure == FailureKind::kError);
  REQUIRE(degraded.fallback_mode == FallbackMode::kSimplified);
  REQUIRE(degraded.quality_penalty >= 0.2);
  REQUIRE(degraded.quality_penalty <= 0.7);
  REQUIRE(degraded.missing_data.size() == 1U);
  REQUIRE(degraded.error.find("500") != std::string::npos);
  REQUIRE(fx.timeouts.FailureCount("vision") == 1U);
}

TEST_CASE("Registered penalties are clamped to the stage bounds", "[resilience][degradation]") {
  Fixture low;
  low.RegisterSimplified(0.05);
  REQUIRE(low.manager.Execute<Payload>("vision", FailingOperation, 2s).degraded->quality_penalty ==
          0.2);

  Fixture high;
  high.RegisterSimplified(0.95);
  REQUIRE(
      high.manager.Execute<Payload>("vision", FailingOperation, 2s).degraded->quality_penalty ==
      0.7);
}

TEST_CASE("Stage past its deadline is cancelled and reported as timeout",
          "[resilience][degradation]") {
  Fixture fx;
  fx.RegisterSimplified(0.3);

  const StageOutcome<Payload> outcome = fx.manager.Execute<Payload>(
      "vision",
      [](const CancelToken& cancel, Payload&, std::string& error) {
        if (cancel.WaitFor(5s)) {
          error = "cancelled";
          return false;
        }
        return true;
      },
      50ms);

  REQUIRE(outcome.IsDegraded());
  REQUIRE(outcome.degraded->failure == FailureKind::kTimeout);
  REQUIRE(outcome.data.source == "fallback");
  REQUIRE(outcome.elapsed < 2s);
}

TEST_CASE("Open circuit short-circuits to the fallback without running the agent",
          "[resilience][degradation]") {
  Fixture fx;
  fx.RegisterSimplified(0.3);
  BreakerConfig config;
  config.failure_threshold = 1;
  config.base_backoff = 60s;
  fx.breakers.Configure("vision", config);

  REQUIRE(fx.manager.Execute<Payload>("vision", FailingOperation, 2s).IsDegraded());

  std::atomic<bool> ran{false};
  const StageOutcome<Payload> outcome = fx.manager.Execute<Payload>(
      "vision",
      [&ran](const CancelToken&, Payload&, std::string&) {
        ran = true;
        return true;
      },
      2s);

  REQUIRE_FALSE(ran.load());
  REQUIRE(outcome.degraded->failure == FailureKind::kCircuitOpen);
  REQUIRE(outcome.elapsed == 0ms);
  REQUIRE(fx.timeouts.History("vision").size() == 1U);
}

TEST_CASE("Missing or failing fallback producers fall back to neutral payloads",
          "[resilience][degradation]") {
  Fixture fx;
  const StageOutcome<Payload> unregistered =
      fx.manager.Execute<Payload>("graph", FailingOperation, 2s);
  REQUIRE(unregistered.data.source == "neutral");
  REQUIRE(unregistered.degraded->fallback_mode == FallbackMode::kPartial);
  REQUIRE(unregistered.degraded->quality_penalty == 0.7);
  REQUIRE(unregistered.degraded->missing_data.front() == "all");

  fx.manager.RegisterFallback<Payload>(
      "security", FallbackMode::kSimplified, 0.2, {"security_modules"},
      [](const DegradedResult&, Payload&, std::string&) -> bool {
        throw std::runtime_error("cache unavailable");
      });
  const StageOutcome<Payload> thrown =
      fx.manager.Execute<Payload>("security", FailingOperation, 2s);
  REQUIRE(thrown.data.source == "neutral");
  REQUIRE(thrown.degraded->quality_penalty == 0.7);
  REQUIRE(fx.log.str().find("fallback producer failed") != std::string::npos);
}

TEST_CASE("Degrade builds a fallback without touching the breaker", "[resilience][degradation]") {
  Fixture fx;
  fx.RegisterSimplified(0.3);

  const StageOutcome<Payload> outcome = fx.manager.Degrade<Payload>(
      "vision", FailureKind::kBudgetExhausted, "external call budget exhausted");

  REQUIRE(outcome.data.source == "fallback");
  REQUIRE(outcome.degraded->failure == FailureKind::kBudgetExhausted);
  REQUIRE(fx.breakers.Snapshots().empty());
  REQUIRE(fx.timeouts.History("vision").empty());
}
