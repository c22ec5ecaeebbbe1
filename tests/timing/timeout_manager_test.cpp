#include "timing/complexity_analyzer.hpp"
#include "timing/timeout_manager.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using siteaudit::timing::ComplexityMetrics;
using siteaudit::timing::TimeoutManager;
using siteaudit::timing::TimeoutManagerConfig;
using siteaudit::timing::TimeoutStrategy;

namespace {

ComplexityMetrics SimplePage() {
  ComplexityMetrics metrics;
  metrics.dom_node_count = 200;
  metrics.script_count = 2;
  return metrics;
}

ComplexityMetrics HeavyPage() {
  ComplexityMetrics metrics;
  metrics.dom_node_count = 8000;
  metrics.script_count = 80;
  metrics.iframe_count = 6;
  metrics.form_count = 4;
  metrics.load_time_ms = 9'000;
  metrics.has_lazy_load = true;
  return metrics;
}

} // namespace

TEST_CASE("Fixed strategies return the tier table entry", "[timing][timeouts]") {
  const TimeoutManager manager;
  const ComplexityMetrics metrics = HeavyPage();

  REQUIRE(manager.DeadlineFor("vision", metrics, TimeoutStrategy::kFast) == 15s);
  REQUIRE(manager.DeadlineFor("vision", metrics, TimeoutStrategy::kStandard) == 30s);
  REQUIRE(manager.DeadlineFor("vision", metrics, TimeoutStrategy::kConservative) == 50s);
  REQUIRE(manager.DeadlineFor("graph", metrics, TimeoutStrategy::kFast) == 5s);
  REQUIRE(manager.DeadlineFor("security", metrics, TimeoutStrategy::kConservative) == 25s);
  REQUIRE(manager.DeadlineFor("unknown_agent", metrics, TimeoutStrategy::kFast) == 10s);
}

TEST_CASE("Adaptive strategy uses complexity tier until enough samples exist",
          "[timing][timeouts]") {
  TimeoutManager manager;

  REQUIRE(manager.DeadlineFor("scout", SimplePage(), TimeoutStrategy::kAdaptive) == 10s);
  REQUIRE(manager.DeadlineFor("scout", HeavyPage(), TimeoutStrategy::kAdaptive) == 35s);

  manager.RecordExecution("scout", 1'000ms, true);
  manager.RecordExecution("scout", 2'000ms, true);
  REQUIRE(manager.DeadlineFor("scout", SimplePage(), TimeoutStrategy::kAdaptive) == 10s);
}

TEST_CASE("Adaptive deadline is the history mean times 1.2", "[timing][timeouts]") {
  TimeoutManager manager;
  manager.RecordExecution("vision", 1'000ms, true);
  manager.RecordExecution("vision", 2'000ms, true);
  manager.RecordExecution("vision", 3'000ms, false);

  REQUIRE(manager.DeadlineFor("vision", HeavyPage(), TimeoutStrategy::kAdaptive) == 2'400ms);
  REQUIRE(manager.FailureCount("vision") == 1U);
}

TEST_CASE("Execution history keeps only the last ten entries", "[timing][timeouts]") {
  TimeoutManager manager;
  for (int i = 1; i <= 12; ++i) {
    manager.RecordExecution("graph", std::chrono::milliseconds(i * 100), true);
  }

  const std::vector<std::chrono::milliseconds> history = manager.History("graph");
  REQUIRE(history.size() == 10U);
  REQUIRE(history.front() == 300ms);
  REQUIRE(history.back() == 1'200ms);
  // mean(300..1200) = 750ms
  REQUIRE(manager.DeadlineFor("graph", SimplePage(), TimeoutStrategy::kAdaptive) == 900ms);
}

TEST_CASE("Min adaptive samples is configurable", "[timing][timeouts]") {
  TimeoutManagerConfig config;
  config.min_adaptive_samples = 1;
  TimeoutManager manager(config);
  manager.RecordExecution("judge", 500ms, true);

  REQUIRE(manager.DeadlineFor("judge", SimplePage(), TimeoutStrategy::kAdaptive) == 600ms);
}

TEST_CASE("Remaining estimate sums per-agent deadlines", "[timing][timeouts]") {
  const TimeoutManager manager;
  REQUIRE(manager.EstimateRemaining({"vision", "graph", "judge"}, SimplePage(),
                                    TimeoutStrategy::kStandard) == 50s);
}

TEST_CASE("Adaptive deadline never drops below the configured floor", "[timing][timeouts]") {
  TimeoutManager manager;
  for (int i = 0; i < 3; ++i) {
    manager.RecordExecution("graph", 0ms, true);
  }
  REQUIRE(manager.DeadlineFor("graph", SimplePage(), TimeoutStrategy::kAdaptive) == 500ms);

  TimeoutManager strict(TimeoutManagerConfig{.min_adaptive_samples = 1,
                                             .min_adaptive_deadline = 2'000ms});
  strict.RecordExecution("judge", 1ms, true);
  REQUIRE(strict.DeadlineFor("judge", SimplePage(), TimeoutStrategy::kAdaptive) == 2'000ms);
  REQUIRE(strict.EstimateRemaining({"judge"}, SimplePage(), TimeoutStrategy::kAdaptive) ==
          2'000ms);
}
