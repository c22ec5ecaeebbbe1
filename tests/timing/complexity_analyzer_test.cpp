#include "agents/evidence.hpp"
#include "timing/complexity_analyzer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using siteaudit::agents::PageCapture;
using siteaudit::agents::ScoutResult;
using siteaudit::agents::SecurityResult;
using siteaudit::agents::VisionResult;
using siteaudit::timing::ComplexityAnalyzer;
using siteaudit::timing::ComplexityMetrics;
using siteaudit::timing::SuggestStrategy;
using siteaudit::timing::TimeoutStrategy;

TEST_CASE("Empty evidence yields zero complexity", "[timing][complexity]") {
  const ComplexityAnalyzer analyzer;
  const ComplexityMetrics metrics = analyzer.Analyze("https://a.example/", nullptr, nullptr);

  REQUIRE(metrics.url == "https://a.example/");
  REQUIRE(metrics.CompositeScore() == 0.0);
  REQUIRE(SuggestStrategy(metrics.CompositeScore()) == TimeoutStrategy::kFast);
}

TEST_CASE("Saturated page reaches the maximum composite score", "[timing][complexity]") {
  ComplexityMetrics metrics;
  metrics.dom_node_count = 10'000;
  metrics.script_count = 100;
  metrics.iframe_count = 10;
  metrics.form_count = 20;
  metrics.redirect_hops = 10;
  metrics.external_resource_count = 500;
  metrics.load_time_ms = 30'000;
  metrics.has_lazy_load = true;
  metrics.screenshot_count = 40;
  metrics.has_countdown_or_animation = true;

  REQUIRE(metrics.CompositeScore() > 0.999);
  REQUIRE(metrics.StructuralScore() > 0.999);
  REQUIRE(metrics.NetworkScore() > 0.999);
  REQUIRE(metrics.DynamicScore() > 0.999);
  REQUIRE(SuggestStrategy(metrics.CompositeScore()) == TimeoutStrategy::kConservative);
}

TEST_CASE("Scout pages contribute the most complex values", "[timing][complexity]") {
  PageCapture light;
  light.dom_node_count = 100;
  light.script_count = 40;
  light.screenshot_paths = {"a.png"};

  PageCapture heavy;
  heavy.dom_node_count = 4'000;
  heavy.script_count = 5;
  heavy.has_lazy_load = true;
  heavy.has_countdown_timer = true;
  heavy.screenshot_paths = {"b.png", "c.png"};

  ScoutResult scout;
  scout.site_type_hint = "ecommerce";
  scout.pages = {light, heavy};

  const ComplexityAnalyzer analyzer;
  const ComplexityMetrics metrics = analyzer.Analyze("https://shop.example/", &scout, nullptr);
  REQUIRE(metrics.site_type == "ecommerce");
  REQUIRE(metrics.dom_node_count == 4'000U);
  REQUIRE(metrics.script_count == 40U);
  REQUIRE(metrics.screenshot_count == 3U);
  REQUIRE(metrics.has_lazy_load);
  REQUIRE(metrics.has_countdown_or_animation);
  REQUIRE(metrics.CompositeScore() > 0.3);
}

TEST_CASE("Vision findings raise dynamic complexity", "[timing][complexity]") {
  VisionResult vision;
  vision.screenshots_analyzed = 10;
  vision.fake_timer_detected = true;

  const ComplexityAnalyzer analyzer;
  const ComplexityMetrics metrics = analyzer.Analyze("https://x.example/", nullptr, &vision);
  REQUIRE(metrics.screenshot_count == 10U);
  REQUIRE(metrics.has_countdown_or_animation);
  REQUIRE(metrics.DynamicScore() > 0.0);
}

TEST_CASE("Security scan counts fill in for thin scout evidence", "[timing][complexity]") {
  const ComplexityAnalyzer analyzer;
  ScoutResult scout;
  PageCapture page;
  page.script_count = 4;
  page.iframe_count = 3;
  scout.pages.push_back(page);

  SecurityResult security;
  security.scripts_inspected = 40;
  security.iframes_inspected = 1;

  const ComplexityMetrics without = analyzer.Analyze("https://s.example/", &scout, nullptr);
  const ComplexityMetrics with =
      analyzer.Analyze("https://s.example/", &scout, nullptr, &security);
  REQUIRE(with.script_count == 40U);
  REQUIRE(with.iframe_count == 3U);
  REQUIRE(with.StructuralScore() > without.StructuralScore());

  const ComplexityMetrics security_only =
      analyzer.Analyze("https://s.example/", nullptr, nullptr, &security);
  REQUIRE(security_only.script_count == 40U);
  REQUIRE(security_only.CompositeScore() > 0.0);
}

TEST_CASE("Strategy tiers split at 0.30 and 0.60", "[timing][complexity]") {
  REQUIRE(SuggestStrategy(0.29) == TimeoutStrategy::kFast);
  REQUIRE(SuggestStrategy(0.30) == TimeoutStrategy::kStandard);
  REQUIRE(SuggestStrategy(0.59) == TimeoutStrategy::kStandard);
  REQUIRE(SuggestStrategy(0.60) == TimeoutStrategy::kConservative);
}
