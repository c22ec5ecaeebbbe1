#include "agents/vision_response_parser.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>
#include <vector>

using siteaudit::agents::BuildVisionResult;
using siteaudit::agents::Detected;
using siteaudit::agents::NotDetected;
using siteaudit::agents::ParseVisionResponse;
using siteaudit::agents::ScreenshotResponse;
using siteaudit::agents::Unparseable;
using siteaudit::agents::VisionResponse;
using siteaudit::agents::VisionResult;

TEST_CASE("Object with findings array parses as detected", "[agents][vision]") {
  const VisionResponse parsed = ParseVisionResponse(
      R"({"detected": true, "badges_total": 3, "badges_unverifiable": 2,
          "findings": [{"pattern": "fake_countdown_timer", "category": "false_urgency",
                        "severity": "high", "confidence": 0.9}]})");

  const auto* detected = std::get_if<Detected>(&parsed);
  REQUIRE(detected != nullptr);
  REQUIRE(detected->findings.size() == 1U);
  REQUIRE(detected->findings[0].pattern_id == "fake_countdown_timer");
  REQUIRE(detected->findings[0].severity == Catch::Approx(0.85));
  REQUIRE(detected->findings[0].confidence == Catch::Approx(0.9));
  REQUIRE(detected->badge_count == 3U);
  REQUIRE(detected->unverifiable_badge_count == 2U);
}

TEST_CASE("Markdown fences and surrounding prose are stripped", "[agents][vision]") {
  const std::string fenced =
      "Here is my analysis:\n```json\n[{\"pattern\": \"confirmshaming\", "
      "\"severity\": 0.4}]\n```\nLet me know if you need more.";
  const VisionResponse parsed = ParseVisionResponse(fenced);
  const auto* detected = std::get_if<Detected>(&parsed);
  REQUIRE(detected != nullptr);
  REQUIRE(detected->findings[0].pattern_id == "confirmshaming");
  REQUIRE(detected->findings[0].confidence == Catch::Approx(0.7));

  const VisionResponse prose =
      ParseVisionResponse("The page shows {\"pattern\": \"hidden_costs\", \"severity\": \"medium\"} "
                          "near the checkout button.");
  REQUIRE(std::holds_alternative<Detected>(prose));
}

TEST_CASE("Critical severity marks the finding critical", "[agents][vision]") {
  const VisionResponse parsed =
      ParseVisionResponse(R"({"pattern": "credential_harvest_form", "severity": "critical"})");
  const auto* detected = std::get_if<Detected>(&parsed);
  REQUIRE(detected != nullptr);
  REQUIRE(detected->findings[0].critical);
  REQUIRE(detected->findings[0].severity == Catch::Approx(1.0));
}

TEST_CASE("Explicit negatives parse as not detected", "[agents][vision]") {
  REQUIRE(std::holds_alternative<NotDetected>(ParseVisionResponse("[]")));
  REQUIRE(std::holds_alternative<NotDetected>(
      ParseVisionResponse(R"({"detected": false, "badges_total": 1})")));
  REQUIRE(std::holds_alternative<NotDetected>(
      ParseVisionResponse("I found no dark patterns on this page.")));

  const VisionResponse with_badges = ParseVisionResponse(R"({"detected": false, "badges_total": 4})");
  REQUIRE(std::get<NotDetected>(with_badges).badge_count == 4U);
}

TEST_CASE("Unreadable output keeps the raw text", "[agents][vision]") {
  const std::string raw = "The model rambled without a verdict.";
  const VisionResponse parsed = ParseVisionResponse(raw);
  const auto* bad = std::get_if<Unparseable>(&parsed);
  REQUIRE(bad != nullptr);
  REQUIRE(bad->raw_text == raw);
  REQUIRE_FALSE(bad->reason.empty());

  REQUIRE(std::holds_alternative<Unparseable>(ParseVisionResponse("   ")));
  REQUIRE(std::holds_alternative<Unparseable>(ParseVisionResponse("{\"findings\": [1, 2]}")));
  REQUIRE(std::holds_alternative<Unparseable>(ParseVisionResponse("{not json at all")));
}

TEST_CASE("Vision result separates visual and temporal penalties", "[agents][vision]") {
  const std::vector<ScreenshotResponse> responses{
      {.screenshot = "home.png",
       .raw_text = R"([{"pattern": "fake_countdown_timer", "category": "false_urgency",
                        "severity": 1.0, "confidence": 1.0}])"},
      {.screenshot = "checkout.png",
       .raw_text = R"({"pattern": "hidden_costs", "category": "sneaking",
                       "severity": 0.5, "confidence": 0.8})"},
  };

  const VisionResult result = BuildVisionResult(responses);
  REQUIRE(result.screenshots_analyzed == 2U);
  REQUIRE(result.unparseable_responses == 0U);
  REQUIRE(result.fake_timer_detected);
  REQUIRE(result.temporal_score == Catch::Approx(0.4));
  REQUIRE(result.visual_score == Catch::Approx(0.8));
  REQUIRE(result.findings.size() == 2U);
  REQUIRE(result.findings[1].screenshot == "checkout.png");
}

TEST_CASE("All unparseable responses leave neutral scores", "[agents][vision]") {
  const VisionResult result = BuildVisionResult({{.screenshot = "a.png", .raw_text = "???"},
                                                 {.screenshot = "b.png", .raw_text = ""}});
  REQUIRE(result.unparseable_responses == 2U);
  REQUIRE(result.visual_score == Catch::Approx(0.5));
  REQUIRE(result.temporal_score == Catch::Approx(0.5));
  REQUIRE(result.findings.empty());
}

TEST_CASE("Clean responses score fully trusted visuals", "[agents][vision]") {
  const VisionResult result =
      BuildVisionResult({{.screenshot = "a.png", .raw_text = R"({"detected": false})"}});
  REQUIRE(result.visual_score == Catch::Approx(1.0));
  REQUIRE(result.temporal_score == Catch::Approx(1.0));
  REQUIRE_FALSE(result.fake_timer_detected);
}
