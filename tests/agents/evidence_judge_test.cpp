#include "agents/evidence_judge.hpp"
#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"
#include "core/testing/manual_clock.hpp"
#include "reputation/reputation_manager.hpp"
#include "scoring/signal_weights.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using Catch::Approx;
using siteaudit::agents::BuildHardStops;
using siteaudit::agents::BuildSignals;
using siteaudit::agents::ComposeNarrative;
using siteaudit::agents::EvidenceJudge;
using siteaudit::agents::JudgeInput;
using siteaudit::agents::JudgeVerdict;
using siteaudit::agents::PageCapture;
using siteaudit::agents::SecurityResult;
using siteaudit::agents::SelectCandidateUrls;
using siteaudit::agents::SourceClaim;
using siteaudit::agents::TlsStatus;
using siteaudit::agents::VerdictMode;
using siteaudit::agents::VisionFinding;
using siteaudit::core::CancelSource;
using siteaudit::core::logging::LogLevel;
using siteaudit::core::logging::Logger;
using siteaudit::core::testing::ManualClock;
using siteaudit::reputation::ReputationManager;
using siteaudit::reputation::Verdict;
using siteaudit::scoring::SignalKind;

namespace {

struct Fixture {
  std::ostringstream log;
  Logger logger{LogLevel::kWarn, log};
  ManualClock clock;
  ReputationManager reputation{clock, logger};
  siteaudit::scoring::TrustScoreEngine engine{siteaudit::scoring::DefaultProfileTable(), logger};
};

PageCapture Page(const std::string& url, std::vector<std::string> links = {}) {
  PageCapture page;
  page.url = url;
  page.http_status = 200;
  page.tls = TlsStatus::kValid;
  page.screenshot_paths = {url + "#0.png"};
  page.discovered_links = std::move(links);
  return page;
}

JudgeInput HealthyInput() {
  JudgeInput input;
  input.url = "https://shop.example.com/";
  input.site_type = "ecommerce";
  input.scout.pages = {Page("https://shop.example.com/")};
  input.vision.visual_score = 1.0;
  input.vision.temporal_score = 1.0;
  input.vision.screenshots_analyzed = 1;
  input.graph.graph_score = 0.9;
  input.graph.meta_score = 0.85;
  input.graph.domain_age_days = 3650;
  input.security = SecurityResult{.overall_score = 0.9, .modules_run = {"tls", "headers"}};
  return input;
}

} // namespace

TEST_CASE("Signals carry lower confidence for degraded agents", "[agents][judge]") {
  JudgeInput input = HealthyInput();
  const auto healthy = BuildSignals(input, nullptr);
  REQUIRE(healthy.size() == 6U);
  REQUIRE(healthy.at(SignalKind::kVisual).confidence == Approx(0.85));
  REQUIRE(healthy.at(SignalKind::kGraph).score == Approx(0.9));

  input.degraded_agents = {"vision", "graph"};
  const auto degraded = BuildSignals(input, nullptr);
  REQUIRE(degraded.at(SignalKind::kVisual).confidence == Approx(0.3));
  REQUIRE(degraded.at(SignalKind::kTemporal).confidence == Approx(0.3));
  REQUIRE(degraded.at(SignalKind::kGraph).confidence == Approx(0.3));
  REQUIRE(degraded.at(SignalKind::kMeta).confidence == Approx(0.3));
  REQUIRE(degraded.at(SignalKind::kSecurity).confidence == Approx(0.8));
}

TEST_CASE("Structural signal is omitted without captured pages", "[agents][judge]") {
  JudgeInput input = HealthyInput();
  input.scout.pages.clear();
  input.security.reset();
  const auto signals = BuildSignals(input, nullptr);
  REQUIRE(signals.count(SignalKind::kStructural) == 0U);
  REQUIRE(signals.count(SignalKind::kSecurity) == 0U);
}

TEST_CASE("Trusted source claims blend into the graph signal", "[agents][judge]") {
  Fixture fx;
  JudgeInput input = HealthyInput();
  input.graph.graph_score = 0.8;
  input.graph.claims = {
      SourceClaim{.source = "urlvoid", .verdict = Verdict::kMalicious, .confidence = 0.9},
      SourceClaim{.source = "whois", .verdict = Verdict::kSafe, .confidence = 0.1},
  };

  const auto signals = BuildSignals(input, &fx.reputation);
  // The whois claim sits below its 0.4 threshold; only urlvoid counts.
  REQUIRE(signals.at(SignalKind::kGraph).score == Approx(0.4));
  REQUIRE(signals.at(SignalKind::kGraph).confidence == Approx(0.8));
  REQUIRE(signals.at(SignalKind::kGraph).detail.find("1/2 claims") != std::string::npos);
}

TEST_CASE("Hard stops are derived from every agent's evidence", "[agents][judge]") {
  JudgeInput input = HealthyInput();
  input.scout.pages[0].tls = TlsStatus::kNone;
  input.scout.pages[0].captcha_blocked = true;
  input.vision.fake_timer_detected = true;
  input.vision.badge_count = 3;
  input.vision.fake_badge_count = 3;
  input.vision.findings = {VisionFinding{.pattern_id = "credential_harvest_form",
                                         .severity = 1.0,
                                         .confidence = 0.9,
                                         .critical = true}};
  input.graph.domain_age_days = 4;
  input.graph.domain_blacklisted = true;
  input.security->js_obfuscation_risk = 0.8;

  const auto stops = BuildHardStops(input);
  REQUIRE(stops.has_ssl.has_value());
  REQUIRE_FALSE(*stops.has_ssl);
  REQUIRE(stops.captcha_blocked);
  REQUIRE(stops.fake_timer_detected);
  REQUIRE(stops.fake_badge_count == 3U);
  REQUIRE(stops.verified_badge_count == 0U);
  REQUIRE(stops.critical_indicator_confirmed);
  REQUIRE(stops.domain_age_days == 4);
  REQUIRE(stops.domain_blacklisted);
  REQUIRE(stops.js_obfuscation_risk == Approx(0.8));
}

TEST_CASE("Unknown TLS leaves has_ssl unset", "[agents][judge]") {
  JudgeInput input = HealthyInput();
  input.scout.pages[0].tls = TlsStatus::kUnknown;
  REQUIRE_FALSE(BuildHardStops(input).has_ssl.has_value());

  input.scout.pages[0].tls = TlsStatus::kSelfSigned;
  const auto stops = BuildHardStops(input);
  REQUIRE(stops.has_ssl.value_or(false));
  REQUIRE(stops.invalid_certificate);
}

TEST_CASE("Candidate urls prefer priority pages and skip investigated ones", "[agents][judge]") {
  JudgeInput input = HealthyInput();
  input.scout.pages[0].discovered_links = {
      "https://shop.example.com/blog",
      "https://shop.example.com/checkout",
      "https://shop.example.com/",
      "https://shop.example.com/About-Us",
      "https://shop.example.com/blog",
  };
  input.investigated_urls = {"https://shop.example.com/checkout"};

  const auto candidates = SelectCandidateUrls(input);
  REQUIRE(candidates.size() == 2U);
  REQUIRE(candidates[0] == "https://shop.example.com/About-Us");
  REQUIRE(candidates[1] == "https://shop.example.com/blog");

  REQUIRE(SelectCandidateUrls(input, 1).size() == 1U);
}

TEST_CASE("Judge records each source claim once per audit", "[agents][judge]") {
  Fixture fx;
  EvidenceJudge judge(fx.engine, fx.reputation, fx.logger);
  JudgeInput input = HealthyInput();
  input.graph.claims = {SourceClaim{.source = "ssl", .verdict = Verdict::kSafe,
                                    .confidence = 0.9, .detail = "valid chain"}};
  CancelSource cancel;

  JudgeVerdict first;
  std::string error;
  REQUIRE(judge.Deliberate(input, cancel.Token(), first, error));
  REQUIRE(first.trust.has_value());
  REQUIRE(first.predictions.size() == 1U);
  REQUIRE(first.predictions[0].source == "ssl");

  input.iteration = 1;
  JudgeVerdict second;
  REQUIRE(judge.Deliberate(input, cancel.Token(), second, error));
  REQUIRE(second.predictions.empty());
  REQUIRE(fx.reputation.Find("ssl")->total_predictions == 1U);
  REQUIRE(fx.reputation.Find("ssl")->recent.size() == 1U);
}

TEST_CASE("Cancelled judge fails without scoring", "[agents][judge]") {
  Fixture fx;
  EvidenceJudge judge(fx.engine, fx.reputation, fx.logger);
  CancelSource cancel;
  cancel.Cancel();

  JudgeVerdict verdict;
  std::string error;
  REQUIRE_FALSE(judge.Deliberate(HealthyInput(), cancel.Token(), verdict, error));
  REQUIRE(error == "judge cancelled");
  REQUIRE_FALSE(verdict.trust.has_value());
}

TEST_CASE("Narrative follows the verdict mode", "[agents][judge]") {
  Fixture fx;
  EvidenceJudge judge(fx.engine, fx.reputation, fx.logger);
  JudgeInput input = HealthyInput();
  input.degraded_agents = {"security"};
  input.quality_penalty = 0.2;
  CancelSource cancel;
  JudgeVerdict verdict;
  std::string error;
  REQUIRE(judge.Deliberate(input, cancel.Token(), verdict, error));
  REQUIRE(verdict.narrative.find("Trust score ") == 0U);
  REQUIRE(verdict.narrative.find("Degraded: security (penalty 0.20)") != std::string::npos);

  input.verdict_mode = VerdictMode::kSimple;
  const std::string simple = ComposeNarrative(input, *verdict.trust);
  REQUIRE(simple.find("This site looks ") == 0U);
  REQUIRE(simple.find("Some checks could not be completed.") != std::string::npos);
}
