#include "agents/evidence_judge.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "reputation/reputation_manager.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace siteaudit::agents {

namespace {

constexpr double kDegradedSignalConfidence = 0.3;
constexpr double kCriticalFindingConfidence = 0.8;

bool IsDegraded(const JudgeInput& input, std::string_view agent) {
  return std::find(input.degraded_agents.begin(), input.degraded_agents.end(), agent) !=
         input.degraded_agents.end();
}

double VerdictScore(reputation::Verdict verdict) {
  switch (verdict) {
  case reputation::Verdict::kSafe:
    return 1.0;
  case reputation::Verdict::kSuspicious:
    return 0.3;
  case reputation::Verdict::kMalicious:
    return 0.0;
  case reputation::Verdict::kUnknown:
    break;
  }
  return 0.5;
}

std::string ToLowerAscii(std::string_view raw) {
  std::string out(raw);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string ClaimKey(const SourceClaim& claim) {
  return claim.source + "|" + reputation::ToString(claim.verdict) + "|" + claim.detail;
}

scoring::SignalInput StructuralSignal(const ScoutResult& scout) {
  bool cross_domain_forms = false;
  bool many_iframes = false;
  bool redirect_chain = false;
  bool http_error = false;
  for (const auto& page : scout.pages) {
    cross_domain_forms = cross_domain_forms || page.sensitive_form_cross_domain;
    many_iframes = many_iframes || page.iframe_count > 3U;
    redirect_chain = redirect_chain || page.redirect_hops > 2U;
    http_error = http_error || page.http_status >= 400;
  }

  double score = 1.0;
  std::vector<std::string> reasons;
  if (cross_domain_forms) {
    score -= 0.4;
    reasons.emplace_back("cross-domain form");
  }
  if (many_iframes) {
    score -= 0.15;
    reasons.emplace_back("iframes");
  }
  if (redirect_chain) {
    score -= 0.15;
    reasons.emplace_back("redirect chain");
  }
  if (http_error) {
    score -= 0.2;
    reasons.emplace_back("http error");
  }

  std::string detail = std::to_string(scout.pages.size()) + " page(s)";
  for (const auto& reason : reasons) {
    detail += ", " + reason;
  }
  return scoring::SignalInput{.score = std::clamp(score, 0.0, 1.0), .confidence = 0.8,
                              .detail = detail};
}

scoring::SignalInput GraphSignal(const GraphResult& graph,
                                 reputation::ReputationManager* reputation) {
  scoring::SignalInput signal{.score = graph.graph_score, .confidence = 0.7,
                              .detail = std::to_string(graph.verified_entities.size()) +
                                        " verified entities"};
  if (reputation == nullptr || graph.claims.empty()) {
    return signal;
  }

  double weighted_sum = 0.0;
  double weight_total = 0.0;
  std::size_t trusted = 0;
  for (const auto& claim : graph.claims) {
    if (claim.verdict == reputation::Verdict::kUnknown ||
        claim.confidence < reputation->ConfidenceThreshold(claim.source)) {
      continue;
    }
    const double weight = reputation->ConsensusWeight(claim.source) * claim.confidence;
    weighted_sum += weight * VerdictScore(claim.verdict);
    weight_total += weight;
    ++trusted;
  }
  if (trusted == 0U || weight_total <= 0.0) {
    signal.detail += ", no trusted claims";
    return signal;
  }

  const double consensus = weighted_sum / weight_total;
  signal.score = std::clamp(0.5 * graph.graph_score + 0.5 * consensus, 0.0, 1.0);
  signal.confidence =
      std::min(1.0, 0.6 + 0.4 * static_cast<double>(trusted) /
                              static_cast<double>(graph.claims.size()));
  signal.detail += ", consensus " + core::FormatFixedDouble(consensus, 2) + " from " +
                   std::to_string(trusted) + "/" + std::to_string(graph.claims.size()) +
                   " claims";
  return signal;
}

const char* PlainRiskPhrase(scoring::RiskLevel level) {
  switch (level) {
  case scoring::RiskLevel::kTrusted:
    return "trustworthy";
  case scoring::RiskLevel::kProbablySafe:
    return "probably safe";
  case scoring::RiskLevel::kSuspicious:
    return "suspicious";
  case scoring::RiskLevel::kHighRisk:
    return "high risk";
  case scoring::RiskLevel::kDangerous:
    return "dangerous";
  }
  return "suspicious";
}

} // namespace

const std::vector<std::string>& PriorityPagePatterns() {
  static const std::vector<std::string> kPatterns{
      "/about", "/contact", "/terms", "/privacy", "/cancel", "/unsubscribe", "/refund",
      "/pricing", "/checkout", "/team", "/leadership", "/legal",
  };
  return kPatterns;
}

scoring::SignalInputs BuildSignals(const JudgeInput& input,
                                   reputation::ReputationManager* reputation) {
  scoring::SignalInputs signals;

  const bool vision_degraded = IsDegraded(input, "vision");
  const double vision_confidence = vision_degraded ? kDegradedSignalConfidence : 0.85;
  const std::string vision_detail =
      std::to_string(input.vision.findings.size()) + " finding(s) over " +
      std::to_string(input.vision.screenshots_analyzed) + " screenshot(s)" +
      (vision_degraded ? ", fallback" : "");
  signals[scoring::SignalKind::kVisual] = scoring::SignalInput{.score = input.vision.visual_score,
                                           .confidence = vision_confidence,
                                           .detail = vision_detail};
  signals[scoring::SignalKind::kTemporal] = scoring::SignalInput{
      .score = input.vision.temporal_score,
      .confidence = vision_confidence,
      .detail = input.vision.fake_timer_detected ? "fake timer" : vision_detail};

  if (!input.scout.pages.empty()) {
    scoring::SignalInput structural = StructuralSignal(input.scout);
    if (IsDegraded(input, "scout")) {
      structural.confidence = kDegradedSignalConfidence;
      structural.detail += ", fallback";
    }
    signals[scoring::SignalKind::kStructural] = structural;
  }

  const bool graph_degraded = IsDegraded(input, "graph");
  scoring::SignalInput graph = GraphSignal(input.graph, graph_degraded ? nullptr : reputation);
  if (graph_degraded) {
    graph.confidence = kDegradedSignalConfidence;
    graph.detail += ", fallback";
  }
  signals[scoring::SignalKind::kGraph] = graph;
  signals[scoring::SignalKind::kMeta] = scoring::SignalInput{
      .score = input.graph.meta_score,
      .confidence = graph_degraded ? kDegradedSignalConfidence : 0.7,
      .detail = std::to_string(input.graph.inconsistencies.size()) + " inconsistencies"};

  if (input.security.has_value()) {
    const bool security_degraded = IsDegraded(input, "security");
    signals[scoring::SignalKind::kSecurity] = scoring::SignalInput{
        .score = input.security->overall_score,
        .confidence = security_degraded ? kDegradedSignalConfidence : 0.8,
        .detail = std::to_string(input.security->modules_run.size()) + " module(s)" +
                  (security_degraded ? ", fallback" : "")};
  }
  return signals;
}

scoring::HardStopConditions BuildHardStops(const JudgeInput& input) {
  scoring::HardStopConditions stops;

  for (const auto& page : input.scout.pages) {
    if (!stops.has_ssl.has_value()) {
      if (page.tls == TlsStatus::kNone) {
        stops.has_ssl = false;
      } else if (page.tls != TlsStatus::kUnknown) {
        stops.has_ssl = true;
      }
    }
    if (page.tls == TlsStatus::kInvalid || page.tls == TlsStatus::kSelfSigned) {
      stops.invalid_certificate = true;
    }
    stops.captcha_blocked = stops.captcha_blocked || page.captcha_blocked;
    stops.cross_domain_sensitive_forms =
        stops.cross_domain_sensitive_forms || page.sensitive_form_cross_domain;
  }

  stops.fake_timer_detected = input.vision.fake_timer_detected;
  stops.fake_badge_count = input.vision.fake_badge_count;
  stops.verified_badge_count = input.vision.badge_count > input.vision.fake_badge_count
                                   ? input.vision.badge_count - input.vision.fake_badge_count
                                   : 0U;
  stops.critical_indicator_confirmed =
      std::any_of(input.vision.findings.begin(), input.vision.findings.end(),
                  [](const VisionFinding& finding) {
                    return finding.critical && finding.confidence >= kCriticalFindingConfidence;
                  });

  stops.domain_age_days = input.graph.domain_age_days;
  stops.domain_blacklisted = input.graph.domain_blacklisted;
  stops.whois_hidden = input.graph.whois_hidden;
  stops.phishing_hit = input.graph.phishing_hit;

  if (input.security.has_value()) {
    stops.js_obfuscation_risk = input.security->js_obfuscation_risk;
    stops.cross_domain_sensitive_forms =
        stops.cross_domain_sensitive_forms || input.security->cross_domain_sensitive_forms;
    stops.critical_indicator_confirmed =
        stops.critical_indicator_confirmed || !input.security->critical_indicators.empty();
  }
  return stops;
}

std::vector<std::string> SelectCandidateUrls(const JudgeInput& input,
                                             std::size_t max_candidates) {
  std::set<std::string> seen(input.investigated_urls.begin(), input.investigated_urls.end());
  for (const auto& page : input.scout.pages) {
    seen.insert(page.url);
  }

  const auto& patterns = PriorityPagePatterns();
  std::vector<std::pair<std::size_t, std::string>> ranked;
  for (const auto& page : input.scout.pages) {
    for (const auto& link : page.discovered_links) {
      if (!seen.insert(link).second) {
        continue;
      }
      const std::string lowered = ToLowerAscii(link);
      std::size_t priority = patterns.size();
      for (std::size_t i = 0; i < patterns.size(); ++i) {
        if (lowered.find(patterns[i]) != std::string::npos) {
          priority = i;
          break;
        }
      }
      ranked.emplace_back(priority, link);
    }
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  std::vector<std::string> candidates;
  for (const auto& [priority, link] : ranked) {
    if (candidates.size() >= max_candidates) {
      break;
    }
    candidates.push_back(link);
  }
  return candidates;
}

std::string ComposeNarrative(const JudgeInput& input, const scoring::TrustScoreResult& trust) {
  std::ostringstream out;
  const scoring::SubSignal* visual = trust.FindSignal(scoring::SignalKind::kVisual);
  const scoring::SubSignal* graph = trust.FindSignal(scoring::SignalKind::kGraph);
  const bool conflict = visual != nullptr && graph != nullptr && visual->measured &&
                        graph->measured && visual->score >= 0.7 && graph->score <= 0.3;

  if (input.verdict_mode == VerdictMode::kSimple) {
    out << "This site looks " << PlainRiskPhrase(trust.risk_level()) << ". Score "
        << trust.final_score() << " out of 100.";
    if (!trust.overrides_applied().empty()) {
      out << " Serious warning signs were found.";
    }
    if (conflict) {
      out << " It looks professional, but the business behind it could not be verified.";
    }
    if (!input.degraded_agents.empty()) {
      out << " Some checks could not be completed.";
    }
    return out.str();
  }

  out << "Trust score " << trust.final_score() << "/100 (" << scoring::ToString(trust.risk_level())
      << ") for " << input.url << " [" << trust.site_type() << "].";
  out << " Signals:";
  for (const auto& signal : trust.sub_signals()) {
    out << ' ' << scoring::ToString(signal.kind) << '=' << core::FormatFixedDouble(signal.score, 2);
  }
  out << '.';
  if (!trust.overrides_applied().empty()) {
    out << " Overrides:";
    for (const auto& name : trust.OverrideNames()) {
      out << ' ' << name;
    }
    out << '.';
  }
  if (conflict) {
    out << " Visual presentation conflicts with entity verification.";
  }
  if (!input.degraded_agents.empty()) {
    out << " Degraded:";
    for (const auto& agent : input.degraded_agents) {
      out << ' ' << agent;
    }
    out << " (penalty " << core::FormatFixedDouble(input.quality_penalty, 2) << ").";
  }
  out << " Confidence " << core::FormatFixedDouble(trust.confidence(), 2) << '.';
  return out.str();
}

EvidenceJudge::EvidenceJudge(const scoring::TrustScoreEngine& engine,
                             reputation::ReputationManager& reputation,
                             core::logging::Logger& logger)
    : engine_(engine), reputation_(reputation), logger_(logger) {}

std::vector<PredictionRef> EvidenceJudge::RecordNewPredictions(const GraphResult& graph) {
  std::vector<PredictionRef> recorded;
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& claim : graph.claims) {
    if (claim.source.empty() || !recorded_claims_.insert(ClaimKey(claim)).second) {
      continue;
    }
    const std::uint64_t id =
        reputation_.RecordPrediction(claim.source, claim.verdict, claim.confidence);
    recorded.push_back(PredictionRef{.source = claim.source, .id = id, .predicted = claim.verdict});
  }
  return recorded;
}

bool EvidenceJudge::Deliberate(const JudgeInput& input, const core::CancelToken& cancel,
                               JudgeVerdict& verdict, std::string& error) {
  verdict = JudgeVerdict{};
  if (cancel.IsCancelled()) {
    error = "judge cancelled";
    return false;
  }

  scoring::ScoreRequest request{
      .signals = BuildSignals(input, &reputation_),
      .site_type = input.site_type,
      .hard_stops = BuildHardStops(input),
      .quality_penalty = input.quality_penalty,
  };
  if (!engine_.Score(request, verdict.trust, error)) {
    return false;
  }

  if (!IsDegraded(input, "graph")) {
    verdict.predictions = RecordNewPredictions(input.graph);
  }
  verdict.narrative = ComposeNarrative(input, *verdict.trust);
  verdict.candidate_urls = SelectCandidateUrls(input);

  logger_.Debug("judge deliberated",
                {{"iteration", std::to_string(input.iteration)},
                 {"score", std::to_string(verdict.trust->final_score())},
                 {"candidates", std::to_string(verdict.candidate_urls.size())}});
  return true;
}

} // namespace siteaudit::agents
