#include "audit/audit_state.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <sstream>

namespace siteaudit::audit {

namespace {

void WriteStringMap(std::ostringstream& out, const std::map<std::string, std::string>& values) {
  out << '{';
  bool first = true;
  for (const auto& [key, value] : values) {
    out << (first ? "" : ",") << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }
  out << '}';
}

void WritePage(std::ostringstream& out, const agents::PageCapture& page) {
  out << "{\"url\":" << core::QuoteJson(page.url) << ",\"title\":" << core::QuoteJson(page.title)
      << ",\"http_status\":" << page.http_status
      << ",\"tls\":" << core::QuoteJson(agents::ToString(page.tls))
      << ",\"screenshots\":" << core::ToJsonStringArray(page.screenshot_paths)
      << ",\"dom_nodes\":" << page.dom_node_count << ",\"forms\":" << page.form_count
      << ",\"iframes\":" << page.iframe_count << ",\"redirect_hops\":" << page.redirect_hops
      << ",\"captcha_blocked\":" << (page.captcha_blocked ? "true" : "false") << '}';
}

void WriteVision(std::ostringstream& out, const agents::VisionResult& vision) {
  out << "{\"visual_score\":" << core::FormatFixedDouble(vision.visual_score, 3)
      << ",\"temporal_score\":" << core::FormatFixedDouble(vision.temporal_score, 3)
      << ",\"fake_timer_detected\":" << (vision.fake_timer_detected ? "true" : "false")
      << ",\"badge_count\":" << vision.badge_count
      << ",\"fake_badge_count\":" << vision.fake_badge_count
      << ",\"screenshots_analyzed\":" << vision.screenshots_analyzed
      << ",\"unparseable_responses\":" << vision.unparseable_responses << ",\"findings\":[";
  for (std::size_t i = 0; i < vision.findings.size(); ++i) {
    const auto& finding = vision.findings[i];
    out << (i == 0U ? "" : ",") << "{\"pattern\":" << core::QuoteJson(finding.pattern_id)
        << ",\"category\":" << core::QuoteJson(finding.category)
        << ",\"severity\":" << core::FormatFixedDouble(finding.severity, 2)
        << ",\"confidence\":" << core::FormatFixedDouble(finding.confidence, 2)
        << ",\"critical\":" << (finding.critical ? "true" : "false")
        << ",\"screenshot\":" << core::QuoteJson(finding.screenshot)
        << ",\"evidence\":" << core::QuoteJson(finding.evidence) << '}';
  }
  out << "]}";
}

void WriteGraph(std::ostringstream& out, const agents::GraphResult& graph) {
  out << "{\"graph_score\":" << core::FormatFixedDouble(graph.graph_score, 3)
      << ",\"meta_score\":" << core::FormatFixedDouble(graph.meta_score, 3)
      << ",\"domain_age_days\":" << graph.domain_age_days
      << ",\"whois_hidden\":" << (graph.whois_hidden ? "true" : "false")
      << ",\"domain_blacklisted\":" << (graph.domain_blacklisted ? "true" : "false")
      << ",\"phishing_hit\":" << (graph.phishing_hit ? "true" : "false")
      << ",\"verified_entities\":" << core::ToJsonStringArray(graph.verified_entities)
      << ",\"inconsistencies\":" << core::ToJsonStringArray(graph.inconsistencies)
      << ",\"claims\":[";
  for (std::size_t i = 0; i < graph.claims.size(); ++i) {
    const auto& claim = graph.claims[i];
    out << (i == 0U ? "" : ",") << "{\"source\":" << core::QuoteJson(claim.source)
        << ",\"verdict\":" << core::QuoteJson(reputation::ToString(claim.verdict))
        << ",\"confidence\":" << core::FormatFixedDouble(claim.confidence, 2)
        << ",\"detail\":" << core::QuoteJson(claim.detail) << '}';
  }
  out << "]}";
}

void WriteSecurity(std::ostringstream& out, const agents::SecurityResult& security) {
  out << "{\"overall_score\":" << core::FormatFixedDouble(security.overall_score, 3)
      << ",\"modules_run\":" << core::ToJsonStringArray(security.modules_run)
      << ",\"js_obfuscation_risk\":" << core::FormatFixedDouble(security.js_obfuscation_risk, 3)
      << ",\"cross_domain_sensitive_forms\":"
      << (security.cross_domain_sensitive_forms ? "true" : "false")
      << ",\"critical_indicators\":" << core::ToJsonStringArray(security.critical_indicators)
      << ",\"ioc_hits\":" << core::ToJsonStringArray(security.ioc_hits) << '}';
}

} // namespace

const char* ToString(PipelineState state) {
  switch (state) {
  case PipelineState::kScout:
    return "SCOUT";
  case PipelineState::kInvestigate:
    return "INVESTIGATE";
  case PipelineState::kJudge:
    return "JUDGE";
  case PipelineState::kLoop:
    return "LOOP";
  case PipelineState::kDone:
    return "DONE";
  case PipelineState::kError:
    return "ERROR";
  }

  return "ERROR";
}

std::vector<std::string> AuditState::DegradedAgents() const {
  std::vector<std::string> agents;
  for (const auto& record : degradations) {
    if (std::find(agents.begin(), agents.end(), record.result.agent) == agents.end()) {
      agents.push_back(record.result.agent);
    }
  }
  return agents;
}

std::string AuditState::ToJson() const {
  std::ostringstream out;
  out << "{\n  \"audit_id\": " << core::QuoteJson(audit_id)
      << ",\n  \"url\": " << core::QuoteJson(url)
      << ",\n  \"site_type\": " << core::QuoteJson(site_type)
      << ",\n  \"tier\": " << core::QuoteJson(ToString(tier))
      << ",\n  \"verdict_mode\": " << core::QuoteJson(agents::ToString(verdict_mode))
      << ",\n  \"state\": " << core::QuoteJson(ToString(state))
      << ",\n  \"iterations\": " << iteration
      << ",\n  \"elapsed_ms\": " << elapsed.count()
      << ",\n  \"external_calls_used\": " << external_calls_used
      << ",\n  \"budget\": {\"max_iterations\":" << budget.max_iterations
      << ",\"max_elapsed_ms\":" << budget.max_elapsed.count()
      << ",\"max_external_calls\":" << budget.max_external_calls
      << ",\"max_pages\":" << budget.max_pages << '}'
      << ",\n  \"loop_reason\": " << core::QuoteJson(loop_reason);

  out << ",\n  \"trust\": ";
  if (trust.has_value()) {
    out << trust->ToJson();
  } else {
    out << "null";
  }
  out << ",\n  \"narrative\": " << core::QuoteJson(narrative);

  out << ",\n  \"pages\": [";
  for (std::size_t i = 0; i < pages.size(); ++i) {
    out << (i == 0U ? "" : ",");
    WritePage(out, pages[i]);
  }
  out << ']';
  out << ",\n  \"entities\": " << core::ToJsonStringArray(entities);
  out << ",\n  \"metadata\": ";
  WriteStringMap(out, metadata);

  out << ",\n  \"vision\": ";
  WriteVision(out, vision);
  out << ",\n  \"vision_measured\": " << (vision_measured ? "true" : "false");
  out << ",\n  \"graph\": ";
  WriteGraph(out, graph);
  out << ",\n  \"graph_measured\": " << (graph_measured ? "true" : "false");
  out << ",\n  \"security\": ";
  if (security.has_value()) {
    WriteSecurity(out, *security);
  } else {
    out << "null";
  }

  out << ",\n  \"quality_penalty\": " << core::FormatFixedDouble(quality_penalty, 3);
  out << ",\n  \"degradations\": [";
  for (std::size_t i = 0; i < degradations.size(); ++i) {
    const auto& record = degradations[i];
    out << (i == 0U ? "" : ",") << "{\"iteration\":" << record.iteration
        << ",\"stage\":" << core::QuoteJson(record.stage)
        << ",\"agent\":" << core::QuoteJson(record.result.agent)
        << ",\"fallback_mode\":" << core::QuoteJson(resilience::ToString(record.result.fallback_mode))
        << ",\"failure\":" << core::QuoteJson(resilience::ToString(record.result.failure))
        << ",\"quality_penalty\":" << core::FormatFixedDouble(record.result.quality_penalty, 2)
        << ",\"missing_data\":" << core::ToJsonStringArray(record.result.missing_data)
        << ",\"error\":" << core::QuoteJson(record.result.error) << '}';
  }
  out << ']';

  out << ",\n  \"complexity_history\": [";
  for (std::size_t i = 0; i < complexity_history.size(); ++i) {
    const auto& metrics = complexity_history[i];
    out << (i == 0U ? "" : ",") << "{\"url\":" << core::QuoteJson(metrics.url)
        << ",\"composite\":" << core::FormatFixedDouble(metrics.CompositeScore(), 3)
        << ",\"structural\":" << core::FormatFixedDouble(metrics.StructuralScore(), 3)
        << ",\"network\":" << core::FormatFixedDouble(metrics.NetworkScore(), 3)
        << ",\"dynamic\":" << core::FormatFixedDouble(metrics.DynamicScore(), 3)
        << ",\"suggested_strategy\":"
        << core::QuoteJson(timing::ToString(timing::SuggestStrategy(metrics.CompositeScore())))
        << '}';
  }
  out << ']';

  out << ",\n  \"predictions\": [";
  for (std::size_t i = 0; i < predictions.size(); ++i) {
    out << (i == 0U ? "" : ",") << "{\"source\":" << core::QuoteJson(predictions[i].source)
        << ",\"id\":" << predictions[i].id
        << ",\"predicted\":" << core::QuoteJson(reputation::ToString(predictions[i].predicted))
        << '}';
  }
  out << ']';
  out << ",\n  \"investigated_urls\": " << core::ToJsonStringArray(investigated_urls);
  out << ",\n  \"pending_urls\": " << core::ToJsonStringArray(pending_urls);
  out << ",\n  \"errors\": " << core::ToJsonStringArray(errors);
  out << "\n}\n";
  return out.str();
}

agents::VisionResult MergeVisionResults(const agents::VisionResult& prior,
                                        const agents::VisionResult& next) {
  if (prior.screenshots_analyzed == 0U) {
    return next;
  }
  if (next.screenshots_analyzed == 0U) {
    return prior;
  }

  const double prior_weight = static_cast<double>(prior.screenshots_analyzed);
  const double next_weight = static_cast<double>(next.screenshots_analyzed);
  const double total = prior_weight + next_weight;

  agents::VisionResult merged = prior;
  merged.visual_score = (prior.visual_score * prior_weight + next.visual_score * next_weight) / total;
  merged.temporal_score =
      (prior.temporal_score * prior_weight + next.temporal_score * next_weight) / total;
  merged.findings.insert(merged.findings.end(), next.findings.begin(), next.findings.end());
  merged.fake_timer_detected = prior.fake_timer_detected || next.fake_timer_detected;
  merged.badge_count += next.badge_count;
  merged.fake_badge_count += next.fake_badge_count;
  merged.screenshots_analyzed += next.screenshots_analyzed;
  merged.unparseable_responses += next.unparseable_responses;
  return merged;
}

} // namespace siteaudit::audit
