#include "agents/evidence.hpp"

#include "core/time_utils.hpp"

namespace siteaudit::agents {

const char* ToString(const TlsStatus status) {
  switch (status) {
  case TlsStatus::kUnknown:
    return "unknown";
  case TlsStatus::kNone:
    return "none";
  case TlsStatus::kValid:
    return "valid";
  case TlsStatus::kInvalid:
    return "invalid";
  case TlsStatus::kSelfSigned:
    return "self_signed";
  }
  return "unknown";
}

std::string Summarize(const ScoutResult& result) {
  std::size_t screenshots = 0;
  for (const auto& page : result.pages) {
    screenshots += page.screenshot_paths.size();
  }
  return std::to_string(result.pages.size()) + " page(s), " + std::to_string(screenshots) +
         " screenshot(s), site_type_hint=" +
         (result.site_type_hint.empty() ? std::string("-") : result.site_type_hint);
}

std::string Summarize(const VisionResult& result) {
  return std::to_string(result.findings.size()) + " finding(s), visual=" +
         core::FormatFixedDouble(result.visual_score, 2) +
         ", temporal=" + core::FormatFixedDouble(result.temporal_score, 2);
}

std::string Summarize(const GraphResult& result) {
  return std::to_string(result.verified_entities.size()) + " verified entit(ies), " +
         std::to_string(result.inconsistencies.size()) + " inconsistenc(ies), graph=" +
         core::FormatFixedDouble(result.graph_score, 2) +
         ", domain_age_days=" + std::to_string(result.domain_age_days);
}

std::string Summarize(const SecurityResult& result) {
  return std::to_string(result.modules_run.size()) + " module(s), overall=" +
         core::FormatFixedDouble(result.overall_score, 2) + ", critical=" +
         std::to_string(result.critical_indicators.size());
}

} // namespace siteaudit::agents
