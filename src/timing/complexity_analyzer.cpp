#include "timing/complexity_analyzer.hpp"

#include <algorithm>
#include <cctype>

namespace siteaudit::timing {

namespace {

// Field weights sum to 1.0 across the three groups.
constexpr double kDomWeight = 0.30;
constexpr double kScriptWeight = 0.20;
constexpr double kIframeWeight = 0.08;
constexpr double kFormWeight = 0.05;
constexpr double kStructuralTotal = kDomWeight + kScriptWeight + kIframeWeight + kFormWeight;

constexpr double kRedirectWeight = 0.05;
constexpr double kExternalWeight = 0.04;
constexpr double kLoadWeight = 0.08;
constexpr double kNetworkTotal = kRedirectWeight + kExternalWeight + kLoadWeight;

constexpr double kLazyWeight = 0.15;
constexpr double kScreenshotWeight = 0.02;
constexpr double kCountdownWeight = 0.03;
constexpr double kDynamicTotal = kLazyWeight + kScreenshotWeight + kCountdownWeight;

double Saturate(double value, double ceiling) {
  if (ceiling <= 0.0) {
    return 0.0;
  }
  return std::clamp(value / ceiling, 0.0, 1.0);
}

double StructuralWeighted(const ComplexityMetrics& m) {
  return kDomWeight * Saturate(m.dom_node_count, 5000.0) +
         kScriptWeight * Saturate(m.script_count, 50.0) +
         kIframeWeight * Saturate(m.iframe_count, 5.0) +
         kFormWeight * Saturate(m.form_count, 10.0);
}

double NetworkWeighted(const ComplexityMetrics& m) {
  return kRedirectWeight * Saturate(m.redirect_hops, 5.0) +
         kExternalWeight * Saturate(m.external_resource_count, 100.0) +
         kLoadWeight * Saturate(static_cast<double>(m.load_time_ms), 10'000.0);
}

double DynamicWeighted(const ComplexityMetrics& m) {
  return kLazyWeight * (m.has_lazy_load ? 1.0 : 0.0) +
         kScreenshotWeight * Saturate(m.screenshot_count, 20.0) +
         kCountdownWeight * (m.has_countdown_or_animation ? 1.0 : 0.0);
}

} // namespace

double ComplexityMetrics::StructuralScore() const {
  return StructuralWeighted(*this) / kStructuralTotal;
}

double ComplexityMetrics::NetworkScore() const {
  return NetworkWeighted(*this) / kNetworkTotal;
}

double ComplexityMetrics::DynamicScore() const {
  return DynamicWeighted(*this) / kDynamicTotal;
}

double ComplexityMetrics::CompositeScore() const {
  const double score = StructuralWeighted(*this) + NetworkWeighted(*this) + DynamicWeighted(*this);
  return std::clamp(score, 0.0, 1.0);
}

const char* ToString(const TimeoutStrategy strategy) {
  switch (strategy) {
  case TimeoutStrategy::kFast:
    return "fast";
  case TimeoutStrategy::kStandard:
    return "standard";
  case TimeoutStrategy::kConservative:
    return "conservative";
  case TimeoutStrategy::kAdaptive:
    return "adaptive";
  }
  return "standard";
}

bool ParseTimeoutStrategy(std::string_view raw, TimeoutStrategy& strategy, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized == "fast") {
    strategy = TimeoutStrategy::kFast;
    return true;
  }
  if (normalized == "standard") {
    strategy = TimeoutStrategy::kStandard;
    return true;
  }
  if (normalized == "conservative") {
    strategy = TimeoutStrategy::kConservative;
    return true;
  }
  if (normalized == "adaptive") {
    strategy = TimeoutStrategy::kAdaptive;
    return true;
  }
  error = "invalid timeout strategy '" + std::string(raw) +
          "' (expected fast|standard|conservative|adaptive)";
  return false;
}

TimeoutStrategy SuggestStrategy(const double complexity_score) {
  if (complexity_score < 0.30) {
    return TimeoutStrategy::kFast;
  }
  if (complexity_score < 0.60) {
    return TimeoutStrategy::kStandard;
  }
  return TimeoutStrategy::kConservative;
}

ComplexityMetrics ComplexityAnalyzer::Analyze(const std::string& url,
                                              const agents::ScoutResult* scout,
                                              const agents::VisionResult* vision,
                                              const agents::SecurityResult* security) const {
  ComplexityMetrics metrics;
  metrics.url = url;

  if (scout != nullptr) {
    metrics.site_type = scout->site_type_hint;
    for (const auto& page : scout->pages) {
      metrics.dom_depth = std::max(metrics.dom_depth, page.dom_depth);
      metrics.dom_node_count = std::max(metrics.dom_node_count, page.dom_node_count);
      metrics.script_count = std::max(metrics.script_count, page.script_count);
      metrics.stylesheet_count = std::max(metrics.stylesheet_count, page.stylesheet_count);
      metrics.inline_style_count = std::max(metrics.inline_style_count, page.inline_style_count);
      metrics.iframe_count = std::max(metrics.iframe_count, page.iframe_count);
      metrics.form_count = std::max(metrics.form_count, page.form_count);
      metrics.redirect_hops = std::max(metrics.redirect_hops, page.redirect_hops);
      metrics.external_resource_count =
          std::max(metrics.external_resource_count, page.external_resource_count);
      metrics.load_time_ms = std::max(metrics.load_time_ms, page.load_time_ms);
      metrics.network_idle_ms = std::max(metrics.network_idle_ms, page.network_idle_ms);
      metrics.has_lazy_load = metrics.has_lazy_load || page.has_lazy_load;
      metrics.lazy_load_cycles = std::max(metrics.lazy_load_cycles, page.lazy_load_cycles);
      metrics.viewport_changes += page.viewport_changes;
      metrics.screenshot_count += static_cast<std::uint32_t>(page.screenshot_paths.size());
      metrics.has_countdown_or_animation = metrics.has_countdown_or_animation ||
                                           page.has_countdown_timer || page.has_animation;
    }
  }

  if (vision != nullptr) {
    metrics.screenshot_count = std::max(metrics.screenshot_count, vision->screenshots_analyzed);
    metrics.has_countdown_or_animation =
        metrics.has_countdown_or_animation || vision->fake_timer_detected;
  }

  if (security != nullptr) {
    metrics.script_count = std::max(metrics.script_count, security->scripts_inspected);
    metrics.iframe_count = std::max(metrics.iframe_count, security->iframes_inspected);
  }

  return metrics;
}

} // namespace siteaudit::timing
