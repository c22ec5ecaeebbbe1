#pragma once

#include "agents/evidence.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace siteaudit::timing {

// Page complexity observed during one audit iteration. Built by
// ComplexityAnalyzer and read-only afterwards.
struct ComplexityMetrics {
  std::string url;
  std::string site_type;

  // Structural.
  std::uint32_t dom_depth = 0;
  std::uint32_t dom_node_count = 0;
  std::uint32_t script_count = 0;
  std::uint32_t stylesheet_count = 0;
  std::uint32_t inline_style_count = 0;
  std::uint32_t iframe_count = 0;
  std::uint32_t form_count = 0;

  // Network.
  std::uint32_t redirect_hops = 0;
  std::uint32_t external_resource_count = 0;
  std::uint64_t load_time_ms = 0;
  std::uint64_t network_idle_ms = 0;

  // Dynamic content.
  bool has_lazy_load = false;
  std::uint32_t lazy_load_cycles = 0;
  std::uint32_t screenshot_count = 0;
  std::uint32_t viewport_changes = 0;
  bool has_countdown_or_animation = false;

  // Each sub-score is in [0,1]; the composite is their weighted sum.
  double StructuralScore() const;
  double NetworkScore() const;
  double DynamicScore() const;
  double CompositeScore() const;
};

enum class TimeoutStrategy {
  kFast,
  kStandard,
  kConservative,
  kAdaptive,
};

const char* ToString(TimeoutStrategy strategy);
bool ParseTimeoutStrategy(std::string_view raw, TimeoutStrategy& strategy, std::string& error);

// Tier picked from the composite score: < 0.30 fast, < 0.60 standard,
// otherwise conservative. Never returns kAdaptive.
TimeoutStrategy SuggestStrategy(double complexity_score);

// Derives metrics from whatever evidence is present. Null inputs contribute
// zero/neutral fields, so degraded stages still yield a usable estimate.
// Counts take the most complex page; screenshots are summed. Script and iframe
// counts seen by the security scan raise the scout counts, never lower them.
class ComplexityAnalyzer {
public:
  ComplexityMetrics Analyze(const std::string& url, const agents::ScoutResult* scout,
                            const agents::VisionResult* vision,
                            const agents::SecurityResult* security = nullptr) const;
};

} // namespace siteaudit::timing
