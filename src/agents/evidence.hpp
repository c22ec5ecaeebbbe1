#pragma once

#include "reputation/reputation_manager.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace siteaudit::agents {

enum class TlsStatus {
  kUnknown,
  kNone,
  kValid,
  kInvalid,
  kSelfSigned,
};

const char* ToString(TlsStatus status);

// One page captured by the scout: DOM shape, load timings and navigation
// facts used for complexity budgeting and structural scoring.
struct PageCapture {
  std::string url;
  std::string title;
  int http_status = 0;
  std::vector<std::string> screenshot_paths;
  std::vector<std::string> discovered_links;

  std::uint32_t dom_depth = 0;
  std::uint32_t dom_node_count = 0;
  std::uint32_t script_count = 0;
  std::uint32_t stylesheet_count = 0;
  std::uint32_t inline_style_count = 0;
  std::uint32_t iframe_count = 0;
  std::uint32_t form_count = 0;
  bool has_lazy_load = false;
  std::uint32_t lazy_load_cycles = 0;
  std::uint32_t viewport_changes = 0;
  std::uint32_t redirect_hops = 0;
  std::uint32_t external_resource_count = 0;
  bool has_countdown_timer = false;
  bool has_animation = false;
  std::uint64_t load_time_ms = 0;
  std::uint64_t network_idle_ms = 0;

  TlsStatus tls = TlsStatus::kUnknown;
  bool captcha_blocked = false;
  bool sensitive_form_cross_domain = false;
};

// Scout output for one iteration. Empty `pages` means nothing was captured.
struct ScoutResult {
  std::vector<PageCapture> pages;
  std::string site_type_hint;
  std::vector<std::string> entities;
  std::map<std::string, std::string> metadata;
};

struct VisionFinding {
  std::string pattern_id;
  std::string category;
  double severity = 0.0;
  double confidence = 0.0;
  bool critical = false;
  std::string screenshot;
  std::string evidence;
};

// Neutral defaults double as the simplified fallback payload.
struct VisionResult {
  double visual_score = 0.5;
  double temporal_score = 0.5;
  std::vector<VisionFinding> findings;
  bool fake_timer_detected = false;
  std::uint32_t badge_count = 0;
  std::uint32_t fake_badge_count = 0;
  std::uint32_t screenshots_analyzed = 0;
  std::uint32_t unparseable_responses = 0;
};

// Claim by one external verification source (dns, whois, ssl, ...).
struct SourceClaim {
  std::string source;
  reputation::Verdict verdict = reputation::Verdict::kUnknown;
  double confidence = 0.0;
  std::string detail;
};

struct GraphResult {
  double graph_score = 0.5;
  double meta_score = 0.5;
  std::vector<std::string> verified_entities;
  std::vector<std::string> inconsistencies;
  // -1 when the domain age could not be established.
  int domain_age_days = -1;
  bool whois_hidden = false;
  bool domain_blacklisted = false;
  bool phishing_hit = false;
  std::vector<SourceClaim> claims;
};

struct SecurityResult {
  double overall_score = 0.5;
  std::vector<std::string> modules_run;
  double js_obfuscation_risk = 0.0;
  bool cross_domain_sensitive_forms = false;
  std::vector<std::string> critical_indicators;
  std::vector<std::string> ioc_hits;
  // Page elements the scanner walked; feeds complexity when scout data is thin.
  std::uint32_t scripts_inspected = 0;
  std::uint32_t iframes_inspected = 0;
};

// Human-readable one-line summaries attached to stage_completed events.
std::string Summarize(const ScoutResult& result);
std::string Summarize(const VisionResult& result);
std::string Summarize(const GraphResult& result);
std::string Summarize(const SecurityResult& result);

} // namespace siteaudit::agents
