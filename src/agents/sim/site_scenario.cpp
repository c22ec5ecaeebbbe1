#include "agents/sim/site_scenario.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <array>
#include <limits>

namespace siteaudit::agents::sim {

namespace {

using JsonValue = core::json::Value;

constexpr std::array<std::string_view, 4> kFaultableAgents{"scout", "vision", "graph",
                                                          "security"};

bool ReadCount(const JsonValue& object, std::string_view key, std::string_view path,
               std::uint32_t& out, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return true;
  }
  std::uint64_t parsed = 0;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed) ||
      parsed > std::numeric_limits<std::uint32_t>::max()) {
    error = std::string(path) + "." + std::string(key) + " must be a non-negative integer";
    return false;
  }
  out = static_cast<std::uint32_t>(parsed);
  return true;
}

bool ReadMillis(const JsonValue& object, std::string_view key, std::string_view path,
                std::uint64_t& out, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return true;
  }
  if (!core::json::TryGetNonNegativeInteger(*field, out)) {
    error = std::string(path) + "." + std::string(key) + " must be a non-negative integer";
    return false;
  }
  return true;
}

bool ReadUnitScore(const JsonValue& object, std::string_view key, std::string_view path,
                   double& out, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return true;
  }
  if (!field->IsNumber() || field->number_value < 0.0 || field->number_value > 1.0) {
    error = std::string(path) + "." + std::string(key) + " must be a number in [0,1]";
    return false;
  }
  out = field->number_value;
  return true;
}

bool ParseTls(std::string_view raw, TlsStatus& tls) {
  if (raw == "valid") {
    tls = TlsStatus::kValid;
  } else if (raw == "none") {
    tls = TlsStatus::kNone;
  } else if (raw == "invalid") {
    tls = TlsStatus::kInvalid;
  } else if (raw == "self_signed") {
    tls = TlsStatus::kSelfSigned;
  } else if (raw == "unknown") {
    tls = TlsStatus::kUnknown;
  } else {
    return false;
  }
  return true;
}

bool ParsePage(const JsonValue& item, const std::string& path, PageCapture& page,
               std::string& error) {
  if (!item.IsObject()) {
    error = path + " must be an object";
    return false;
  }
  page.url = core::json::StringOr(item, "url", "");
  if (page.url.empty()) {
    error = path + ".url is required";
    return false;
  }
  page.title = core::json::StringOr(item, "title", "");
  page.http_status = static_cast<int>(core::json::NumberOr(item, "http_status", 200.0));
  page.screenshot_paths = core::json::StringArrayOr(item, "screenshots");
  page.discovered_links = core::json::StringArrayOr(item, "links");

  const std::string tls = core::json::StringOr(item, "tls", "unknown");
  if (!ParseTls(tls, page.tls)) {
    error = path + ".tls must be one of valid|none|invalid|self_signed|unknown";
    return false;
  }

  std::uint64_t load_time_ms = 0;
  std::uint64_t network_idle_ms = 0;
  if (!ReadCount(item, "dom_depth", path, page.dom_depth, error) ||
      !ReadCount(item, "dom_nodes", path, page.dom_node_count, error) ||
      !ReadCount(item, "scripts", path, page.script_count, error) ||
      !ReadCount(item, "stylesheets", path, page.stylesheet_count, error) ||
      !ReadCount(item, "inline_styles", path, page.inline_style_count, error) ||
      !ReadCount(item, "iframes", path, page.iframe_count, error) ||
      !ReadCount(item, "forms", path, page.form_count, error) ||
      !ReadCount(item, "lazy_load_cycles", path, page.lazy_load_cycles, error) ||
      !ReadCount(item, "viewport_changes", path, page.viewport_changes, error) ||
      !ReadCount(item, "redirect_hops", path, page.redirect_hops, error) ||
      !ReadCount(item, "external_resources", path, page.external_resource_count, error) ||
      !ReadMillis(item, "load_time_ms", path, load_time_ms, error) ||
      !ReadMillis(item, "network_idle_ms", path, network_idle_ms, error)) {
    return false;
  }
  page.load_time_ms = load_time_ms;
  page.network_idle_ms = network_idle_ms;
  page.has_lazy_load = core::json::BoolOr(item, "lazy_load", page.lazy_load_cycles > 0U);
  page.has_countdown_timer = core::json::BoolOr(item, "countdown_timer", false);
  page.has_animation = core::json::BoolOr(item, "animation", false);
  page.captcha_blocked = core::json::BoolOr(item, "captcha_blocked", false);
  page.sensitive_form_cross_domain =
      core::json::BoolOr(item, "cross_domain_sensitive_form", false);
  return true;
}

bool ParseGraph(const JsonValue& object, GraphResult& graph, std::string& error) {
  if (!object.IsObject()) {
    error = "graph must be an object";
    return false;
  }
  if (!ReadUnitScore(object, "graph_score", "graph", graph.graph_score, error) ||
      !ReadUnitScore(object, "meta_score", "graph", graph.meta_score, error)) {
    return false;
  }
  graph.verified_entities = core::json::StringArrayOr(object, "verified_entities");
  graph.inconsistencies = core::json::StringArrayOr(object, "inconsistencies");
  graph.domain_age_days = static_cast<int>(core::json::NumberOr(object, "domain_age_days", -1.0));
  graph.whois_hidden = core::json::BoolOr(object, "whois_hidden", false);
  graph.domain_blacklisted = core::json::BoolOr(object, "domain_blacklisted", false);
  graph.phishing_hit = core::json::BoolOr(object, "phishing_hit", false);

  const JsonValue* claims = core::json::FindMember(object, "claims");
  if (claims == nullptr) {
    return true;
  }
  if (!claims->IsArray()) {
    error = "graph.claims must be an array";
    return false;
  }
  for (std::size_t i = 0; i < claims->array_value.size(); ++i) {
    const JsonValue& item = claims->array_value[i];
    const std::string path = "graph.claims[" + std::to_string(i) + "]";
    if (!item.IsObject()) {
      error = path + " must be an object";
      return false;
    }
    SourceClaim claim;
    claim.source = core::json::StringOr(item, "source", "");
    if (claim.source.empty()) {
      error = path + ".source is required";
      return false;
    }
    std::string verdict_error;
    if (!reputation::ParseVerdict(core::json::StringOr(item, "verdict", "unknown"), claim.verdict,
                                  verdict_error)) {
      error = path + ".verdict: " + verdict_error;
      return false;
    }
    claim.confidence = 0.0;
    if (!ReadUnitScore(item, "confidence", path, claim.confidence, error)) {
      return false;
    }
    claim.detail = core::json::StringOr(item, "detail", "");
    graph.claims.push_back(std::move(claim));
  }
  return true;
}

bool ParseSecurity(const JsonValue& object, SecurityResult& security, std::string& error) {
  if (!object.IsObject()) {
    error = "security must be an object";
    return false;
  }
  if (!ReadUnitScore(object, "overall_score", "security", security.overall_score, error) ||
      !ReadUnitScore(object, "js_obfuscation_risk", "security", security.js_obfuscation_risk,
                     error) ||
      !ReadCount(object, "scripts", "security", security.scripts_inspected, error) ||
      !ReadCount(object, "iframes", "security", security.iframes_inspected, error)) {
    return false;
  }
  security.modules_run = core::json::StringArrayOr(object, "modules");
  security.cross_domain_sensitive_forms =
      core::json::BoolOr(object, "cross_domain_sensitive_forms", false);
  security.critical_indicators = core::json::StringArrayOr(object, "critical_indicators");
  security.ioc_hits = core::json::StringArrayOr(object, "ioc_hits");
  return true;
}

bool ParseFaults(const JsonValue& object, std::map<std::string, SimFaultConfig>& faults,
                 std::string& error) {
  if (!object.IsObject()) {
    error = "faults must be an object";
    return false;
  }
  for (const auto& [agent, value] : object.object_value) {
    const std::string path = "faults." + agent;
    if (std::find(kFaultableAgents.begin(), kFaultableAgents.end(), agent) ==
        kFaultableAgents.end()) {
      error = path + " is not a fault-injectable agent (scout|vision|graph|security)";
      return false;
    }
    if (!value.IsObject()) {
      error = path + " must be an object";
      return false;
    }
    SimFaultConfig config;
    if (!ReadCount(value, "fail_first_n", path, config.fail_first_n, error) ||
        !ReadMillis(value, "latency_ms", path, config.latency_ms, error)) {
      return false;
    }
    config.always_fail = core::json::BoolOr(value, "always_fail", false);
    config.hang = core::json::BoolOr(value, "hang", false);
    config.throw_exception = core::json::BoolOr(value, "throw", false);
    config.error_message = core::json::StringOr(value, "error", config.error_message);
    faults[agent] = std::move(config);
  }
  return true;
}

} // namespace

bool ParseSiteScenario(std::string_view json_text, SiteScenario& scenario, std::string& error) {
  scenario = SiteScenario{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid site scenario JSON: " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "site scenario root must be an object";
    return false;
  }

  scenario.url = core::json::StringOr(root, "url", "");
  if (scenario.url.empty()) {
    error = "url is required";
    return false;
  }
  scenario.site_type_hint = core::json::StringOr(root, "site_type", "");
  scenario.entities = core::json::StringArrayOr(root, "entities");

  if (const JsonValue* metadata = core::json::FindMember(root, "metadata"); metadata != nullptr) {
    if (!metadata->IsObject()) {
      error = "metadata must be an object";
      return false;
    }
    for (const auto& [key, value] : metadata->object_value) {
      if (!value.IsString()) {
        error = "metadata." + key + " must be a string";
        return false;
      }
      scenario.metadata[key] = value.string_value;
    }
  }

  const JsonValue* pages = core::json::FindMember(root, "pages");
  if (pages == nullptr || !pages->IsArray() || pages->array_value.empty()) {
    error = "pages must be a non-empty array";
    return false;
  }
  for (std::size_t i = 0; i < pages->array_value.size(); ++i) {
    PageCapture page;
    if (!ParsePage(pages->array_value[i], "pages[" + std::to_string(i) + "]", page, error)) {
      return false;
    }
    scenario.pages[page.url] = std::move(page);
  }
  if (scenario.pages.find(scenario.url) == scenario.pages.end()) {
    error = "pages must include the landing url " + scenario.url;
    return false;
  }

  if (const JsonValue* vision = core::json::FindMember(root, "vision"); vision != nullptr) {
    if (!vision->IsObject()) {
      error = "vision must be an object";
      return false;
    }
    scenario.default_vision_response =
        core::json::StringOr(*vision, "default_response", scenario.default_vision_response);
    if (const JsonValue* responses = core::json::FindMember(*vision, "responses");
        responses != nullptr) {
      if (!responses->IsObject()) {
        error = "vision.responses must be an object keyed by screenshot path";
        return false;
      }
      for (const auto& [screenshot, text] : responses->object_value) {
        if (!text.IsString()) {
          error = "vision.responses." + screenshot + " must be a string";
          return false;
        }
        scenario.vision_responses[screenshot] = text.string_value;
      }
    }
  }

  if (const JsonValue* graph = core::json::FindMember(root, "graph"); graph != nullptr) {
    if (!ParseGraph(*graph, scenario.graph, error)) {
      return false;
    }
  }

  if (const JsonValue* security = core::json::FindMember(root, "security"); security != nullptr) {
    SecurityResult parsed;
    if (!ParseSecurity(*security, parsed, error)) {
      return false;
    }
    scenario.security = std::move(parsed);
  }

  if (const JsonValue* faults = core::json::FindMember(root, "faults"); faults != nullptr) {
    if (!ParseFaults(*faults, scenario.faults, error)) {
      return false;
    }
  }
  return true;
}

bool LoadSiteScenario(const std::string& path, SiteScenario& scenario, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return false;
  }
  if (!ParseSiteScenario(contents, scenario, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

} // namespace siteaudit::agents::sim
