#pragma once

#include "agents/evidence.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::agents::sim {

// Per-agent fault injection knobs.
struct SimFaultConfig {
  // Fail the first N calls, then behave normally.
  std::uint32_t fail_first_n = 0;
  bool always_fail = false;
  // Block until the stage is cancelled.
  bool hang = false;
  std::uint64_t latency_ms = 0;
  bool throw_exception = false;
  std::string error_message = "injected failure";
};

// Scripted website used by the simulation agents. Pages are keyed by URL; a
// follow-up URL without a scripted page captures as HTTP 404.
struct SiteScenario {
  std::string url;
  std::string site_type_hint;
  std::vector<std::string> entities;
  std::map<std::string, std::string> metadata;
  std::map<std::string, PageCapture> pages;

  // Raw vision-model text per screenshot path; `default_vision_response`
  // answers for screenshots without an entry.
  std::map<std::string, std::string> vision_responses;
  std::string default_vision_response = R"({"detected": false})";

  GraphResult graph;
  // Absent means the security agent reports neutral results for whatever
  // modules it is asked to run.
  std::optional<SecurityResult> security;

  // Keys: scout, vision, graph, security.
  std::map<std::string, SimFaultConfig> faults;
};

// Parses site scenario JSON.
//
// Contract:
// - true: `scenario` fully populated.
// - false: `error` names the offending field path.
bool ParseSiteScenario(std::string_view json_text, SiteScenario& scenario, std::string& error);

bool LoadSiteScenario(const std::string& path, SiteScenario& scenario, std::string& error);

} // namespace siteaudit::agents::sim
