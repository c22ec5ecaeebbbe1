#include "agents/sim/sim_agents.hpp"
#include "agents/sim/site_scenario.hpp"
#include "audit/audit_services.hpp"
#include "audit/audit_session_manager.hpp"
#include "common/assertions.hpp"
#include "common/scenario_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "core/clock.hpp"
#include "core/logging/logger.hpp"
#include "events/event_sink.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace common = siteaudit::tests::common;

using siteaudit::agents::sim::ParseSiteScenario;
using siteaudit::agents::sim::SiteScenario;
using siteaudit::audit::AgentSet;
using siteaudit::audit::AuditServices;
using siteaudit::audit::AuditSessionManager;
using siteaudit::audit::SessionResult;
using siteaudit::events::Event;
using siteaudit::events::EventType;
using common::AssertContains;
using common::AssertTrue;
using common::Fail;

namespace {

std::shared_ptr<const SiteScenario> LoadScenario(std::string_view json) {
  auto scenario = std::make_shared<SiteScenario>();
  std::string error;
  if (!ParseSiteScenario(json, *scenario, error)) {
    Fail("fixture scenario should parse: " + error);
  }
  return scenario;
}

struct SimAgents {
  SimAgents(const std::shared_ptr<const SiteScenario>& scenario, AuditServices& services)
      : scout(std::make_shared<siteaudit::agents::sim::SimScoutAgent>(scenario,
                                                                       &services.browser())),
        vision(std::make_shared<siteaudit::agents::sim::SimVisionAgent>(scenario)),
        graph(std::make_shared<siteaudit::agents::sim::SimGraphAgent>(scenario)),
        security(std::make_shared<siteaudit::agents::sim::SimSecurityAgent>(scenario)) {}

  AgentSet Set() {
    return AgentSet{.scout = scout, .vision = vision, .graph = graph, .security = security};
  }

  std::shared_ptr<siteaudit::agents::sim::SimScoutAgent> scout;
  std::shared_ptr<siteaudit::agents::sim::SimVisionAgent> vision;
  std::shared_ptr<siteaudit::agents::sim::SimGraphAgent> graph;
  std::shared_ptr<siteaudit::agents::sim::SimSecurityAgent> security;
};

// Drains one audit's stream. The stream ends after the terminal event.
std::vector<Event> DrainStream(AuditSessionManager& manager, const std::string& audit_id) {
  std::vector<Event> events;
  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(30);
  Event event;
  while (std::chrono::steady_clock::now() < give_up) {
    if (manager.NextEvent(audit_id, std::chrono::milliseconds(100), event)) {
      events.push_back(event);
      if (siteaudit::events::IsTerminal(event.type)) {
        break;
      }
    }
  }
  return events;
}

} // namespace

int main() {
  std::ostringstream log;
  siteaudit::core::logging::Logger logger(siteaudit::core::logging::LogLevel::kInfo, log);
  AuditServices services(siteaudit::audit::DefaultAuditSettings(),
                         siteaudit::core::SystemClock::Instance(), logger,
                         siteaudit::agents::sim::SimBrowserEngineFactory());

  const auto healthy = LoadScenario(common::kHealthyShopScenarioJson);
  const auto scam = LoadScenario(common::kScamShopScenarioJson);
  SimAgents healthy_agents(healthy, services);
  SimAgents scam_agents(scam, services);

  const auto out_dir = common::CreateUniqueTempDir("siteaudit-session-stream");
  siteaudit::events::JsonlEventSink mirror(out_dir / "healthy" / "events.jsonl");

  AuditSessionManager manager(services);
  std::string healthy_id;
  std::string scam_id;
  std::string error;
  if (!manager.Start({.url = healthy->url, .audit_id = "audit-healthy"}, healthy_agents.Set(),
                     &mirror, healthy_id, error)) {
    Fail("failed to start healthy audit: " + error);
  }
  if (!manager.Start({.url = scam->url}, scam_agents.Set(), nullptr, scam_id, error)) {
    Fail("failed to start scam audit: " + error);
  }
  AssertTrue(healthy_id == "audit-healthy", "requested id is used");
  AssertTrue(scam_id != healthy_id && !scam_id.empty(), "generated id is unique");

  std::string duplicate_id;
  if (manager.Start({.url = healthy->url, .audit_id = "audit-healthy"}, healthy_agents.Set(),
                    nullptr, duplicate_id, error)) {
    Fail("duplicate audit ids must be rejected");
  }
  AssertContains(error, "audit id already in use");
  AssertTrue(manager.ActiveAudits().size() == 2U, "two sessions tracked");

  // Both audits run concurrently against the shared services.
  const std::vector<Event> healthy_events = DrainStream(manager, healthy_id);
  const std::vector<Event> scam_events = DrainStream(manager, scam_id);

  for (const auto* events : {&healthy_events, &scam_events}) {
    AssertTrue(!events->empty(), "stream should carry events");
    AssertTrue(events->front().type == EventType::kAuditStarted, "stream starts with audit_started");
    AssertTrue(events->back().type == EventType::kAuditComplete, "stream ends with audit_complete");
  }
  for (const auto& event : healthy_events) {
    AssertTrue(event.payload.at("audit_id") == healthy_id, "healthy stream is not interleaved");
  }
  for (const auto& event : scam_events) {
    AssertTrue(event.payload.at("audit_id") == scam_id, "scam stream is not interleaved");
  }
  AssertTrue(scam_events.back().payload.at("risk_level") == "dangerous", "scam verdict");

  Event after_end;
  if (manager.NextEvent(healthy_id, std::chrono::milliseconds(200), after_end)) {
    Fail("closed stream should yield nothing after the terminal event");
  }

  SessionResult healthy_result;
  if (!manager.Wait(healthy_id, healthy_result, error)) {
    Fail("wait failed: " + error);
  }
  AssertTrue(healthy_result.ok, "healthy audit should succeed");
  AssertTrue(healthy_result.state.trust.has_value(), "healthy result keeps the verdict");
  AssertTrue(healthy_result.state.audit_id == healthy_id, "result audit id");

  SessionResult scam_result;
  if (!manager.Wait(scam_id, scam_result, error)) {
    Fail("wait failed: " + error);
  }
  AssertTrue(scam_result.ok, "scam audit should succeed");
  AssertTrue(manager.ActiveAudits().empty(), "waited sessions are forgotten");

  if (manager.Wait(scam_id, scam_result, error)) {
    Fail("second wait on the same id must fail");
  }
  AssertContains(error, "unknown audit id");

  const std::string mirrored =
      common::ReadFileToString(out_dir / "healthy" / "events.jsonl");
  AssertContains(mirrored, "\"type\":\"audit_started\"");
  AssertContains(mirrored, "\"type\":\"audit_complete\"");
  AssertContains(mirrored, "\"audit_id\":\"audit-healthy\"");

  common::RemovePathBestEffort(out_dir);
  std::cout << "audit_session_stream_smoke: ok\n";
  return 0;
}
