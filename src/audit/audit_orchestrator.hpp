#pragma once

#include "agents/agent_contracts.hpp"
#include "audit/audit_config.hpp"
#include "audit/audit_state.hpp"
#include "events/event_sink.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace siteaudit::audit {

class AuditServices;

struct AuditRequest {
  std::string url;
  AuditTier tier = AuditTier::kStandardAudit;
  agents::VerdictMode verdict_mode = agents::VerdictMode::kExpert;
  // Empty: detect from the scout hint (unknown hints fall back to general).
  // Set: must name a configured site type.
  std::string site_type;
  bool run_security = true;
  // Empty: the settings' default module list.
  std::vector<std::string> security_modules;
  std::optional<AuditBudget> budget_override;
  // Empty: generated by AuditServices.
  std::string audit_id;
};

// Agents consumed by one orchestrator. Scout, vision and graph are required.
// A null security agent skips the security stage; a null judge selects the
// built-in EvidenceJudge.
//
// Agents are shared with the stage workers: a worker abandoned after its
// deadline keeps its agent alive until the call returns, even when the caller
// has already released the AgentSet.
struct AgentSet {
  std::shared_ptr<agents::IScoutAgent> scout;
  std::shared_ptr<agents::IVisionAgent> vision;
  std::shared_ptr<agents::IGraphAgent> graph;
  std::shared_ptr<agents::ISecurityAgent> security;
  std::shared_ptr<agents::IJudgeAgent> judge;
};

// Drives one audit through SCOUT -> INVESTIGATE (vision || graph || security)
// -> JUDGE -> {LOOP -> SCOUT | DONE}. Every agent call goes through a
// DegradationManager, so agent failures become degraded payloads and never end
// the audit. Budget exhaustion forces a verdict from what was gathered.
class AuditOrchestrator {
public:
  AuditOrchestrator(AuditServices& services, AgentSet agents, events::IEventSink& sink);

  // Contract:
  // - true: state DONE with a trust result; `audit_complete` emitted.
  // - false: state ERROR (invalid request, unknown site type, no verdict
  //   possible); `error` explains and `audit_error` emitted.
  bool Run(const AuditRequest& request, AuditState& state, std::string& error);

private:
  AuditServices& services_;
  const AgentSet agents_;
  events::IEventSink& sink_;
};

} // namespace siteaudit::audit
