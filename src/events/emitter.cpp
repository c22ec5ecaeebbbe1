#include "events/emitter.hpp"

#include "core/time_utils.hpp"

#include <utility>

namespace siteaudit::events {

namespace {

std::string JoinComma(const std::vector<std::string>& values) {
  std::string joined;
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += value;
  }
  return joined;
}

} // namespace

Emitter::Emitter(IEventSink& sink, std::string audit_id)
    : sink_(sink), audit_id_(std::move(audit_id)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) const {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  event.payload["audit_id"] = audit_id_;
  return sink_.Send(event, error);
}

bool Emitter::EmitAuditStarted(const AuditStartedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kAuditStarted, event.ts,
                 {
                     {"url", event.url},
                     {"tier", event.tier},
                     {"verdict_mode", event.verdict_mode},
                     {"max_iterations", std::to_string(event.max_iterations)},
                     {"max_external_calls", std::to_string(event.max_external_calls)},
                     {"max_pages", std::to_string(event.max_pages)},
                 },
                 error);
}

bool Emitter::EmitStageStarted(const StageStartedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kStageStarted, event.ts,
                 {
                     {"stage", event.stage},
                     {"iteration", std::to_string(event.iteration)},
                     {"agents", JoinComma(event.agents)},
                     {"deadline_ms", std::to_string(event.deadline_ms)},
                     {"eta_ms", std::to_string(event.eta_ms)},
                 },
                 error);
}

bool Emitter::EmitStageCompleted(const StageCompletedEvent& event, std::string& error) const {
  std::map<std::string, std::string> payload = {
      {"stage", event.stage},
      {"iteration", std::to_string(event.iteration)},
      {"elapsed_ms", std::to_string(event.elapsed_ms)},
      {"degraded", event.degraded.empty() ? "false" : "true"},
      {"quality_penalty", core::FormatFixedDouble(event.quality_penalty, 3)},
      {"summary", event.summary},
      {"eta_ms", std::to_string(event.eta_ms)},
  };

  // Prefix per-agent fallback modes so stage-level keys stay unambiguous.
  for (const auto& [agent, mode] : event.degraded) {
    payload["fallback." + agent] = mode;
  }
  return EmitRaw(EventType::kStageCompleted, event.ts, std::move(payload), error);
}

bool Emitter::EmitLoopDecision(const LoopDecisionEvent& event, std::string& error) const {
  return EmitRaw(EventType::kLoopDecision, event.ts,
                 {
                     {"iteration", std::to_string(event.iteration)},
                     {"decision", event.decision},
                     {"reason", event.reason},
                     {"next_urls", JoinComma(event.next_urls)},
                 },
                 error);
}

bool Emitter::EmitAuditComplete(const AuditCompleteEvent& event, std::string& error) const {
  return EmitRaw(EventType::kAuditComplete, event.ts,
                 {
                     {"final_score", std::to_string(event.final_score)},
                     {"risk_level", event.risk_level},
                     {"confidence", core::FormatFixedDouble(event.confidence, 3)},
                     {"iterations", std::to_string(event.iterations)},
                     {"external_calls", std::to_string(event.external_calls)},
                     {"elapsed_ms", std::to_string(event.elapsed_ms)},
                     {"overrides", JoinComma(event.overrides)},
                     {"degraded_agents", JoinComma(event.degraded_agents)},
                     {"narrative", event.narrative},
                 },
                 error);
}

bool Emitter::EmitAuditError(const AuditErrorEvent& event, std::string& error) const {
  return EmitRaw(EventType::kAuditError, event.ts,
                 {
                     {"stage", event.stage},
                     {"message", event.message},
                 },
                 error);
}

} // namespace siteaudit::events
