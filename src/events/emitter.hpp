#pragma once

#include "events/event_model.hpp"
#include "events/event_sink.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace siteaudit::events {

// Thin event facade used by the audit orchestrator so every progress event
// carries the same payload keys regardless of which sink receives it.
class Emitter {
public:
  struct AuditStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string url;
    std::string tier;
    std::string verdict_mode;
    std::uint32_t max_iterations = 0;
    std::uint32_t max_external_calls = 0;
    std::uint32_t max_pages = 0;
  };

  struct StageStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string stage;
    std::uint32_t iteration = 0;
    std::vector<std::string> agents;
    std::uint64_t deadline_ms = 0;
    // Estimated time until the iteration's verdict, this stage included.
    std::uint64_t eta_ms = 0;
  };

  struct StageCompletedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string stage;
    std::uint32_t iteration = 0;
    std::uint64_t elapsed_ms = 0;
    // Agent name -> fallback mode, for agents whose payload was degraded.
    std::map<std::string, std::string> degraded;
    double quality_penalty = 0.0;
    std::string summary;
    // Estimated time for the stages still pending in this iteration.
    std::uint64_t eta_ms = 0;
  };

  struct LoopDecisionEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint32_t iteration = 0;
    std::string decision;
    std::string reason;
    std::vector<std::string> next_urls;
  };

  struct AuditCompleteEvent {
    std::chrono::system_clock::time_point ts{};
    int final_score = 0;
    std::string risk_level;
    double confidence = 0.0;
    std::uint32_t iterations = 0;
    std::uint32_t external_calls = 0;
    std::uint64_t elapsed_ms = 0;
    std::vector<std::string> overrides;
    std::vector<std::string> degraded_agents;
    std::string narrative;
  };

  struct AuditErrorEvent {
    std::chrono::system_clock::time_point ts{};
    std::string stage;
    std::string message;
  };

  Emitter(IEventSink& sink, std::string audit_id);

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error) const;

  bool EmitAuditStarted(const AuditStartedEvent& event, std::string& error) const;
  bool EmitStageStarted(const StageStartedEvent& event, std::string& error) const;
  bool EmitStageCompleted(const StageCompletedEvent& event, std::string& error) const;
  bool EmitLoopDecision(const LoopDecisionEvent& event, std::string& error) const;
  bool EmitAuditComplete(const AuditCompleteEvent& event, std::string& error) const;
  bool EmitAuditError(const AuditErrorEvent& event, std::string& error) const;

  const std::string& audit_id() const {
    return audit_id_;
  }

private:
  IEventSink& sink_;
  const std::string audit_id_;
};

} // namespace siteaudit::events
