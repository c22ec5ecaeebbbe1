#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <array>
#include <sstream>

namespace siteaudit::events {

namespace {

constexpr std::array<EventType, 9> kAllEventTypes{
    EventType::kAuditStarted,  EventType::kStageStarted, EventType::kStageCompleted,
    EventType::kLoopDecision,  EventType::kAuditComplete, EventType::kAuditError,
    EventType::kInfo,          EventType::kWarning,       EventType::kError,
};

} // namespace

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kAuditStarted:
    return "audit_started";
  case EventType::kStageStarted:
    return "stage_started";
  case EventType::kStageCompleted:
    return "stage_completed";
  case EventType::kLoopDecision:
    return "loop_decision";
  case EventType::kAuditComplete:
    return "audit_complete";
  case EventType::kAuditError:
    return "audit_error";
  case EventType::kInfo:
    return "info";
  case EventType::kWarning:
    return "warning";
  case EventType::kError:
    return "error";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // std::map keeps key order stable across runs.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

std::optional<EventType> ParseEventType(std::string_view raw) {
  for (const EventType type : kAllEventTypes) {
    if (ToJson(type) == raw) {
      return type;
    }
  }
  return std::nullopt;
}

bool IsTerminal(EventType event_type) {
  return event_type == EventType::kAuditComplete || event_type == EventType::kAuditError;
}

} // namespace siteaudit::events
