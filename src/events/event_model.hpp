#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace siteaudit::events {

// Progress event categories streamed to clients and appended to
// events.jsonl. Consumers key off the serialized names, so keep them stable.
enum class EventType {
  kAuditStarted,
  kStageStarted,
  kStageCompleted,
  kLoopDecision,
  kAuditComplete,
  kAuditError,
  kInfo,
  kWarning,
  kError,
};

// Canonical progress event.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: string key/value attributes (audit_id, stage, summary, ...).
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kInfo;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

std::optional<EventType> ParseEventType(std::string_view raw);

// audit_complete and audit_error end an audit's event stream.
bool IsTerminal(EventType event_type);

} // namespace siteaudit::events
