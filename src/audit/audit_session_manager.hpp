#pragma once

#include "audit/audit_orchestrator.hpp"
#include "audit/audit_state.hpp"
#include "events/event_model.hpp"
#include "events/event_sink.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace siteaudit::audit {

class AuditServices;

struct SessionResult {
  bool ok = false;
  std::string error;
  AuditState state;
};

// Runs audits in the background and exposes their progress as an event
// stream, one in-memory queue per audit.
//
// Each audit runs on its own thread against the shared AuditServices. The
// agents handed to Start() must stay alive until Wait() returns for that
// audit (or the manager is destroyed).
class AuditSessionManager {
public:
  explicit AuditSessionManager(AuditServices& services);
  ~AuditSessionManager();

  AuditSessionManager(const AuditSessionManager&) = delete;
  AuditSessionManager& operator=(const AuditSessionManager&) = delete;

  // Starts one audit. `mirror_sink` (optional) also receives every event,
  // e.g. a JsonlEventSink.
  //
  // Contract:
  // - true: `audit_id` identifies the running audit.
  // - false: `error` explains (duplicate audit id, thread start failure).
  bool Start(AuditRequest request, AgentSet agents, events::IEventSink* mirror_sink,
             std::string& audit_id, std::string& error);

  // Blocks up to `timeout` for the audit's next event. Returns false on
  // timeout, for unknown ids, and once the stream has ended (after
  // audit_complete or audit_error has been delivered).
  bool NextEvent(std::string_view audit_id, std::chrono::milliseconds timeout,
                 events::Event& event);

  // Joins the audit thread and moves its result out. The session is
  // forgotten afterwards.
  bool Wait(std::string_view audit_id, SessionResult& result, std::string& error);

  std::vector<std::string> ActiveAudits() const;

private:
  struct Session {
    events::BufferedEventSink stream;
    std::unique_ptr<events::FanoutEventSink> fanout;
    SessionResult result;
    std::thread worker;
  };

  std::shared_ptr<Session> Find(std::string_view audit_id) const;

  AuditServices& services_;
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Session>, std::less<>> sessions_;
};

} // namespace siteaudit::audit
