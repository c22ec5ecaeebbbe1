#include "audit/audit_session_manager.hpp"

#include "audit/audit_services.hpp"
#include "core/logging/logger.hpp"

#include <system_error>
#include <utility>

namespace siteaudit::audit {

AuditSessionManager::AuditSessionManager(AuditServices& services) : services_(services) {}

AuditSessionManager::~AuditSessionManager() {
  std::map<std::string, std::shared_ptr<Session>, std::less<>> sessions;
  {
    std::lock_guard<std::mutex> lock(mu_);
    sessions.swap(sessions_);
  }
  for (auto& [audit_id, session] : sessions) {
    if (session->worker.joinable()) {
      session->worker.join();
    }
  }
}

bool AuditSessionManager::Start(AuditRequest request, AgentSet agents,
                                events::IEventSink* mirror_sink, std::string& audit_id,
                                std::string& error) {
  error.clear();
  if (request.audit_id.empty()) {
    request.audit_id = services_.NextAuditId();
  }
  audit_id = request.audit_id;

  auto session = std::make_shared<Session>();
  std::vector<events::IEventSink*> sinks{&session->stream};
  if (mirror_sink != nullptr) {
    sinks.push_back(mirror_sink);
  }
  session->fanout = std::make_unique<events::FanoutEventSink>(std::move(sinks));

  std::lock_guard<std::mutex> lock(mu_);
  if (sessions_.find(audit_id) != sessions_.end()) {
    error = "audit id already in use: " + audit_id;
    return false;
  }

  try {
    session->worker = std::thread([this, session, agents, request = std::move(request)]() {
      AuditOrchestrator orchestrator(services_, agents, *session->fanout);
      session->result.ok =
          orchestrator.Run(request, session->result.state, session->result.error);
      session->stream.Close();
    });
  } catch (const std::system_error& ex) {
    error = std::string("failed to start audit thread: ") + ex.what();
    return false;
  }

  sessions_.emplace(audit_id, std::move(session));
  services_.logger().Debug("audit session started", {{"audit_id", audit_id}});
  return true;
}

std::shared_ptr<AuditSessionManager::Session>
AuditSessionManager::Find(std::string_view audit_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = sessions_.find(audit_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool AuditSessionManager::NextEvent(std::string_view audit_id, std::chrono::milliseconds timeout,
                                    events::Event& event) {
  const std::shared_ptr<Session> session = Find(audit_id);
  if (session == nullptr) {
    return false;
  }
  return session->stream.Next(timeout, event);
}

bool AuditSessionManager::Wait(std::string_view audit_id, SessionResult& result,
                               std::string& error) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = sessions_.find(audit_id);
    if (it == sessions_.end()) {
      error = "unknown audit id: " + std::string(audit_id);
      return false;
    }
    session = it->second;
    sessions_.erase(it);
  }

  if (session->worker.joinable()) {
    session->worker.join();
  }
  result = std::move(session->result);
  return true;
}

std::vector<std::string> AuditSessionManager::ActiveAudits() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto& [audit_id, session] : sessions_) {
    ids.push_back(audit_id);
  }
  return ids;
}

} // namespace siteaudit::audit
