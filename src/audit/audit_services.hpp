#pragma once

#include "audit/audit_config.hpp"
#include "browser/shared_browser.hpp"
#include "core/clock.hpp"
#include "reputation/reputation_manager.hpp"
#include "resilience/breaker_registry.hpp"
#include "scoring/trust_score_engine.hpp"
#include "timing/complexity_analyzer.hpp"
#include "timing/timeout_manager.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace siteaudit::core::logging {
class Logger;
}

namespace siteaudit::audit {

// Process-wide collaborators shared by every audit: breaker states, timeout
// history, source reputation and the browser instance outlive single runs.
// Everything reachable from here is internally synchronized.
class AuditServices {
public:
  AuditServices(AuditSettings settings, const core::IClock& clock, core::logging::Logger& logger,
                browser::EngineFactory browser_factory);

  AuditServices(const AuditServices&) = delete;
  AuditServices& operator=(const AuditServices&) = delete;

  const AuditSettings& settings() const {
    return settings_;
  }
  const core::IClock& clock() const {
    return clock_;
  }
  core::logging::Logger& logger() const {
    return logger_;
  }
  resilience::BreakerRegistry& breakers() {
    return breakers_;
  }
  timing::TimeoutManager& timeouts() {
    return timeouts_;
  }
  reputation::ReputationManager& reputation() {
    return reputation_;
  }
  browser::SharedBrowser& browser() {
    return browser_;
  }
  const scoring::TrustScoreEngine& scoring_engine() const {
    return scoring_engine_;
  }
  const timing::ComplexityAnalyzer& complexity_analyzer() const {
    return complexity_analyzer_;
  }

  // Unique per process: "audit-<wall ms>-<sequence>".
  std::string NextAuditId();

private:
  const AuditSettings settings_;
  const core::IClock& clock_;
  core::logging::Logger& logger_;
  resilience::BreakerRegistry breakers_;
  timing::TimeoutManager timeouts_;
  reputation::ReputationManager reputation_;
  browser::SharedBrowser browser_;
  scoring::TrustScoreEngine scoring_engine_;
  timing::ComplexityAnalyzer complexity_analyzer_;
  std::atomic<std::uint64_t> next_sequence_{0};
};

} // namespace siteaudit::audit
