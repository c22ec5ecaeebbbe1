#include "audit/audit_services.hpp"

#include "core/logging/logger.hpp"

#include <chrono>
#include <utility>

namespace siteaudit::audit {

AuditServices::AuditServices(AuditSettings settings, const core::IClock& clock,
                             core::logging::Logger& logger, browser::EngineFactory browser_factory)
    : settings_(std::move(settings)),
      clock_(clock),
      logger_(logger),
      breakers_(clock, logger),
      timeouts_(settings_.timeouts),
      reputation_(clock, logger),
      browser_(std::move(browser_factory), logger),
      scoring_engine_(settings_.profiles, logger) {
  for (const auto& [agent, config] : settings_.breakers) {
    breakers_.Configure(agent, config);
  }
  logger_.Debug("audit services ready",
                {{"timeout_strategy", timing::ToString(settings_.timeout_strategy)},
                 {"site_types", std::to_string(settings_.profiles.size())}});
}

std::string AuditServices::NextAuditId() {
  const auto wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           clock_.NowWall().time_since_epoch())
                           .count();
  const std::uint64_t sequence = ++next_sequence_;
  return "audit-" + std::to_string(wall_ms) + "-" + std::to_string(sequence);
}

} // namespace siteaudit::audit
