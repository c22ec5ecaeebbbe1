#pragma once

#include "resilience/circuit_breaker.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::resilience {

// Process-wide set of breakers keyed by dependency name. Breakers are created
// on first use with the configured (or default) policy and live as long as the
// registry, so failure history is shared across concurrent audits.
class BreakerRegistry {
public:
  BreakerRegistry(const core::IClock& clock, core::logging::Logger& logger);

  BreakerRegistry(const BreakerRegistry&) = delete;
  BreakerRegistry& operator=(const BreakerRegistry&) = delete;

  // Overrides the policy used when `name` is first created. Has no effect on
  // an existing breaker.
  void Configure(std::string name, BreakerConfig config);

  CircuitBreaker& Get(std::string_view name);

  struct Entry {
    std::string name;
    CircuitBreaker::Snapshot snapshot;
  };
  std::vector<Entry> Snapshots() const;

  void ResetAll();

private:
  const core::IClock& clock_;
  core::logging::Logger& logger_;
  mutable std::mutex mu_;
  std::map<std::string, BreakerConfig, std::less<>> configs_;
  std::map<std::string, std::unique_ptr<CircuitBreaker>, std::less<>> breakers_;
};

} // namespace siteaudit::resilience
