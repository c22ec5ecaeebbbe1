#include "resilience/breaker_registry.hpp"

namespace siteaudit::resilience {

BreakerRegistry::BreakerRegistry(const core::IClock& clock, core::logging::Logger& logger)
    : clock_(clock), logger_(logger) {}

void BreakerRegistry::Configure(std::string name, const BreakerConfig config) {
  std::lock_guard<std::mutex> lock(mu_);
  configs_[std::move(name)] = config;
}

CircuitBreaker& BreakerRegistry::Get(std::string_view name) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = breakers_.find(name);
  if (it != breakers_.end()) {
    return *it->second;
  }

  const auto config_it = configs_.find(name);
  const BreakerConfig config =
      config_it != configs_.end() ? config_it->second : DefaultBreakerConfigFor(name);
  auto breaker = std::make_unique<CircuitBreaker>(std::string(name), config, clock_, logger_);
  CircuitBreaker& ref = *breaker;
  breakers_.emplace(std::string(name), std::move(breaker));
  return ref;
}

std::vector<BreakerRegistry::Entry> BreakerRegistry::Snapshots() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Entry> entries;
  entries.reserve(breakers_.size());
  for (const auto& [name, breaker] : breakers_) {
    entries.push_back({.name = name, .snapshot = breaker->GetSnapshot()});
  }
  return entries;
}

void BreakerRegistry::ResetAll() {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& [name, breaker] : breakers_) {
    (void)name;
    breaker->Reset();
  }
}

} // namespace siteaudit::resilience
