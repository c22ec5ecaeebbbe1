#pragma once

#include "agents/agent_contracts.hpp"
#include "agents/sim/site_scenario.hpp"
#include "browser/shared_browser.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace siteaudit::agents::sim {

// Applies one agent's SimFaultConfig to each call. Thread-safe; counts calls
// across the whole audit so `fail_first_n` spans iterations.
class FaultInjector {
public:
  explicit FaultInjector(SimFaultConfig config);

  // Contract:
  // - true: the call should proceed normally.
  // - false: injected failure (or cancellation during injected latency/hang);
  //   `error` explains.
  // Throws std::runtime_error when `throw_exception` is set.
  bool BeforeCall(const core::CancelToken& cancel, std::string& error);

  std::uint64_t calls() const;

private:
  const SimFaultConfig config_;
  mutable std::mutex mu_;
  std::uint64_t calls_ = 0;
};

// Deterministic in-process browser engine; every page opens instantly.
class SimBrowserEngine final : public browser::IBrowserEngine {
public:
  std::string Name() const override {
    return "sim";
  }
  bool OpenPage(const std::string& url, std::string& error) override;
};

browser::EngineFactory SimBrowserEngineFactory();

class SimScoutAgent final : public IScoutAgent {
public:
  // `browser` may be null; when set every capture holds a lease on it.
  SimScoutAgent(std::shared_ptr<const SiteScenario> scenario, browser::SharedBrowser* browser);

  bool Capture(const ScoutRequest& request, const core::CancelToken& cancel, ScoutResult& result,
               std::string& error) override;

private:
  std::shared_ptr<const SiteScenario> scenario_;
  browser::SharedBrowser* browser_;
  FaultInjector faults_;
};

// Feeds scripted raw model text through ParseVisionResponse.
class SimVisionAgent final : public IVisionAgent {
public:
  explicit SimVisionAgent(std::shared_ptr<const SiteScenario> scenario);

  bool Analyze(const VisionRequest& request, const core::CancelToken& cancel,
               VisionResult& result, std::string& error) override;

private:
  std::shared_ptr<const SiteScenario> scenario_;
  FaultInjector faults_;
};

class SimGraphAgent final : public IGraphAgent {
public:
  explicit SimGraphAgent(std::shared_ptr<const SiteScenario> scenario);

  bool Investigate(const GraphRequest& request, const core::CancelToken& cancel,
                   GraphResult& result, std::string& error) override;

private:
  std::shared_ptr<const SiteScenario> scenario_;
  FaultInjector faults_;
};

class SimSecurityAgent final : public ISecurityAgent {
public:
  explicit SimSecurityAgent(std::shared_ptr<const SiteScenario> scenario);

  bool Scan(const SecurityRequest& request, const core::CancelToken& cancel,
            SecurityResult& result, std::string& error) override;

private:
  std::shared_ptr<const SiteScenario> scenario_;
  FaultInjector faults_;
};

} // namespace siteaudit::agents::sim
