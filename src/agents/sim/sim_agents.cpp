#include "agents/sim/sim_agents.hpp"

#include "agents/vision_response_parser.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace siteaudit::agents::sim {

namespace {

constexpr auto kHangPollInterval = std::chrono::milliseconds(20);

SimFaultConfig FaultsFor(const SiteScenario& scenario, const std::string& agent) {
  const auto it = scenario.faults.find(agent);
  return it == scenario.faults.end() ? SimFaultConfig{} : it->second;
}

} // namespace

FaultInjector::FaultInjector(SimFaultConfig config) : config_(std::move(config)) {}

bool FaultInjector::BeforeCall(const core::CancelToken& cancel, std::string& error) {
  std::uint64_t call_number = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    call_number = ++calls_;
  }

  if (config_.latency_ms > 0U && cancel.WaitFor(std::chrono::milliseconds(config_.latency_ms))) {
    error = "cancelled during simulated latency";
    return false;
  }
  if (config_.hang) {
    while (!cancel.WaitFor(kHangPollInterval)) {
    }
    error = "cancelled while hung";
    return false;
  }
  if (config_.throw_exception) {
    throw std::runtime_error(config_.error_message);
  }
  if (config_.always_fail || call_number <= config_.fail_first_n) {
    error = config_.error_message;
    return false;
  }
  return true;
}

std::uint64_t FaultInjector::calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return calls_;
}

bool SimBrowserEngine::OpenPage(const std::string& url, std::string& error) {
  if (url.empty()) {
    error = "empty url";
    return false;
  }
  return true;
}

browser::EngineFactory SimBrowserEngineFactory() {
  return [](std::unique_ptr<browser::IBrowserEngine>& engine, std::string&) {
    engine = std::make_unique<SimBrowserEngine>();
    return true;
  };
}

SimScoutAgent::SimScoutAgent(std::shared_ptr<const SiteScenario> scenario,
                             browser::SharedBrowser* browser)
    : scenario_(std::move(scenario)), browser_(browser), faults_(FaultsFor(*scenario_, "scout")) {}

bool SimScoutAgent::Capture(const ScoutRequest& request, const core::CancelToken& cancel,
                            ScoutResult& result, std::string& error) {
  browser::SharedBrowser::Lease lease;
  if (browser_ != nullptr) {
    if (!browser_->Acquire(lease, error) || !lease.OpenPage(request.url, error)) {
      return false;
    }
  }
  if (!faults_.BeforeCall(cancel, error)) {
    return false;
  }

  result = ScoutResult{};
  const auto it = scenario_->pages.find(request.url);
  if (it != scenario_->pages.end()) {
    result.pages.push_back(it->second);
  } else {
    PageCapture missing;
    missing.url = request.url;
    missing.http_status = 404;
    missing.tls = TlsStatus::kUnknown;
    result.pages.push_back(std::move(missing));
  }
  result.site_type_hint = scenario_->site_type_hint;
  result.entities = scenario_->entities;
  result.metadata = scenario_->metadata;
  return true;
}

SimVisionAgent::SimVisionAgent(std::shared_ptr<const SiteScenario> scenario)
    : scenario_(std::move(scenario)), faults_(FaultsFor(*scenario_, "vision")) {}

bool SimVisionAgent::Analyze(const VisionRequest& request, const core::CancelToken& cancel,
                             VisionResult& result, std::string& error) {
  if (!faults_.BeforeCall(cancel, error)) {
    return false;
  }
  if (request.screenshot_paths.empty()) {
    result = VisionResult{};
    return true;
  }

  std::vector<ScreenshotResponse> responses;
  responses.reserve(request.screenshot_paths.size());
  for (const auto& screenshot : request.screenshot_paths) {
    const auto it = scenario_->vision_responses.find(screenshot);
    responses.push_back(ScreenshotResponse{
        .screenshot = screenshot,
        .raw_text = it == scenario_->vision_responses.end() ? scenario_->default_vision_response
                                                            : it->second,
    });
  }
  result = BuildVisionResult(responses);
  return true;
}

SimGraphAgent::SimGraphAgent(std::shared_ptr<const SiteScenario> scenario)
    : scenario_(std::move(scenario)), faults_(FaultsFor(*scenario_, "graph")) {}

bool SimGraphAgent::Investigate(const GraphRequest&, const core::CancelToken& cancel,
                                GraphResult& result, std::string& error) {
  if (!faults_.BeforeCall(cancel, error)) {
    return false;
  }
  result = scenario_->graph;
  return true;
}

SimSecurityAgent::SimSecurityAgent(std::shared_ptr<const SiteScenario> scenario)
    : scenario_(std::move(scenario)), faults_(FaultsFor(*scenario_, "security")) {}

bool SimSecurityAgent::Scan(const SecurityRequest& request, const core::CancelToken& cancel,
                            SecurityResult& result, std::string& error) {
  if (!faults_.BeforeCall(cancel, error)) {
    return false;
  }
  if (scenario_->security.has_value()) {
    result = *scenario_->security;
  } else {
    result = SecurityResult{};
  }
  if (result.modules_run.empty()) {
    result.modules_run = request.modules;
  }
  return true;
}

} // namespace siteaudit::agents::sim
