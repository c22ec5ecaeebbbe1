#pragma once

#include "agents/evidence.hpp"
#include "core/cancellation.hpp"
#include "scoring/trust_score_result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::agents {

// Interfaces the audit core consumes. Browser automation, vision models and
// entity verification live behind these seams; the core only sees typed
// results or a failure (false + error, or an exception) that the resilience
// layer turns into a degraded stage.
//
// Every call receives the stage cancel token. Implementations should poll it
// during long waits; a call that ignores it is abandoned after the grace
// period and counted as a timeout. The abandoned worker holds a shared_ptr to
// the agent, so the call may finish after the audit has returned.

struct ScoutRequest {
  std::string url;
  // 0 for the landing page, then one per follow-up page in the loop.
  std::uint32_t page_index = 0;
  std::uint32_t viewport_width = 1920;
  std::uint32_t viewport_height = 1080;
  bool capture_scroll_sequence = true;
};

struct VisionRequest {
  std::string url;
  std::vector<std::string> screenshot_paths;
  std::vector<std::string> taxonomy_subset;
  std::string site_type;
};

struct GraphRequest {
  std::string domain;
  std::vector<std::string> entities;
  std::map<std::string, std::string> metadata;
};

struct SecurityRequest {
  std::string url;
  std::vector<std::string> modules;
};

class IScoutAgent {
public:
  virtual ~IScoutAgent() = default;
  virtual bool Capture(const ScoutRequest& request, const core::CancelToken& cancel,
                       ScoutResult& result, std::string& error) = 0;
};

class IVisionAgent {
public:
  virtual ~IVisionAgent() = default;
  virtual bool Analyze(const VisionRequest& request, const core::CancelToken& cancel,
                       VisionResult& result, std::string& error) = 0;
};

class IGraphAgent {
public:
  virtual ~IGraphAgent() = default;
  virtual bool Investigate(const GraphRequest& request, const core::CancelToken& cancel,
                           GraphResult& result, std::string& error) = 0;
};

class ISecurityAgent {
public:
  virtual ~ISecurityAgent() = default;
  virtual bool Scan(const SecurityRequest& request, const core::CancelToken& cancel,
                    SecurityResult& result, std::string& error) = 0;
};

enum class VerdictMode {
  kExpert,
  kSimple,
};

const char* ToString(VerdictMode mode);
bool ParseVerdictMode(std::string_view raw, VerdictMode& mode, std::string& error);

// Everything gathered so far, handed to the judge after each investigate stage.
struct JudgeInput {
  std::string url;
  std::string site_type;
  VerdictMode verdict_mode = VerdictMode::kExpert;
  std::uint32_t iteration = 0;
  ScoutResult scout;
  VisionResult vision;
  GraphResult graph;
  std::optional<SecurityResult> security;
  // Agents whose payload this iteration is a fallback.
  std::vector<std::string> degraded_agents;
  double quality_penalty = 0.0;
  std::vector<std::string> investigated_urls;
};

// Reputation prediction recorded while judging; the id resolves it later via
// ReputationManager::RecordActual.
struct PredictionRef {
  std::string source;
  std::uint64_t id = 0;
  reputation::Verdict predicted = reputation::Verdict::kUnknown;
};

struct JudgeVerdict {
  std::optional<scoring::TrustScoreResult> trust;
  std::string narrative;
  // Follow-up pages worth capturing, most valuable first.
  std::vector<std::string> candidate_urls;
  std::vector<PredictionRef> predictions;
};

class IJudgeAgent {
public:
  virtual ~IJudgeAgent() = default;
  virtual bool Deliberate(const JudgeInput& input, const core::CancelToken& cancel,
                          JudgeVerdict& verdict, std::string& error) = 0;
};

} // namespace siteaudit::agents
