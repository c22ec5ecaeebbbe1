#include "audit/audit_orchestrator.hpp"

#include "agents/evidence_judge.hpp"
#include "audit/audit_services.hpp"
#include "audit/loop_decision.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"
#include "resilience/degradation_manager.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

namespace siteaudit::audit {

namespace {

using std::chrono::milliseconds;

constexpr std::string_view kScoutAgent = "scout";
constexpr std::string_view kVisionAgent = "vision";
constexpr std::string_view kGraphAgent = "graph";
constexpr std::string_view kSecurityAgent = "security";
constexpr std::string_view kJudgeAgent = "judge";

std::string DomainOf(const std::string& url) {
  std::string_view rest(url);
  if (const std::size_t scheme = rest.find("://"); scheme != std::string_view::npos) {
    rest.remove_prefix(scheme + 3);
  }
  const std::size_t end = rest.find_first_of("/?#:");
  return std::string(rest.substr(0, end));
}

// Per-run context: one instance per AuditOrchestrator::Run call.
class AuditRun {
public:
  AuditRun(AuditServices& services, const AgentSet& agents, events::IEventSink& sink,
           AuditState& state, std::string audit_id)
      : services_(services),
        agents_(agents),
        state_(state),
        logger_(services.logger().MinLevel(), services.logger().Stream()),
        emitter_(sink, audit_id),
        degradation_(services.breakers(), services.timeouts(), logger_,
                     services.settings().cancel_grace),
        builtin_judge_(services.scoring_engine(), services.reputation(), logger_),
        judge_input_(std::make_shared<JudgeInputSlot>()),
        started_(services.clock().NowSteady()) {
    logger_.SetAuditId(std::move(audit_id));
  }

  bool Execute(const AuditRequest& request, std::string& error);
  void Fail(std::string_view stage, const std::string& message);

private:
  struct JudgeInputSlot {
    std::mutex mu;
    agents::JudgeInput input;
  };

  milliseconds Elapsed() const {
    return std::chrono::duration_cast<milliseconds>(services_.clock().NowSteady() - started_);
  }

  // Remaining elapsed budget after reserving the cancel grace period.
  milliseconds RemainingBudget() const {
    return state_.budget.max_elapsed - Elapsed() - services_.settings().cancel_grace;
  }

  bool BudgetExhausted() const {
    return RemainingBudget().count() <= 0;
  }

  // Planned deadline for `agent`, capped by the remaining elapsed budget.
  // Never below 1ms; exhaustion is reported by BudgetExhausted().
  milliseconds StageDeadline(std::string_view agent, const timing::ComplexityMetrics& metrics) const {
    const milliseconds planned =
        services_.timeouts().DeadlineFor(agent, metrics, services_.settings().timeout_strategy);
    return std::max(std::min(planned, RemainingBudget()), milliseconds(1));
  }

  // Agents run from `stage` through the judge in the current iteration.
  std::vector<std::string> AgentsFrom(PipelineState stage) const {
    std::vector<std::string> agents;
    if (stage == PipelineState::kScout) {
      agents.emplace_back(kScoutAgent);
    }
    if (stage == PipelineState::kScout || stage == PipelineState::kInvestigate) {
      agents.emplace_back(kVisionAgent);
      agents.emplace_back(kGraphAgent);
      if (security_enabled_) {
        agents.emplace_back(kSecurityAgent);
      }
    }
    if (stage == PipelineState::kScout || stage == PipelineState::kInvestigate ||
        stage == PipelineState::kJudge) {
      agents.emplace_back(kJudgeAgent);
    }
    return agents;
  }

  // Sum of planned deadlines for the pending agents, capped by the remaining
  // elapsed budget. Progress hint only; nothing waits on it.
  std::uint64_t EtaMillis(const std::vector<std::string>& pending) const {
    if (pending.empty()) {
      return 0U;
    }
    const milliseconds estimate = services_.timeouts().EstimateRemaining(
        pending, current_metrics_, services_.settings().timeout_strategy);
    const milliseconds capped = std::min(estimate, RemainingBudget());
    return static_cast<std::uint64_t>(std::max<milliseconds::rep>(capped.count(), 0));
  }

  std::chrono::system_clock::time_point Now() const {
    return services_.clock().NowWall();
  }

  void Notify(bool sent, const std::string& sink_error) {
    if (!sent) {
      logger_.Warn("event sink failed", {{"error", sink_error}});
    }
  }

  void RegisterFallbacks();
  bool ResolveSiteType(const AuditRequest& request, std::string& error);
  agents::ScoutResult RunScoutStage(const std::vector<std::string>& urls);
  void RunInvestigateStage(const agents::ScoutResult& scout);
  bool RunJudgeStage(agents::JudgeVerdict& verdict, std::string& error);
  bool DecideLoop(const agents::JudgeVerdict& verdict, LoopDecision& decision, std::string& error);

  void RecordDegradation(std::string_view stage, const resilience::DegradedResult& degraded);
  agents::JudgeInput BuildJudgeInput() const;
  void Complete();

  AuditServices& services_;
  const AgentSet& agents_;
  AuditState& state_;
  core::logging::Logger logger_;
  events::Emitter emitter_;
  resilience::DegradationManager degradation_;
  agents::EvidenceJudge builtin_judge_;
  std::shared_ptr<JudgeInputSlot> judge_input_;
  const core::IClock::SteadyTimePoint started_;

  timing::ComplexityMetrics current_metrics_;
  bool security_enabled_ = false;
  std::vector<std::string> security_modules_;
};

void AuditRun::RegisterFallbacks() {
  degradation_.RegisterFallback<agents::ScoutResult>(
      std::string(kScoutAgent), resilience::FallbackMode::kPartial, 0.5,
      {"screenshots", "dom"},
      [](const resilience::DegradedResult&, agents::ScoutResult& data, std::string&) {
        data = agents::ScoutResult{};
        return true;
      });
  degradation_.RegisterFallback<agents::VisionResult>(
      std::string(kVisionAgent), resilience::FallbackMode::kSimplified, 0.3,
      {"visual_score", "temporal_score", "dark_patterns"},
      [](const resilience::DegradedResult&, agents::VisionResult& data, std::string&) {
        data = agents::VisionResult{};
        return true;
      });
  degradation_.RegisterFallback<agents::GraphResult>(
      std::string(kGraphAgent), resilience::FallbackMode::kSimplified, 0.3,
      {"entity_verification", "domain_age", "source_claims"},
      [](const resilience::DegradedResult&, agents::GraphResult& data, std::string&) {
        data = agents::GraphResult{};
        return true;
      });
  degradation_.RegisterFallback<agents::SecurityResult>(
      std::string(kSecurityAgent), resilience::FallbackMode::kSimplified, 0.2,
      {"security_modules"},
      [](const resilience::DegradedResult&, agents::SecurityResult& data, std::string&) {
        data = agents::SecurityResult{};
        return true;
      });

  // The judge falls back to scoring the gathered evidence directly.
  std::shared_ptr<JudgeInputSlot> slot = judge_input_;
  const scoring::TrustScoreEngine* engine = &services_.scoring_engine();
  degradation_.RegisterFallback<agents::JudgeVerdict>(
      std::string(kJudgeAgent), resilience::FallbackMode::kAlternative, 0.2, {"judge_reasoning"},
      [slot, engine](const resilience::DegradedResult&, agents::JudgeVerdict& data,
                     std::string& producer_error) {
        agents::JudgeInput input;
        {
          std::lock_guard<std::mutex> lock(slot->mu);
          input = slot->input;
        }
        scoring::ScoreRequest request{
            .signals = agents::BuildSignals(input, nullptr),
            .site_type = input.site_type,
            .hard_stops = agents::BuildHardStops(input),
            .quality_penalty = input.quality_penalty,
        };
        data = agents::JudgeVerdict{};
        if (!engine->Score(request, data.trust, producer_error)) {
          return false;
        }
        data.narrative = agents::ComposeNarrative(input, *data.trust);
        data.candidate_urls = agents::SelectCandidateUrls(input);
        return true;
      });
}

bool AuditRun::ResolveSiteType(const AuditRequest& request, std::string& error) {
  scoring::SiteTypeProfile profile;
  if (!request.site_type.empty()) {
    if (!scoring::ResolveSiteTypeProfile(services_.scoring_engine().profiles(), request.site_type,
                                         profile, error)) {
      return false;
    }
    state_.site_type = profile.name;
    return true;
  }

  std::string hint_error;
  if (!scoring::ResolveSiteTypeProfile(services_.scoring_engine().profiles(),
                                       state_.site_type_hint, profile, hint_error)) {
    logger_.Warn("unknown site type hint, scoring as general",
                 {{"hint", state_.site_type_hint}, {"error", hint_error}});
    state_.site_type = std::string(scoring::kGeneralSiteType);
    return true;
  }
  state_.site_type = profile.name;
  return true;
}

agents::ScoutResult AuditRun::RunScoutStage(const std::vector<std::string>& urls) {
  state_.state = PipelineState::kScout;
  const milliseconds deadline = StageDeadline(kScoutAgent, current_metrics_);
  std::string sink_error;
  Notify(emitter_.EmitStageStarted({.ts = Now(),
                                    .stage = "scout",
                                    .iteration = state_.iteration,
                                    .agents = {std::string(kScoutAgent)},
                                    .deadline_ms = static_cast<std::uint64_t>(
                                        std::max<milliseconds::rep>(deadline.count(), 0)),
                                    .eta_ms = EtaMillis(AgentsFrom(PipelineState::kScout))},
                                   sink_error),
         sink_error);

  agents::ScoutResult iteration_scout;
  std::map<std::string, std::string> degraded;
  milliseconds stage_elapsed{0};
  for (const auto& url : urls) {
    const milliseconds page_deadline = StageDeadline(kScoutAgent, current_metrics_);
    resilience::StageOutcome<agents::ScoutResult> outcome;
    if (BudgetExhausted()) {
      outcome = degradation_.Degrade<agents::ScoutResult>(
          kScoutAgent, resilience::FailureKind::kBudgetExhausted, "elapsed budget exhausted");
    } else {
      std::shared_ptr<agents::IScoutAgent> scout = agents_.scout;
      const agents::ScoutRequest request{.url = url,
                                         .page_index =
                                             static_cast<std::uint32_t>(state_.pages.size())};
      outcome = degradation_.Execute<agents::ScoutResult>(
          kScoutAgent,
          [scout, request](const core::CancelToken& cancel, agents::ScoutResult& result,
                           std::string& op_error) {
            return scout->Capture(request, cancel, result, op_error);
          },
          page_deadline);
    }
    stage_elapsed += outcome.elapsed;
    state_.investigated_urls.push_back(url);

    if (outcome.degraded.has_value()) {
      RecordDegradation("scout", *outcome.degraded);
      degraded[std::string(kScoutAgent)] = resilience::ToString(outcome.degraded->fallback_mode);
      continue;
    }

    for (auto& page : outcome.data.pages) {
      iteration_scout.pages.push_back(page);
      state_.pages.push_back(std::move(page));
    }
    if (state_.site_type_hint.empty()) {
      state_.site_type_hint = outcome.data.site_type_hint;
    }
    for (auto& entity : outcome.data.entities) {
      if (std::find(state_.entities.begin(), state_.entities.end(), entity) ==
          state_.entities.end()) {
        state_.entities.push_back(std::move(entity));
      }
    }
    for (auto& [key, value] : outcome.data.metadata) {
      state_.metadata[key] = std::move(value);
    }
  }
  iteration_scout.site_type_hint = state_.site_type_hint;
  iteration_scout.entities = state_.entities;
  iteration_scout.metadata = state_.metadata;

  Notify(emitter_.EmitStageCompleted({.ts = Now(),
                                      .stage = "scout",
                                      .iteration = state_.iteration,
                                      .elapsed_ms = static_cast<std::uint64_t>(stage_elapsed.count()),
                                      .degraded = degraded,
                                      .quality_penalty = state_.quality_penalty,
                                      .summary = agents::Summarize(iteration_scout),
                                      .eta_ms = EtaMillis(AgentsFrom(PipelineState::kInvestigate))},
                                     sink_error),
         sink_error);
  return iteration_scout;
}

void AuditRun::RunInvestigateStage(const agents::ScoutResult& scout) {
  state_.state = PipelineState::kInvestigate;

  const timing::ComplexityAnalyzer& analyzer = services_.complexity_analyzer();
  const timing::ComplexityMetrics planning_metrics =
      state_.complexity_history.empty() ? analyzer.Analyze(state_.url, &scout, nullptr)
                                        : current_metrics_;

  // Each investigate agent costs one external call; agents past the call
  // budget degrade without running.
  std::uint32_t calls_left = state_.budget.max_external_calls > state_.external_calls_used
                                 ? state_.budget.max_external_calls - state_.external_calls_used
                                 : 0U;
  auto admit = [&calls_left, this]() {
    if (calls_left == 0U) {
      return false;
    }
    --calls_left;
    ++state_.external_calls_used;
    return true;
  };
  const bool run_vision = admit();
  const bool run_graph = admit();
  const bool run_security = security_enabled_ && admit();

  const milliseconds vision_deadline = StageDeadline(kVisionAgent, planning_metrics);
  const milliseconds graph_deadline = StageDeadline(kGraphAgent, planning_metrics);
  const milliseconds security_deadline = StageDeadline(kSecurityAgent, planning_metrics);

  std::vector<std::string> stage_agents{std::string(kVisionAgent), std::string(kGraphAgent)};
  if (security_enabled_) {
    stage_agents.emplace_back(kSecurityAgent);
  }
  std::string sink_error;
  Notify(emitter_.EmitStageStarted(
             {.ts = Now(),
              .stage = "investigate",
              .iteration = state_.iteration,
              .agents = stage_agents,
              .deadline_ms = static_cast<std::uint64_t>(std::max<milliseconds::rep>(
                  std::max({vision_deadline, graph_deadline, security_deadline}).count(), 0)),
              .eta_ms = EtaMillis(AgentsFrom(PipelineState::kInvestigate))},
             sink_error),
         sink_error);

  const core::IClock::SteadyTimePoint stage_start = services_.clock().NowSteady();

  auto run_stage = [this](std::string_view agent, bool admitted, milliseconds deadline,
                          auto payload_tag, auto invoke) {
    using Payload = typename decltype(payload_tag)::type;
    if (!admitted) {
      return degradation_.Degrade<Payload>(agent, resilience::FailureKind::kBudgetExhausted,
                                           "external call budget exhausted");
    }
    if (BudgetExhausted()) {
      return degradation_.Degrade<Payload>(agent, resilience::FailureKind::kBudgetExhausted,
                                           "elapsed budget exhausted");
    }
    return degradation_.Execute<Payload>(agent, resilience::StageOperation<Payload>(invoke),
                                         deadline);
  };

  agents::VisionRequest vision_request{.url = state_.url, .site_type = state_.site_type};
  for (const auto& page : scout.pages) {
    vision_request.screenshot_paths.insert(vision_request.screenshot_paths.end(),
                                           page.screenshot_paths.begin(),
                                           page.screenshot_paths.end());
  }
  const agents::GraphRequest graph_request{.domain = DomainOf(state_.url),
                                           .entities = scout.entities,
                                           .metadata = scout.metadata};
  const agents::SecurityRequest security_request{.url = state_.url, .modules = security_modules_};

  std::shared_ptr<agents::IVisionAgent> vision = agents_.vision;
  std::shared_ptr<agents::IGraphAgent> graph = agents_.graph;
  std::shared_ptr<agents::ISecurityAgent> security = agents_.security;

  auto vision_future = std::async(std::launch::async, [&] {
    return run_stage(kVisionAgent, run_vision, vision_deadline,
                     std::type_identity<agents::VisionResult>{},
                     [vision, vision_request](const core::CancelToken& cancel,
                                              agents::VisionResult& result, std::string& op_error) {
                       return vision->Analyze(vision_request, cancel, result, op_error);
                     });
  });
  auto graph_future = std::async(std::launch::async, [&] {
    return run_stage(kGraphAgent, run_graph, graph_deadline,
                     std::type_identity<agents::GraphResult>{},
                     [graph, graph_request](const core::CancelToken& cancel,
                                            agents::GraphResult& result, std::string& op_error) {
                       return graph->Investigate(graph_request, cancel, result, op_error);
                     });
  });
  std::future<resilience::StageOutcome<agents::SecurityResult>> security_future;
  if (security_enabled_) {
    security_future = std::async(std::launch::async, [&] {
      return run_stage(kSecurityAgent, run_security, security_deadline,
                       std::type_identity<agents::SecurityResult>{},
                       [security, security_request](const core::CancelToken& cancel,
                                                    agents::SecurityResult& result,
                                                    std::string& op_error) {
                         return security->Scan(security_request, cancel, result, op_error);
                       });
    });
  }

  resilience::StageOutcome<agents::VisionResult> vision_outcome = vision_future.get();
  resilience::StageOutcome<agents::GraphResult> graph_outcome = graph_future.get();
  std::optional<resilience::StageOutcome<agents::SecurityResult>> security_outcome;
  if (security_future.valid()) {
    security_outcome = security_future.get();
  }

  std::map<std::string, std::string> degraded;
  std::vector<std::string> summaries;

  if (vision_outcome.degraded.has_value()) {
    RecordDegradation("investigate", *vision_outcome.degraded);
    degraded[std::string(kVisionAgent)] =
        resilience::ToString(vision_outcome.degraded->fallback_mode);
    if (!state_.vision_measured) {
      state_.vision = vision_outcome.data;
    }
  } else {
    state_.vision = state_.vision_measured ? MergeVisionResults(state_.vision, vision_outcome.data)
                                           : vision_outcome.data;
    state_.vision_measured = true;
  }
  summaries.push_back("vision: " + agents::Summarize(state_.vision));

  if (graph_outcome.degraded.has_value()) {
    RecordDegradation("investigate", *graph_outcome.degraded);
    degraded[std::string(kGraphAgent)] = resilience::ToString(graph_outcome.degraded->fallback_mode);
    if (!state_.graph_measured) {
      state_.graph = graph_outcome.data;
    }
  } else {
    state_.graph = graph_outcome.data;
    state_.graph_measured = true;
  }
  summaries.push_back("graph: " + agents::Summarize(state_.graph));

  if (security_outcome.has_value()) {
    if (security_outcome->degraded.has_value()) {
      RecordDegradation("investigate", *security_outcome->degraded);
      degraded[std::string(kSecurityAgent)] =
          resilience::ToString(security_outcome->degraded->fallback_mode);
      if (!state_.security_measured) {
        state_.security = security_outcome->data;
      }
    } else {
      state_.security = security_outcome->data;
      state_.security_measured = true;
    }
    summaries.push_back("security: " + agents::Summarize(*state_.security));
  }

  current_metrics_ =
      analyzer.Analyze(state_.url, &scout, &vision_outcome.data,
                       state_.security_measured ? &*state_.security : nullptr);
  current_metrics_.site_type = state_.site_type;
  state_.complexity_history.push_back(current_metrics_);
  logger_.Debug("complexity recomputed",
                {{"composite", core::FormatFixedDouble(current_metrics_.CompositeScore(), 3)},
                 {"suggested", timing::ToString(
                                   timing::SuggestStrategy(current_metrics_.CompositeScore()))}});

  std::string summary;
  for (const auto& part : summaries) {
    summary += summary.empty() ? part : "; " + part;
  }
  const auto stage_elapsed = std::chrono::duration_cast<milliseconds>(
      services_.clock().NowSteady() - stage_start);
  Notify(emitter_.EmitStageCompleted({.ts = Now(),
                                      .stage = "investigate",
                                      .iteration = state_.iteration,
                                      .elapsed_ms = static_cast<std::uint64_t>(stage_elapsed.count()),
                                      .degraded = degraded,
                                      .quality_penalty = state_.quality_penalty,
                                      .summary = summary,
                                      .eta_ms = EtaMillis(AgentsFrom(PipelineState::kJudge))},
                                     sink_error),
         sink_error);
}

agents::JudgeInput AuditRun::BuildJudgeInput() const {
  agents::JudgeInput input;
  input.url = state_.url;
  input.site_type = state_.site_type;
  input.verdict_mode = state_.verdict_mode;
  input.iteration = state_.iteration;
  input.scout.pages = state_.pages;
  input.scout.site_type_hint = state_.site_type_hint;
  input.scout.entities = state_.entities;
  input.scout.metadata = state_.metadata;
  input.vision = state_.vision;
  input.graph = state_.graph;
  if (security_enabled_) {
    input.security = state_.security.value_or(agents::SecurityResult{});
  }
  if (state_.pages.empty()) {
    input.degraded_agents.emplace_back(kScoutAgent);
  }
  if (!state_.vision_measured) {
    input.degraded_agents.emplace_back(kVisionAgent);
  }
  if (!state_.graph_measured) {
    input.degraded_agents.emplace_back(kGraphAgent);
  }
  if (security_enabled_ && !state_.security_measured) {
    input.degraded_agents.emplace_back(kSecurityAgent);
  }
  input.quality_penalty = state_.quality_penalty;
  input.investigated_urls = state_.investigated_urls;
  return input;
}

bool AuditRun::RunJudgeStage(agents::JudgeVerdict& verdict, std::string& error) {
  state_.state = PipelineState::kJudge;
  const agents::JudgeInput input = BuildJudgeInput();
  {
    std::lock_guard<std::mutex> lock(judge_input_->mu);
    judge_input_->input = input;
  }

  const milliseconds deadline = StageDeadline(kJudgeAgent, current_metrics_);
  std::string sink_error;
  Notify(emitter_.EmitStageStarted({.ts = Now(),
                                    .stage = "judge",
                                    .iteration = state_.iteration,
                                    .agents = {std::string(kJudgeAgent)},
                                    .deadline_ms = static_cast<std::uint64_t>(
                                        std::max<milliseconds::rep>(deadline.count(), 0)),
                                    .eta_ms = EtaMillis(AgentsFrom(PipelineState::kJudge))},
                                   sink_error),
         sink_error);

  resilience::StageOutcome<agents::JudgeVerdict> outcome;
  if (BudgetExhausted()) {
    outcome = degradation_.Degrade<agents::JudgeVerdict>(
        kJudgeAgent, resilience::FailureKind::kBudgetExhausted, "elapsed budget exhausted");
  } else if (agents_.judge != nullptr) {
    std::shared_ptr<agents::IJudgeAgent> judge = agents_.judge;
    outcome = degradation_.Execute<agents::JudgeVerdict>(
        kJudgeAgent,
        [judge, input](const core::CancelToken& cancel, agents::JudgeVerdict& result,
                       std::string& op_error) {
          return judge->Deliberate(input, cancel, result, op_error);
        },
        deadline);
  } else {
    // The built-in judge only scores gathered evidence; it runs inline.
    core::CancelSource cancel;
    std::string judge_error;
    agents::JudgeVerdict local;
    if (builtin_judge_.Deliberate(input, cancel.Token(), local, judge_error)) {
      outcome.data = std::move(local);
    } else {
      outcome = degradation_.Degrade<agents::JudgeVerdict>(
          kJudgeAgent, resilience::FailureKind::kError, judge_error);
    }
  }

  std::map<std::string, std::string> degraded;
  if (outcome.degraded.has_value()) {
    RecordDegradation("judge", *outcome.degraded);
    degraded[std::string(kJudgeAgent)] = resilience::ToString(outcome.degraded->fallback_mode);
  }

  verdict = std::move(outcome.data);
  if (!verdict.trust.has_value()) {
    error = outcome.degraded.has_value() && !outcome.degraded->error.empty()
                ? "no verdict could be produced: " + outcome.degraded->error
                : "no verdict could be produced";
    return false;
  }

  Notify(emitter_.EmitStageCompleted(
             {.ts = Now(),
              .stage = "judge",
              .iteration = state_.iteration,
              .elapsed_ms = static_cast<std::uint64_t>(outcome.elapsed.count()),
              .degraded = degraded,
              .quality_penalty = state_.quality_penalty,
              .summary = "score " + std::to_string(verdict.trust->final_score()) + " (" +
                         scoring::ToString(verdict.trust->risk_level()) + ")"},
             sink_error),
         sink_error);
  return true;
}

bool AuditRun::DecideLoop(const agents::JudgeVerdict& verdict, LoopDecision& decision,
                          std::string& error) {
  LoopDecisionConfig config;
  config.confidence_threshold = services_.settings().confidence_threshold;

  LoopDecisionInput input;
  input.budget = state_.budget;
  input.iterations_completed = state_.iteration;
  input.elapsed = Elapsed();
  input.external_calls_used = state_.external_calls_used;
  input.external_calls_per_iteration = security_enabled_ ? 3U : 2U;
  input.pages_captured = static_cast<std::uint32_t>(state_.investigated_urls.size());
  input.candidate_urls = verdict.candidate_urls;
  input.confidence = verdict.trust->confidence();
  if (state_.vision_measured) {
    input.visual_score = state_.vision.visual_score;
  }
  if (state_.graph_measured) {
    input.graph_score = state_.graph.graph_score;
  }

  if (!EvaluateLoopDecision(config, input, decision, error)) {
    return false;
  }

  logger_.Info("loop decision", {{"iteration", std::to_string(state_.iteration)},
                                 {"reason", ToString(decision.reason)},
                                 {"explanation", decision.explanation}});
  std::string sink_error;
  Notify(emitter_.EmitLoopDecision({.ts = Now(),
                                    .iteration = state_.iteration,
                                    .decision = decision.should_continue ? "investigate"
                                                                         : "render_verdict",
                                    .reason = ToString(decision.reason),
                                    .next_urls = decision.next_urls},
                                   sink_error),
         sink_error);
  return true;
}

void AuditRun::RecordDegradation(std::string_view stage,
                                 const resilience::DegradedResult& degraded) {
  state_.degradations.push_back(
      DegradationRecord{.iteration = state_.iteration, .stage = std::string(stage),
                        .result = degraded});
  state_.quality_penalty += degraded.quality_penalty;
}

void AuditRun::Fail(std::string_view stage, const std::string& message) {
  state_.state = PipelineState::kError;
  state_.errors.push_back(message);
  state_.elapsed = Elapsed();
  logger_.Error("audit failed", {{"stage", stage}, {"error", message}});

  std::string sink_error;
  Notify(emitter_.EmitAuditError(
             {.ts = Now(), .stage = std::string(stage), .message = message}, sink_error),
         sink_error);
}

void AuditRun::Complete() {
  state_.state = PipelineState::kDone;
  state_.elapsed = Elapsed();
  logger_.Info("audit complete",
               {{"score", std::to_string(state_.trust->final_score())},
                {"risk_level", scoring::ToString(state_.trust->risk_level())},
                {"iterations", std::to_string(state_.iteration)},
                {"loop_reason", state_.loop_reason}});

  std::string sink_error;
  Notify(emitter_.EmitAuditComplete({.ts = Now(),
                                     .final_score = state_.trust->final_score(),
                                     .risk_level = scoring::ToString(state_.trust->risk_level()),
                                     .confidence = state_.trust->confidence(),
                                     .iterations = state_.iteration,
                                     .external_calls = state_.external_calls_used,
                                     .elapsed_ms = static_cast<std::uint64_t>(state_.elapsed.count()),
                                     .overrides = state_.trust->OverrideNames(),
                                     .degraded_agents = state_.DegradedAgents(),
                                     .narrative = state_.narrative},
                                    sink_error),
         sink_error);
}

bool AuditRun::Execute(const AuditRequest& request, std::string& error) {
  state_.url = request.url;
  state_.tier = request.tier;
  state_.verdict_mode = request.verdict_mode;
  state_.budget = request.budget_override.value_or(services_.settings().BudgetFor(request.tier));

  std::string sink_error;
  Notify(emitter_.EmitAuditStarted({.ts = Now(),
                                    .url = state_.url,
                                    .tier = ToString(state_.tier),
                                    .verdict_mode = agents::ToString(state_.verdict_mode),
                                    .max_iterations = state_.budget.max_iterations,
                                    .max_external_calls = state_.budget.max_external_calls,
                                    .max_pages = state_.budget.max_pages},
                                   sink_error),
         sink_error);

  if (request.url.empty()) {
    error = "audit url is required";
    Fail("config", error);
    return false;
  }
  if (agents_.scout == nullptr || agents_.vision == nullptr || agents_.graph == nullptr) {
    error = "scout, vision and graph agents are required";
    Fail("config", error);
    return false;
  }
  if (!request.site_type.empty() && !ResolveSiteType(request, error)) {
    Fail("config", error);
    return false;
  }

  security_enabled_ = request.run_security && agents_.security != nullptr;
  security_modules_ = request.security_modules.empty() ? services_.settings().security_modules
                                                       : request.security_modules;
  RegisterFallbacks();
  logger_.Info("audit started", {{"url", state_.url},
                                 {"tier", ToString(state_.tier)},
                                 {"security", security_enabled_ ? "on" : "off"}});

  std::vector<std::string> next_urls{state_.url};
  while (true) {
    ++state_.iteration;
    state_.pending_urls.clear();

    const agents::ScoutResult scout = RunScoutStage(next_urls);
    if (state_.iteration == 1U && request.site_type.empty() &&
        !ResolveSiteType(request, error)) {
      Fail("scout", error);
      return false;
    }

    RunInvestigateStage(scout);

    agents::JudgeVerdict verdict;
    if (!RunJudgeStage(verdict, error)) {
      Fail("judge", error);
      return false;
    }
    state_.trust = verdict.trust;
    state_.narrative = verdict.narrative;
    state_.predictions.insert(state_.predictions.end(), verdict.predictions.begin(),
                              verdict.predictions.end());

    LoopDecision decision;
    if (!DecideLoop(verdict, decision, error)) {
      Fail("loop", error);
      return false;
    }
    if (!decision.should_continue) {
      state_.loop_reason = ToString(decision.reason);
      state_.pending_urls = verdict.candidate_urls;
      break;
    }
    state_.state = PipelineState::kLoop;
    state_.pending_urls = decision.next_urls;
    next_urls = decision.next_urls;
  }

  Complete();
  return true;
}

} // namespace

AuditOrchestrator::AuditOrchestrator(AuditServices& services, AgentSet agents,
                                     events::IEventSink& sink)
    : services_(services), agents_(agents), sink_(sink) {}

bool AuditOrchestrator::Run(const AuditRequest& request, AuditState& state, std::string& error) {
  state = AuditState{};
  state.audit_id = request.audit_id.empty() ? services_.NextAuditId() : request.audit_id;
  error.clear();

  AuditRun run(services_, agents_, sink_, state, state.audit_id);
  try {
    return run.Execute(request, error);
  } catch (const std::exception& ex) {
    error = std::string("audit aborted: ") + ex.what();
    run.Fail(ToString(state.state), error);
    return false;
  }
}

} // namespace siteaudit::audit
