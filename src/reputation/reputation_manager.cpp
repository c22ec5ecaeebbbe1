#include "reputation/reputation_manager.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace siteaudit::reputation {

namespace {

constexpr const char* kCoreSources[] = {"dns", "whois", "ssl", "urlvoid", "abuseipdb"};

std::string ToLowerAscii(std::string_view raw) {
  std::string out(raw);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

const char* ToString(const Verdict verdict) {
  switch (verdict) {
  case Verdict::kMalicious:
    return "malicious";
  case Verdict::kSafe:
    return "safe";
  case Verdict::kSuspicious:
    return "suspicious";
  case Verdict::kUnknown:
    return "unknown";
  }
  return "unknown";
}

bool ParseVerdict(std::string_view raw, Verdict& verdict, std::string& error) {
  const std::string normalized = ToLowerAscii(raw);
  if (normalized == "malicious") {
    verdict = Verdict::kMalicious;
    return true;
  }
  if (normalized == "safe") {
    verdict = Verdict::kSafe;
    return true;
  }
  if (normalized == "suspicious") {
    verdict = Verdict::kSuspicious;
    return true;
  }
  if (normalized == "unknown") {
    verdict = Verdict::kUnknown;
    return true;
  }
  error = "invalid verdict '" + std::string(raw) + "' (expected malicious|safe|suspicious|unknown)";
  return false;
}

bool IsCorrectPrediction(const Verdict predicted, const Verdict actual) {
  if (predicted == actual) {
    return true;
  }
  return predicted == Verdict::kSuspicious &&
         (actual == Verdict::kMalicious || actual == Verdict::kSafe);
}

double SourceReputation::Accuracy() const {
  if (total_predictions == 0U) {
    return 0.5;
  }
  return static_cast<double>(correct_predictions) / static_cast<double>(total_predictions);
}

double SourceReputation::FalseNegativeRate() const {
  if (total_predictions == 0U) {
    return 0.0;
  }
  return static_cast<double>(false_negatives) / static_cast<double>(total_predictions);
}

double SourceReputation::FalsePositiveRate() const {
  if (total_predictions == 0U) {
    return 0.0;
  }
  return static_cast<double>(false_positives) / static_cast<double>(total_predictions);
}

double SourceReputation::RecentAccuracy(const core::IClock::WallTimePoint now,
                                        const int days) const {
  const auto cutoff = now - std::chrono::hours(24 * days);
  std::size_t in_window = 0;
  std::size_t correct = 0;
  for (const auto& record : recent) {
    if (record.ts <= cutoff) {
      continue;
    }
    ++in_window;
    if (record.WasCorrect()) {
      ++correct;
    }
  }
  if (in_window == 0U) {
    return Accuracy();
  }
  return static_cast<double>(correct) / static_cast<double>(in_window);
}

double SourceReputation::WeightedReputation(const core::IClock::WallTimePoint now) const {
  const double accuracy = Accuracy();
  const double recent_factor = std::min(1.0, RecentAccuracy(now) / (accuracy + 0.01));
  const double fn_penalty = 1.0 - std::min(1.0, FalseNegativeRate() * 3.0);
  const double weighted = accuracy * 0.6 + recent_factor * 0.2 + fn_penalty * 0.2;
  return std::clamp(weighted, 0.0, 1.0);
}

ReputationManager::ReputationManager(const core::IClock& clock, core::logging::Logger& logger)
    : clock_(clock), logger_(logger) {
  for (const char* source : kCoreSources) {
    sources_.emplace(source, SourceReputation{.source = source});
  }
}

SourceReputation& ReputationManager::GetOrCreateLocked(std::string_view source) {
  auto it = sources_.find(source);
  if (it == sources_.end()) {
    it = sources_.emplace(std::string(source), SourceReputation{.source = std::string(source)})
             .first;
  }
  return it->second;
}

std::uint64_t ReputationManager::RecordPrediction(std::string_view source, const Verdict predicted,
                                                  const double confidence) {
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    SourceReputation& rep = GetOrCreateLocked(source);
    id = next_prediction_id_++;
    rep.total_predictions += 1U;
    rep.recent.push_back(PredictionRecord{
        .id = id,
        .ts = clock_.NowWall(),
        .predicted = predicted,
        .confidence = std::clamp(confidence, 0.0, 1.0),
        .actual = std::nullopt,
    });
    while (rep.recent.size() > kRecentPredictionCapacity) {
      rep.recent.pop_front();
    }
  }

  logger_.Debug("recorded source prediction",
                {{"source", source},
                 {"verdict", ToString(predicted)},
                 {"confidence", core::FormatFixedDouble(confidence, 2)},
                 {"prediction_id", std::to_string(id)}});
  return id;
}

bool ReputationManager::RecordActual(std::string_view source, const std::uint64_t prediction_id,
                                     const Verdict actual) {
  bool correct = false;
  double reputation = 0.0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    SourceReputation& rep = GetOrCreateLocked(source);
    const auto it = std::find_if(rep.recent.begin(), rep.recent.end(),
                                 [prediction_id](const PredictionRecord& record) {
                                   return record.id == prediction_id;
                                 });
    if (it == rep.recent.end()) {
      logger_.Warn("invalid prediction index for source",
                   {{"source", source}, {"prediction_id", std::to_string(prediction_id)}});
      return false;
    }

    if (it->actual.has_value()) {
      return it->WasCorrect();
    }

    it->actual = actual;
    correct = it->WasCorrect();
    if (correct) {
      rep.correct_predictions += 1U;
    } else if (it->predicted == Verdict::kMalicious && actual == Verdict::kSafe) {
      rep.false_positives += 1U;
    } else if (it->predicted == Verdict::kSafe && actual == Verdict::kMalicious) {
      rep.false_negatives += 1U;
    }
    reputation = rep.WeightedReputation(clock_.NowWall());
  }

  logger_.Info("recorded actual verdict",
               {{"source", source},
                {"actual", ToString(actual)},
                {"correct", correct ? "true" : "false"},
                {"reputation", core::FormatFixedDouble(reputation, 2)}});
  return correct;
}

double ReputationManager::WeightedReputation(std::string_view source) {
  std::lock_guard<std::mutex> lock(mu_);
  return GetOrCreateLocked(source).WeightedReputation(clock_.NowWall());
}

double ReputationManager::ConsensusWeightFor(const SourceReputation& rep,
                                             const core::IClock::WallTimePoint now) {
  double volume_bonus = 1.0;
  if (rep.total_predictions >= 100U) {
    volume_bonus = 1.2;
  } else if (rep.total_predictions >= 50U) {
    volume_bonus = 1.1;
  } else if (rep.total_predictions >= 20U) {
    volume_bonus = 1.05;
  }
  return rep.WeightedReputation(now) * volume_bonus;
}

double ReputationManager::ConsensusWeight(std::string_view source) {
  std::lock_guard<std::mutex> lock(mu_);
  return ConsensusWeightFor(GetOrCreateLocked(source), clock_.NowWall());
}

double ReputationManager::ThresholdForReputation(const double reputation) {
  if (reputation >= 0.8) {
    return 0.3;
  }
  if (reputation >= 0.6) {
    return 0.4;
  }
  if (reputation >= 0.4) {
    return 0.5;
  }
  return 0.7;
}

double ReputationManager::ConfidenceThreshold(std::string_view source) {
  std::lock_guard<std::mutex> lock(mu_);
  return ThresholdForReputation(GetOrCreateLocked(source).WeightedReputation(clock_.NowWall()));
}

std::map<std::string, double> ReputationManager::ConfidenceThresholds() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = clock_.NowWall();
  std::map<std::string, double> thresholds;
  for (const auto& [name, rep] : sources_) {
    thresholds[name] = ThresholdForReputation(rep.WeightedReputation(now));
  }
  return thresholds;
}

std::optional<SourceReputation> ReputationManager::Find(std::string_view source) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = sources_.find(source);
  if (it == sources_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> ReputationManager::Sources() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> names;
  names.reserve(sources_.size());
  for (const auto& [name, rep] : sources_) {
    (void)rep;
    names.push_back(name);
  }
  return names;
}

std::string ReputationManager::SnapshotJson() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = clock_.NowWall();

  std::ostringstream out;
  out << "{\n  \"generated_at_utc\": " << core::QuoteJson(core::FormatUtcTimestamp(now))
      << ",\n  \"sources\": [";
  bool first = true;
  for (const auto& [name, rep] : sources_) {
    const double reputation = rep.WeightedReputation(now);
    out << (first ? "\n" : ",\n") << "    {"
        << "\"source\": " << core::QuoteJson(name)
        << ", \"total_predictions\": " << rep.total_predictions
        << ", \"correct_predictions\": " << rep.correct_predictions
        << ", \"false_positives\": " << rep.false_positives
        << ", \"false_negatives\": " << rep.false_negatives
        << ", \"accuracy\": " << core::FormatFixedDouble(rep.Accuracy(), 4)
        << ", \"weighted_reputation\": " << core::FormatFixedDouble(reputation, 4)
        << ", \"consensus_weight\": " << core::FormatFixedDouble(ConsensusWeightFor(rep, now), 4)
        << ", \"confidence_threshold\": "
        << core::FormatFixedDouble(ThresholdForReputation(reputation), 2) << "}";
    first = false;
  }
  out << (first ? "]" : "\n  ]") << "\n}\n";
  return out.str();
}

} // namespace siteaudit::reputation
