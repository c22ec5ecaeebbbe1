#pragma once

#include "core/clock.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::core::logging {
class Logger;
}

namespace siteaudit::reputation {

enum class Verdict {
  kMalicious,
  kSafe,
  kSuspicious,
  kUnknown,
};

const char* ToString(Verdict verdict);
bool ParseVerdict(std::string_view raw, Verdict& verdict, std::string& error);

// A SUSPICIOUS call on a site later proven MALICIOUS or SAFE earns partial
// credit and counts as correct.
bool IsCorrectPrediction(Verdict predicted, Verdict actual);

constexpr std::size_t kRecentPredictionCapacity = 100U;
constexpr int kRecentWindowDays = 30;

struct PredictionRecord {
  std::uint64_t id = 0;
  core::IClock::WallTimePoint ts{};
  Verdict predicted = Verdict::kUnknown;
  double confidence = 0.0;
  std::optional<Verdict> actual;

  // Unresolved predictions are never correct.
  bool WasCorrect() const {
    return actual.has_value() && IsCorrectPrediction(predicted, *actual);
  }
};

// Accuracy ledger for one external verification source.
struct SourceReputation {
  std::string source;
  std::uint64_t total_predictions = 0;
  std::uint64_t correct_predictions = 0;
  std::uint64_t false_positives = 0;
  std::uint64_t false_negatives = 0;
  std::deque<PredictionRecord> recent;

  double Accuracy() const;
  double FalseNegativeRate() const;
  double FalsePositiveRate() const;
  // Falls back to overall accuracy when the window holds no predictions.
  double RecentAccuracy(core::IClock::WallTimePoint now, int days = kRecentWindowDays) const;
  double WeightedReputation(core::IClock::WallTimePoint now) const;
};

// Process-wide, internally synchronized reputation store. Audits record graph
// source claims as predictions; analysts (or later audits) resolve them with
// RecordActual and the consensus weights adjust.
class ReputationManager {
public:
  ReputationManager(const core::IClock& clock, core::logging::Logger& logger);

  ReputationManager(const ReputationManager&) = delete;
  ReputationManager& operator=(const ReputationManager&) = delete;

  // Returns the stable prediction id used by RecordActual. Ids stay valid
  // until the prediction is evicted from the bounded recent list.
  std::uint64_t RecordPrediction(std::string_view source, Verdict predicted, double confidence);

  // Resolves one prediction and updates the counters.
  //
  // Contract:
  // - true: the prediction exists and was judged correct.
  // - false: the id is unknown/evicted (logged as a warning) or the
  //   prediction was wrong.
  // Resolving an already-resolved prediction keeps the first resolution and
  // does not touch the counters again.
  bool RecordActual(std::string_view source, std::uint64_t prediction_id, Verdict actual);

  double WeightedReputation(std::string_view source);
  // Weighted reputation scaled by a volume bonus (x1.05 at 20 predictions,
  // x1.1 at 50, x1.2 at 100). May exceed 1.0.
  double ConsensusWeight(std::string_view source);
  // Minimum claim confidence for a source's claim to be trusted.
  double ConfidenceThreshold(std::string_view source);
  std::map<std::string, double> ConfidenceThresholds();

  std::optional<SourceReputation> Find(std::string_view source) const;
  std::vector<std::string> Sources() const;

  // Serialized counters and derived weights for the reputation snapshot
  // artifact.
  std::string SnapshotJson();

private:
  SourceReputation& GetOrCreateLocked(std::string_view source);
  static double ConsensusWeightFor(const SourceReputation& rep,
                                   core::IClock::WallTimePoint now);
  static double ThresholdForReputation(double reputation);

  const core::IClock& clock_;
  core::logging::Logger& logger_;
  mutable std::mutex mu_;
  std::map<std::string, SourceReputation, std::less<>> sources_;
  std::uint64_t next_prediction_id_ = 0;
};

} // namespace siteaudit::reputation
