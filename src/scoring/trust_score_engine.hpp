#pragma once

#include "scoring/signal_weights.hpp"
#include "scoring/trust_score_result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace siteaudit::core::logging {
class Logger;
}

namespace siteaudit::scoring {

struct SignalInput {
  double score = 0.5;
  double confidence = 1.0;
  std::string detail;
};

using SignalInputs = std::map<SignalKind, SignalInput>;

// Facts that can cap or deduct the weighted score regardless of the formula.
struct HardStopConditions {
  // nullopt when TLS status was never observed; only an explicit false fires
  // the no-SSL rules.
  std::optional<bool> has_ssl;
  bool invalid_certificate = false;
  // -1 when unknown.
  int domain_age_days = -1;
  bool fake_timer_detected = false;
  bool domain_blacklisted = false;
  std::uint32_t fake_badge_count = 0;
  std::uint32_t verified_badge_count = 0;
  bool captcha_blocked = false;
  bool critical_indicator_confirmed = false;
  bool whois_hidden = false;
  bool phishing_hit = false;
  double js_obfuscation_risk = 0.0;
  bool cross_domain_sensitive_forms = false;
};

struct ScoreRequest {
  SignalInputs signals;
  std::string site_type;
  HardStopConditions hard_stops;
  // Sum of DegradedResult penalties accumulated by the audit.
  double quality_penalty = 0.0;
};

// Weighted multi-signal trust scoring.
//
// 1) score = 100 x sum(w_i x S_i) over the site-type profile weights,
//    renormalized to the signals in play. Security is optional and drops out
//    when absent; a missing required signal counts as neutral 0.5 with
//    confidence 0.25.
// 2) Degradation scaling: x (1 - min(0.9, quality_penalty)), floor 1 point.
// 3) Hard-stop overrides, each evaluated on the scaled score independently;
//    the lowest resulting score wins and every fired rule is recorded.
class TrustScoreEngine {
public:
  TrustScoreEngine(ProfileTable profiles, core::logging::Logger& logger);

  // Contract:
  // - true: `result` holds the immutable score.
  // - false: configuration error (unknown site type, missing/invalid weight
  //   entry); `error` explains and `result` is reset.
  bool Score(const ScoreRequest& request, std::optional<TrustScoreResult>& result,
             std::string& error) const;

  const ProfileTable& profiles() const {
    return profiles_;
  }

private:
  const ProfileTable profiles_;
  core::logging::Logger& logger_;
};

} // namespace siteaudit::scoring
