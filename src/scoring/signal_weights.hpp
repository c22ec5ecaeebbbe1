#pragma once

#include <array>
#include <map>
#include <string>
#include <string_view>

namespace siteaudit::scoring {

enum class SignalKind {
  kVisual,
  kStructural,
  kTemporal,
  kGraph,
  kMeta,
  kSecurity,
};

constexpr std::array<SignalKind, 6> kAllSignals{
    SignalKind::kVisual, SignalKind::kStructural, SignalKind::kTemporal,
    SignalKind::kGraph,  SignalKind::kMeta,       SignalKind::kSecurity,
};

const char* ToString(SignalKind kind);
bool ParseSignalKind(std::string_view raw, SignalKind& kind);

// Every signal except security must be present in a weight map.
bool IsRequiredSignal(SignalKind kind);

using SignalWeights = std::map<SignalKind, double>;

// visual .20, structural .15, temporal .10, graph .25, meta .10, security .20
SignalWeights DefaultSignalWeights();

constexpr std::string_view kGeneralSiteType = "general";

// Weight profile for one site category. `paranoia` enables the stricter
// override set used for suspicious/darknet-adjacent sites.
struct SiteTypeProfile {
  std::string name;
  SignalWeights weights;
  bool paranoia = false;
};

using ProfileTable = std::map<std::string, SiteTypeProfile, std::less<>>;

// general, ecommerce, company_portfolio, financial, saas_subscription,
// darknet_suspicious.
ProfileTable DefaultProfileTable();

// Checks one weight map: every required signal present, all weights finite and
// non-negative, positive total, and a positive total over the required
// signals alone.
bool ValidateSignalWeights(const SignalWeights& weights, std::string& error);

// Resolves `site_type` (empty means general) to its profile.
//
// Contract:
// - true: `profile` holds a validated copy.
// - false: unknown site type or invalid weights. Callers treat this as a
//   configuration error and abort the audit.
bool ResolveSiteTypeProfile(const ProfileTable& table, std::string_view site_type,
                            SiteTypeProfile& profile, std::string& error);

// Drops absent signals and rescales the rest to sum to 1.
SignalWeights Renormalize(const SignalWeights& weights, const std::map<SignalKind, bool>& present);

} // namespace siteaudit::scoring
