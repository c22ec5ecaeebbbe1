#include "scoring/signal_weights.hpp"

#include <cmath>

namespace siteaudit::scoring {

namespace {

SignalWeights MakeWeights(double visual, double structural, double temporal, double graph,
                          double meta, double security) {
  return SignalWeights{
      {SignalKind::kVisual, visual}, {SignalKind::kStructural, structural},
      {SignalKind::kTemporal, temporal}, {SignalKind::kGraph, graph},
      {SignalKind::kMeta, meta}, {SignalKind::kSecurity, security},
  };
}

} // namespace

const char* ToString(const SignalKind kind) {
  switch (kind) {
  case SignalKind::kVisual:
    return "visual";
  case SignalKind::kStructural:
    return "structural";
  case SignalKind::kTemporal:
    return "temporal";
  case SignalKind::kGraph:
    return "graph";
  case SignalKind::kMeta:
    return "meta";
  case SignalKind::kSecurity:
    return "security";
  }
  return "visual";
}

bool ParseSignalKind(std::string_view raw, SignalKind& kind) {
  for (const SignalKind candidate : kAllSignals) {
    if (raw == ToString(candidate)) {
      kind = candidate;
      return true;
    }
  }
  return false;
}

bool IsRequiredSignal(const SignalKind kind) {
  return kind != SignalKind::kSecurity;
}

SignalWeights DefaultSignalWeights() {
  return MakeWeights(0.20, 0.15, 0.10, 0.25, 0.10, 0.20);
}

ProfileTable DefaultProfileTable() {
  ProfileTable table;
  const auto add = [&table](std::string name, SignalWeights weights, bool paranoia) {
    SiteTypeProfile profile;
    profile.name = name;
    profile.weights = std::move(weights);
    profile.paranoia = paranoia;
    table.emplace(std::move(name), std::move(profile));
  };

  add(std::string(kGeneralSiteType), DefaultSignalWeights(), false);
  add("ecommerce", MakeWeights(0.25, 0.15, 0.15, 0.20, 0.05, 0.20), false);
  add("company_portfolio", MakeWeights(0.15, 0.10, 0.05, 0.35, 0.15, 0.20), false);
  add("financial", MakeWeights(0.10, 0.25, 0.05, 0.20, 0.10, 0.30), false);
  add("saas_subscription", MakeWeights(0.20, 0.15, 0.15, 0.20, 0.10, 0.20), false);
  add("darknet_suspicious", MakeWeights(0.15, 0.15, 0.10, 0.20, 0.10, 0.30), true);
  return table;
}

bool ValidateSignalWeights(const SignalWeights& weights, std::string& error) {
  double total = 0.0;
  double required_total = 0.0;
  for (const SignalKind kind : kAllSignals) {
    const auto it = weights.find(kind);
    if (it == weights.end()) {
      if (IsRequiredSignal(kind)) {
        error = std::string("missing weight entry for signal '") + ToString(kind) + "'";
        return false;
      }
      continue;
    }
    if (!std::isfinite(it->second) || it->second < 0.0) {
      error = std::string("weight for signal '") + ToString(kind) +
              "' must be a finite non-negative number";
      return false;
    }
    total += it->second;
    if (IsRequiredSignal(kind)) {
      required_total += it->second;
    }
  }
  if (total <= 0.0) {
    error = "signal weights must have a positive total";
    return false;
  }
  // Security is optional per audit, so the required signals alone must be
  // able to carry a score.
  if (required_total <= 0.0) {
    error = "signal weights must have a positive total over the required signals";
    return false;
  }
  return true;
}

bool ResolveSiteTypeProfile(const ProfileTable& table, std::string_view site_type,
                            SiteTypeProfile& profile, std::string& error) {
  const std::string_view key = site_type.empty() ? kGeneralSiteType : site_type;
  const auto it = table.find(key);
  if (it == table.end()) {
    error = "unknown site type '" + std::string(key) + "'";
    return false;
  }
  std::string weights_error;
  if (!ValidateSignalWeights(it->second.weights, weights_error)) {
    error = "site type '" + std::string(key) + "': " + weights_error;
    return false;
  }
  profile = it->second;
  return true;
}

SignalWeights Renormalize(const SignalWeights& weights,
                          const std::map<SignalKind, bool>& present) {
  SignalWeights kept;
  double total = 0.0;
  for (const auto& [kind, weight] : weights) {
    const auto it = present.find(kind);
    if (it == present.end() || !it->second) {
      continue;
    }
    kept[kind] = weight;
    total += weight;
  }
  if (total <= 0.0) {
    return kept;
  }
  for (auto& [kind, weight] : kept) {
    (void)kind;
    weight /= total;
  }
  return kept;
}

} // namespace siteaudit::scoring
