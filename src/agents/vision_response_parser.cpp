#include "agents/vision_response_parser.hpp"

#include "core/json_dom.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

namespace siteaudit::agents {

namespace {

using JsonValue = core::json::Value;

constexpr double kDefaultFindingConfidence = 0.7;
constexpr double kVisualPenaltyFactor = 0.5;
constexpr double kTemporalPenaltyFactor = 0.6;

constexpr std::array<std::string_view, 6> kNegativePhrases{
    "no dark pattern", "none detected",       "not detected",
    "no deceptive",    "no manipulative",     "nothing suspicious",
};

std::string ToLowerAscii(std::string_view raw) {
  std::string out(raw);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view raw) {
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())) != 0) {
    raw.remove_prefix(1);
  }
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back())) != 0) {
    raw.remove_suffix(1);
  }
  return raw;
}

// Returns the body of the first ``` fenced block, or the input unchanged.
std::string_view StripCodeFence(std::string_view text) {
  const std::size_t open = text.find("```");
  if (open == std::string_view::npos) {
    return text;
  }
  const std::size_t body_start = text.find('\n', open);
  if (body_start == std::string_view::npos) {
    return text;
  }
  const std::size_t close = text.find("```", body_start + 1);
  if (close == std::string_view::npos) {
    return text.substr(body_start + 1);
  }
  return text.substr(body_start + 1, close - body_start - 1);
}

// Narrows prose-wrapped output to the outermost JSON object or array.
std::optional<std::string_view> ExtractJsonCandidate(std::string_view text) {
  const std::size_t first = text.find_first_of("{[");
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  const char closer = text[first] == '{' ? '}' : ']';
  const std::size_t last = text.rfind(closer);
  if (last == std::string_view::npos || last < first) {
    return std::nullopt;
  }
  return text.substr(first, last - first + 1);
}

bool ReportsNothing(std::string_view text) {
  const std::string lowered = ToLowerAscii(text);
  return std::any_of(kNegativePhrases.begin(), kNegativePhrases.end(),
                     [&lowered](std::string_view phrase) {
                       return lowered.find(phrase) != std::string::npos;
                     });
}

double SeverityFromText(std::string_view raw, bool& critical) {
  const std::string lowered = ToLowerAscii(raw);
  if (lowered == "critical") {
    critical = true;
    return 1.0;
  }
  if (lowered == "high") {
    return 0.85;
  }
  if (lowered == "medium" || lowered == "moderate") {
    return 0.6;
  }
  if (lowered == "low") {
    return 0.3;
  }
  return 0.5;
}

std::optional<VisionFinding> ParseFinding(const JsonValue& item) {
  if (!item.IsObject()) {
    return std::nullopt;
  }
  std::optional<std::string> pattern = core::json::FindString(item, "pattern");
  if (!pattern.has_value()) {
    pattern = core::json::FindString(item, "pattern_id");
  }
  if (!pattern.has_value()) {
    pattern = core::json::FindString(item, "type");
  }
  if (!pattern.has_value() || pattern->empty()) {
    return std::nullopt;
  }

  VisionFinding finding;
  finding.pattern_id = *pattern;
  finding.category = core::json::StringOr(item, "category", "unknown");
  finding.confidence =
      std::clamp(core::json::NumberOr(item, "confidence", kDefaultFindingConfidence), 0.0, 1.0);
  finding.critical = core::json::BoolOr(item, "critical", false);

  if (const JsonValue* severity = core::json::FindMember(item, "severity"); severity != nullptr) {
    if (severity->IsNumber()) {
      finding.severity = std::clamp(severity->number_value, 0.0, 1.0);
    } else if (severity->IsString()) {
      finding.severity = SeverityFromText(severity->string_value, finding.critical);
    }
  } else {
    finding.severity = 0.5;
  }

  finding.evidence = core::json::StringOr(item, "evidence", "");
  if (finding.evidence.empty()) {
    finding.evidence = core::json::StringOr(item, "description", "");
  }
  return finding;
}

std::uint32_t CountOr(const JsonValue& object, std::string_view key) {
  std::uint64_t value = 0;
  const JsonValue* member = core::json::FindMember(object, key);
  if (member == nullptr || !core::json::TryGetNonNegativeInteger(*member, value)) {
    return 0U;
  }
  return static_cast<std::uint32_t>(std::min<std::uint64_t>(value, 1'000'000U));
}

VisionResponse FromFindingArray(const JsonValue& array, std::string_view raw_text) {
  Detected detected;
  for (const auto& item : array.array_value) {
    if (auto finding = ParseFinding(item); finding.has_value()) {
      detected.findings.push_back(std::move(*finding));
    }
  }
  if (!detected.findings.empty()) {
    return detected;
  }
  if (array.array_value.empty()) {
    return NotDetected{};
  }
  return Unparseable{.raw_text = std::string(raw_text),
                     .reason = "array contains no recognizable findings"};
}

VisionResponse FromObject(const JsonValue& object, std::string_view raw_text) {
  if (auto bare = ParseFinding(object); bare.has_value()) {
    Detected detected;
    detected.findings.push_back(std::move(*bare));
    return detected;
  }

  const std::uint32_t badges = CountOr(object, "badges_total");
  const std::uint32_t unverifiable = std::min(badges, CountOr(object, "badges_unverifiable"));
  const std::optional<bool> flag = core::json::FindBool(object, "detected");

  const JsonValue* findings = core::json::FindMember(object, "findings");
  if (findings == nullptr) {
    findings = core::json::FindMember(object, "patterns");
  }

  if (flag.has_value() && !*flag) {
    return NotDetected{.badge_count = badges};
  }

  if (findings != nullptr && findings->IsArray()) {
    VisionResponse parsed = FromFindingArray(*findings, raw_text);
    if (auto* detected = std::get_if<Detected>(&parsed)) {
      detected->badge_count = badges;
      detected->unverifiable_badge_count = unverifiable;
    } else if (std::holds_alternative<NotDetected>(parsed)) {
      if (unverifiable > 0U) {
        return Detected{.findings = {}, .badge_count = badges,
                        .unverifiable_badge_count = unverifiable};
      }
      return NotDetected{.badge_count = badges};
    }
    return parsed;
  }

  if (flag.has_value() && *flag) {
    VisionFinding unspecified;
    unspecified.pattern_id = "unspecified";
    unspecified.category = core::json::StringOr(object, "category", "unknown");
    unspecified.severity = 0.5;
    unspecified.confidence = 0.5;
    return Detected{.findings = {unspecified}, .badge_count = badges,
                    .unverifiable_badge_count = unverifiable};
  }

  return Unparseable{.raw_text = std::string(raw_text),
                     .reason = "object has no detection fields"};
}

bool IsTemporal(const VisionFinding& finding) {
  const std::string category = ToLowerAscii(finding.category);
  return category == "temporal" || category == "urgency" || category == "false_urgency";
}

bool NamesTimer(const VisionFinding& finding) {
  const std::string pattern = ToLowerAscii(finding.pattern_id);
  return pattern.find("countdown") != std::string::npos ||
         pattern.find("timer") != std::string::npos;
}

} // namespace

VisionResponse ParseVisionResponse(std::string_view raw_text) {
  const std::string_view trimmed = Trim(raw_text);
  if (trimmed.empty()) {
    return Unparseable{.raw_text = std::string(raw_text), .reason = "empty response"};
  }

  const std::string_view body = Trim(StripCodeFence(trimmed));
  if (const auto candidate = ExtractJsonCandidate(body); candidate.has_value()) {
    JsonValue root;
    std::string parse_error;
    if (core::json::Parse(*candidate, root, parse_error)) {
      if (root.IsArray()) {
        return FromFindingArray(root, raw_text);
      }
      if (root.IsObject()) {
        return FromObject(root, raw_text);
      }
    }
    if (ReportsNothing(body)) {
      return NotDetected{};
    }
    return Unparseable{.raw_text = std::string(raw_text),
                       .reason = parse_error.empty() ? "unexpected JSON shape" : parse_error};
  }

  if (ReportsNothing(body)) {
    return NotDetected{};
  }
  return Unparseable{.raw_text = std::string(raw_text), .reason = "no JSON payload found"};
}

VisionResult BuildVisionResult(const std::vector<ScreenshotResponse>& responses) {
  VisionResult result;
  result.visual_score = 1.0;
  result.temporal_score = 1.0;

  double visual_penalty = 0.0;
  double temporal_penalty = 0.0;
  for (const auto& response : responses) {
    ++result.screenshots_analyzed;
    const VisionResponse parsed = ParseVisionResponse(response.raw_text);

    if (std::holds_alternative<Unparseable>(parsed)) {
      ++result.unparseable_responses;
      continue;
    }
    if (const auto* nothing = std::get_if<NotDetected>(&parsed)) {
      result.badge_count += nothing->badge_count;
      continue;
    }

    const auto& detected = std::get<Detected>(parsed);
    result.badge_count += detected.badge_count;
    result.fake_badge_count += detected.unverifiable_badge_count;
    for (VisionFinding finding : detected.findings) {
      finding.screenshot = response.screenshot;
      const double weight = finding.severity * finding.confidence;
      if (IsTemporal(finding)) {
        temporal_penalty += weight;
        if (NamesTimer(finding)) {
          result.fake_timer_detected = true;
        }
      } else {
        visual_penalty += weight;
      }
      result.findings.push_back(std::move(finding));
    }
  }

  // Every response unreadable: no evidence either way.
  if (!responses.empty() && result.unparseable_responses == result.screenshots_analyzed) {
    result.visual_score = 0.5;
    result.temporal_score = 0.5;
    return result;
  }

  result.visual_score = std::clamp(1.0 - kVisualPenaltyFactor * visual_penalty, 0.0, 1.0);
  result.temporal_score = std::clamp(1.0 - kTemporalPenaltyFactor * temporal_penalty, 0.0, 1.0);
  return result;
}

} // namespace siteaudit::agents
