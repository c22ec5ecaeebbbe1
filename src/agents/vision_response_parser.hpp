#pragma once

#include "agents/evidence.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace siteaudit::agents {

struct Detected {
  std::vector<VisionFinding> findings;
  std::uint32_t badge_count = 0;
  std::uint32_t unverifiable_badge_count = 0;
};

struct NotDetected {
  std::uint32_t badge_count = 0;
};

struct Unparseable {
  std::string raw_text;
  std::string reason;
};

using VisionResponse = std::variant<Detected, NotDetected, Unparseable>;

// Single entry point for interpreting vision-model text. Accepted shapes:
// - a JSON object with "detected" and/or "findings"
// - a JSON array of finding objects (empty means nothing detected)
// - a bare finding object with "pattern"
// - any of the above wrapped in markdown code fences or surrounding prose
// - plain text that explicitly reports no dark patterns
// Everything else is Unparseable with the raw text preserved.
VisionResponse ParseVisionResponse(std::string_view raw_text);

// One model response per analysed screenshot.
struct ScreenshotResponse {
  std::string screenshot;
  std::string raw_text;
};

// Folds parsed responses into a VisionResult:
// - visual_score = 1 - 0.5 x sum(severity x confidence) over non-temporal
//   findings, clamped to [0,1]
// - temporal_score likewise with factor 0.6 over urgency/temporal findings
// - fake_timer_detected when a temporal finding names a countdown or timer
// - critical findings keep their flag for hard-stop evaluation
// Unparseable responses are counted and contribute nothing.
VisionResult BuildVisionResult(const std::vector<ScreenshotResponse>& responses);

} // namespace siteaudit::agents
