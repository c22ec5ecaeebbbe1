#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace siteaudit::events {

// Appends one JSON-serialized event as a single line to `events_path`.
//
// Contract:
// - Creates the parent directory if needed.
// - Opens the file in append mode; earlier lines are never rewritten.
// - Returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& events_path,
                      std::string& error);

} // namespace siteaudit::events
