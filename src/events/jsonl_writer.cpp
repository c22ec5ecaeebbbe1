#include "events/jsonl_writer.hpp"

#include "core/fs_utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace siteaudit::events {

bool AppendEventJsonl(const Event& event, const fs::path& events_path, std::string& error) {
  if (events_path.empty()) {
    error = "event log path cannot be empty";
    return false;
  }
  if (!core::EnsureParentDirectory(events_path, error)) {
    return false;
  }

  std::ofstream out_file(events_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + events_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  if (!out_file) {
    error = "failed while writing event log '" + events_path.string() + "'";
    return false;
  }

  return true;
}

} // namespace siteaudit::events
