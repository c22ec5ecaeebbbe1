#include "agents/agent_contracts.hpp"

#include <algorithm>
#include <cctype>

namespace siteaudit::agents {

const char* ToString(const VerdictMode mode) {
  switch (mode) {
  case VerdictMode::kExpert:
    return "expert";
  case VerdictMode::kSimple:
    return "simple";
  }
  return "expert";
}

bool ParseVerdictMode(std::string_view raw, VerdictMode& mode, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized == "expert") {
    mode = VerdictMode::kExpert;
    return true;
  }
  if (normalized == "simple") {
    mode = VerdictMode::kSimple;
    return true;
  }
  error = "invalid verdict mode '" + std::string(raw) + "' (expected expert|simple)";
  return false;
}

} // namespace siteaudit::agents
