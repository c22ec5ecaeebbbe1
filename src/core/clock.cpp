#include "core/clock.hpp"

namespace siteaudit::core {

SystemClock::SystemClock()
    : wall_anchor_(std::chrono::system_clock::now()),
      steady_anchor_(std::chrono::steady_clock::now()) {}

SystemClock& SystemClock::Instance() {
  static SystemClock clock;
  return clock;
}

IClock::SteadyTimePoint SystemClock::NowSteady() const {
  return std::chrono::steady_clock::now();
}

IClock::WallTimePoint SystemClock::NowWall() const {
  const auto steady_delta = NowSteady() - steady_anchor_;
  return wall_anchor_ + std::chrono::duration_cast<WallTimePoint::duration>(steady_delta);
}

} // namespace siteaudit::core
