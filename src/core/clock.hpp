#pragma once

#include <chrono>

namespace siteaudit::core {

// Time source injected into breakers, reputation tracking and the audit loop.
//
// Recovery deadlines and stage budgets use the monotonic steady time so wall
// clock jumps never reopen a breaker early. Reputation windows and event
// timestamps use wall time.
class IClock {
public:
  using SteadyTimePoint = std::chrono::steady_clock::time_point;
  using WallTimePoint = std::chrono::system_clock::time_point;

  virtual ~IClock() = default;

  virtual SteadyTimePoint NowSteady() const = 0;
  virtual WallTimePoint NowWall() const = 0;
};

// Real clock pair. Wall time is derived from one anchor pair plus the steady
// delta so the two readings never disagree about elapsed time.
class SystemClock final : public IClock {
public:
  SystemClock();

  static SystemClock& Instance();

  SteadyTimePoint NowSteady() const override;
  WallTimePoint NowWall() const override;

private:
  WallTimePoint wall_anchor_{};
  SteadyTimePoint steady_anchor_{};
};

} // namespace siteaudit::core
