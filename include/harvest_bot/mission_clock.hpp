// === Mission Clock ===========================================================
//
// Time source and pacing strategy injected into the mission executor. Live
// deployments pace waypoints against the wall clock; tests use the manual
// clock so execution stays synchronous and deterministic.

#pragma once

#include <memory>

#include "harvest_bot/types.hpp"

namespace harvest_bot {

/** @brief Supplies telemetry timestamps and the delay between waypoints. */
class MissionClock {
  public:
    virtual ~MissionClock() = default;

    /** @brief Current time used to stamp telemetry. */
    [[nodiscard]] virtual TimePoint now() const = 0;
    /** @brief Wait out the pacing interval between two waypoints. */
    virtual void pace(const Duration& interval) = 0;
};

/** @brief Wall-clock implementation that blocks the calling thread while pacing. */
class SystemMissionClock final : public MissionClock {
  public:
    [[nodiscard]] TimePoint now() const override;
    void pace(const Duration& interval) override;
};

/** @brief Deterministic clock whose time only moves when paced or advanced. */
class ManualMissionClock final : public MissionClock {
  public:
    explicit ManualMissionClock(TimePoint start = TimePoint{});

    [[nodiscard]] TimePoint now() const override;
    void pace(const Duration& interval) override;
    /** @brief Move the clock forward by @p interval. */
    void advance(const Duration& interval);

  private:
    TimePoint now_;
};

using MissionClockPtr = std::shared_ptr<MissionClock>;

}  // namespace harvest_bot
