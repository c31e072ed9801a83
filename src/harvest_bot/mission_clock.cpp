#include "harvest_bot/mission_clock.hpp"

#include <thread>

namespace harvest_bot {

TimePoint SystemMissionClock::now() const {
    return WallClock::now();
}

void SystemMissionClock::pace(const Duration& interval) {
    if (interval.count() <= 0.0) {
        return;
    }
    std::this_thread::sleep_for(interval);
}

ManualMissionClock::ManualMissionClock(TimePoint start)
    : now_(start) {}

TimePoint ManualMissionClock::now() const {
    return now_;
}

void ManualMissionClock::pace(const Duration& interval) {
    advance(interval);
}

void ManualMissionClock::advance(const Duration& interval) {
    if (interval.count() <= 0.0) {
        return;
    }
    now_ += std::chrono::duration_cast<WallClock::duration>(interval);
}

}  // namespace harvest_bot
