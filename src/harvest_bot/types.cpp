#include "harvest_bot/types.hpp"

namespace harvest_bot {

std::string_view to_string(RobotStatus status) noexcept {
    switch (status) {
        case RobotStatus::Idle:
            return "idle";
        case RobotStatus::Navigating:
            return "navigating";
        case RobotStatus::MissionCompleted:
            return "mission_completed";
        case RobotStatus::Aborted:
            return "aborted";
    }
    return "unknown";
}

}  // namespace harvest_bot
