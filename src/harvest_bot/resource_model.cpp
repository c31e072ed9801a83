#include "harvest_bot/resource_model.hpp"

#include <algorithm>

namespace harvest_bot {

namespace {
constexpr double k_percent_scale{100.0};
}  // namespace

RobotState apply_waypoint_effect(const RobotState& state, const Waypoint& waypoint, const ResourceModelParams& params) {
    RobotState next_state = state;
    next_state.fuel_level_percent = std::max(0.0, state.fuel_level_percent - params.fuel_per_waypoint_percent);

    if (is_harvesting(waypoint.action)) {
        next_state.hopper_fill_percent = std::min(k_percent_scale, state.hopper_fill_percent + params.hopper_fill_per_harvest_percent);
        next_state.harvest_rate_kg_per_min = params.harvest_rate_kg_per_min;
    } else if (waypoint.action == WaypointAction::HarvestEnd) {
        next_state.harvest_rate_kg_per_min = 0.0;
    }
    return next_state;
}

}  // namespace harvest_bot
