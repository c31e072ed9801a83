#include "harvest_bot/navigation.hpp"

#include "harvest_bot/errors.hpp"
#include "harvest_bot/geodesy.hpp"

namespace harvest_bot {

WaypointResult plan_leg(const RobotState& state, const Waypoint& waypoint) {
    if (!state.current_position.has_value()) {
        throw MissingPositionError("Cannot navigate to waypoint " + waypoint.id + " without a current position");
    }
    const GeoPosition& origin = state.current_position.value();

    WaypointResult result{};
    result.waypoint_id = waypoint.id;
    result.distance_m = haversine_distance_m(origin, waypoint.position);
    result.bearing_deg = initial_bearing_deg(origin, waypoint.position);
    if (result.distance_m == 0.0) {
        result.bearing_deg = origin.heading_deg.value_or(0.0);
    }
    result.velocity_mps = waypoint.velocity_mps;
    result.estimated_time_s = waypoint.velocity_mps > 0.0 ? result.distance_m / waypoint.velocity_mps : 0.0;
    result.action = waypoint.action;
    result.arrival_position = waypoint.position;
    result.arrival_position.heading_deg = result.bearing_deg;
    return result;
}

NavigationTotals summarize_navigation(const std::vector<WaypointResult>& results, double declared_path_length_m) {
    NavigationTotals totals{};
    totals.waypoint_count = results.size();
    totals.declared_path_length_m = declared_path_length_m;
    for (const WaypointResult& result : results) {
        totals.total_distance_m += result.distance_m;
        totals.total_time_s += result.estimated_time_s;
    }
    if (totals.total_time_s > 0.0) {
        totals.average_speed_mps = totals.total_distance_m / totals.total_time_s;
    }
    return totals;
}

}  // namespace harvest_bot
