// === Navigation ==============================================================
//
// Computes individual legs of a waypoint plan from the robot's current state
// and aggregates the resulting per-leg figures. Nothing here mutates robot
// state; the mission executor applies a computed leg once it is complete.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "harvest_bot/mission_command.hpp"
#include "harvest_bot/robot_state.hpp"

namespace harvest_bot {

/**
 * @brief Outcome of travelling one leg of the plan.
 */
struct WaypointResult final {
    std::string waypoint_id{};
    double distance_m{};          /**< Great-circle length of the leg. */
    double bearing_deg{};         /**< Initial bearing of the leg, [0, 360). */
    double velocity_mps{};        /**< Commanded speed for the leg. */
    double estimated_time_s{};    /**< Travel time, 0 for hold-position legs. */
    WaypointAction action{WaypointAction::Navigate};
    GeoPosition arrival_position{}; /**< Waypoint position carrying the leg bearing as heading. */
};

/**
 * @brief Totals over a sequence of executed legs.
 */
struct NavigationTotals final {
    std::size_t waypoint_count{};
    double total_distance_m{};
    double total_time_s{};
    double average_speed_mps{};       /**< 0 when no travel time elapsed. */
    double declared_path_length_m{};  /**< Planner-declared length, for comparison. */
};

/**
 * @brief Compute the leg from the current position of @p state to @p waypoint.
 *
 * A waypoint that coincides with the current position keeps the previous
 * heading as its bearing (0 when no heading is known).
 *
 * @throws MissingPositionError when @p state has no current position.
 * @throws InvalidCoordinateError when either position is malformed.
 */
[[nodiscard]] WaypointResult plan_leg(const RobotState& state, const Waypoint& waypoint);

/**
 * @brief Sum distances and travel times over @p results.
 */
[[nodiscard]] NavigationTotals summarize_navigation(const std::vector<WaypointResult>& results, double declared_path_length_m);

}  // namespace harvest_bot
