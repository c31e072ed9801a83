// === Resource Model ==========================================================
//
// Rules describing how consumables and the hopper evolve as the robot executes
// each waypoint. The model is a pure function over a state snapshot; the
// mission executor decides when to apply it.

#pragma once

#include "harvest_bot/mission_command.hpp"
#include "harvest_bot/robot_state.hpp"

namespace harvest_bot {

/**
 * @brief Per-waypoint consumption and accumulation rates.
 */
struct ResourceModelParams final {
    double fuel_per_waypoint_percent{0.5};        /**< Fuel burnt by every executed waypoint. */
    double hopper_fill_per_harvest_percent{15.0}; /**< Hopper gain for each harvesting waypoint. */
    double harvest_rate_kg_per_min{180.0};        /**< Throughput while the cutter is engaged. */
};

/**
 * @brief Return @p state after the resource effect of executing @p waypoint.
 *
 * Fuel is clamped at 0 and the hopper at 100 percent. Battery voltage is not
 * modelled and passes through unchanged.
 */
[[nodiscard]] RobotState apply_waypoint_effect(const RobotState& state,
                                               const Waypoint& waypoint,
                                               const ResourceModelParams& params = {});

}  // namespace harvest_bot
