#pragma once

#include <optional>

#include "harvest_bot/types.hpp"

namespace harvest_bot {

/**
 * @brief Captures the mutable resource and navigation state of one robot.
 */
struct RobotState final {
    RobotStatus status{RobotStatus::Idle};        /**< High-level lifecycle status. */
    double fuel_level_percent{100.0};             /**< Remaining fuel, [0, 100]. */
    double battery_voltage_v{};                   /**< Measured battery voltage. */
    double hopper_fill_percent{};                 /**< Hopper fill level, [0, 100]. */
    double harvest_rate_kg_per_min{};             /**< Current harvest throughput. */
    double velocity_mps{};                        /**< Commanded ground speed of the last leg. */
    std::optional<GeoPosition> current_position{}; /**< Last known position, empty without a GPS fix. */
    double total_distance_m{};                    /**< Distance travelled during the current mission. */
};

}  // namespace harvest_bot
