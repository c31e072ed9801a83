// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the mission core (time primitives, geographic positions, robot status).

#pragma once

#include <chrono>
#include <optional>
#include <string_view>

namespace harvest_bot {

/**
 * @brief Alias for the wall clock used to stamp telemetry.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = std::chrono::time_point<WallClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in degrees with an optional heading.
 */
struct GeoPosition final {
    double latitude_deg{};                 /**< Latitude in decimal degrees, [-90, 90]. */
    double longitude_deg{};                /**< Longitude in decimal degrees, [-180, 180]. */
    std::optional<double> heading_deg{};   /**< Compass heading in degrees when known. */
};

/**
 * @brief Enumerates the lifecycle states of a harvesting robot.
 */
enum class RobotStatus {
    Idle,              /**< Robot is waiting for a mission to execute. */
    Navigating,        /**< Robot is stepping through its waypoint plan. */
    MissionCompleted,  /**< Every waypoint of the plan has been executed. */
    Aborted            /**< Mission was stopped by the safety gate, a cancel, or a fault. */
};

/**
 * @brief Stable lowercase name for @p status, used in logs and reports.
 */
std::string_view to_string(RobotStatus status) noexcept;

}  // namespace harvest_bot
