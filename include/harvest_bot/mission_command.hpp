// === Mission Command =========================================================
//
// Strongly-typed rendition of the mission command document produced by the
// planning service. A command is addressed to exactly one robot and carries
// the ordered waypoint plan together with the limits and parameters that
// govern its execution.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "harvest_bot/types.hpp"

namespace harvest_bot {

/**
 * @brief Action the robot performs on arrival at a waypoint.
 */
enum class WaypointAction {
    Navigate,         /**< Plain transit leg. */
    Turn,             /**< Headland turn between rows. */
    HarvestStart,     /**< Engage the cutter and begin filling the hopper. */
    HarvestContinue,  /**< Keep harvesting along the row. */
    HarvestEnd        /**< Disengage the cutter. */
};

/** @brief Document name of @p action (e.g. "harvest_start"). */
std::string_view to_string(WaypointAction action) noexcept;

/**
 * @brief Parse a document action name, accepting the legacy aliases
 *        "start_harvest", "harvest" and "end_harvest".
 */
[[nodiscard]] std::optional<WaypointAction> waypoint_action_from_string(std::string_view name);

/** @brief True for actions that feed material into the hopper. */
[[nodiscard]] bool is_harvesting(WaypointAction action) noexcept;

/**
 * @brief Single step of a navigation plan.
 */
struct Waypoint final {
    std::string id{};                             /**< Planner-assigned waypoint identifier. */
    GeoPosition position{};                       /**< Target position. */
    double velocity_mps{};                        /**< Desired speed; 0 holds position. */
    WaypointAction action{WaypointAction::Navigate};
};

/**
 * @brief Ordered list of waypoints executed strictly in sequence.
 */
struct NavigationPlan final {
    GeoPosition start_position{};
    std::vector<Waypoint> waypoints{};
    double declared_path_length_m{};  /**< Path length reported by the planner. */
};

struct SafetyLimits final {
    double min_fuel_percent{};
    double min_battery_voltage_v{};
};

struct HarvestParameters final {
    double cutting_height_cm{};
    double blade_speed_rpm{};
    double conveyor_speed_mps{};
    double hopper_capacity_kg{};
};

struct ZoneAssignment final {
    std::string zone_id{};
    std::string zone_name{};
    double area_ha{};
};

struct ExpectedResults final {
    double area_to_harvest_ha{};
    double estimated_yield_tons{};
    double estimated_duration_hours{};
    double revenue_estimate_brl{};
};

/**
 * @brief Complete mission order addressed to a single robot.
 */
struct MissionCommand final {
    std::string robot_id{};
    std::string mission_id{};
    std::string command_id{};
    ZoneAssignment zone_assignment{};
    NavigationPlan navigation_plan{};
    SafetyLimits safety_limits{};
    HarvestParameters harvest_parameters{};
    ExpectedResults expected_results{};
};

}  // namespace harvest_bot
