#include "harvest_bot/mission_command.hpp"

#include <array>
#include <utility>

namespace harvest_bot {

namespace {

constexpr std::array<std::pair<std::string_view, WaypointAction>, 8> k_action_names{{
    {"navigate", WaypointAction::Navigate},
    {"turn", WaypointAction::Turn},
    {"harvest_start", WaypointAction::HarvestStart},
    {"harvest_continue", WaypointAction::HarvestContinue},
    {"harvest_end", WaypointAction::HarvestEnd},
    {"start_harvest", WaypointAction::HarvestStart},
    {"harvest", WaypointAction::HarvestContinue},
    {"end_harvest", WaypointAction::HarvestEnd},
}}; /**< Canonical names first, then the legacy planner aliases. */

}  // namespace

std::string_view to_string(WaypointAction action) noexcept {
    for (const auto& [name, candidate] : k_action_names) {
        if (candidate == action) {
            return name;
        }
    }
    return "unknown";
}

std::optional<WaypointAction> waypoint_action_from_string(std::string_view name) {
    for (const auto& [candidate_name, action] : k_action_names) {
        if (candidate_name == name) {
            return action;
        }
    }
    return std::nullopt;
}

bool is_harvesting(WaypointAction action) noexcept {
    return action == WaypointAction::HarvestStart || action == WaypointAction::HarvestContinue;
}

}  // namespace harvest_bot
