#include "harvest_bot/safety_gate.hpp"

#include <fmt/format.h>

namespace harvest_bot {

std::vector<SafetyIssue> check_preconditions(const RobotState& state, const SafetyLimits& limits) {
    std::vector<SafetyIssue> list_issues;

    if (state.fuel_level_percent < limits.min_fuel_percent) {
        list_issues.push_back(SafetyIssue{
            SafetyIssueKind::LowFuel,
            fmt::format("low fuel: {}% (minimum {}%)", state.fuel_level_percent, limits.min_fuel_percent)
        });
    }

    if (state.battery_voltage_v < limits.min_battery_voltage_v) {
        list_issues.push_back(SafetyIssue{
            SafetyIssueKind::LowBattery,
            fmt::format("low battery: {}V (minimum {}V)", state.battery_voltage_v, limits.min_battery_voltage_v)
        });
    }

    if (!state.current_position.has_value()) {
        list_issues.push_back(SafetyIssue{SafetyIssueKind::NoGpsFix, "no GPS fix"});
    }

    return list_issues;
}

}  // namespace harvest_bot
