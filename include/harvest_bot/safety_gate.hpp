// === Safety Gate =============================================================
//
// Pre-navigation checks run once before a mission is allowed to move the
// robot. Violations are returned as values so callers can report every
// problem at once; the gate never throws for an unsafe robot.

#pragma once

#include <string>
#include <vector>

#include "harvest_bot/mission_command.hpp"
#include "harvest_bot/robot_state.hpp"

namespace harvest_bot {

/** @brief Category of a failed precondition. */
enum class SafetyIssueKind {
    LowFuel,
    LowBattery,
    NoGpsFix
};

/** @brief Single failed precondition with a human-readable explanation. */
struct SafetyIssue final {
    SafetyIssueKind kind{};
    std::string message{};
};

/**
 * @brief Evaluate fuel, battery and GPS preconditions, in that order.
 *
 * @return Every violated check; empty when the robot may start navigating.
 */
[[nodiscard]] std::vector<SafetyIssue> check_preconditions(const RobotState& state, const SafetyLimits& limits);

}  // namespace harvest_bot
