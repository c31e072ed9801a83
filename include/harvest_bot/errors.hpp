// === Errors ==================================================================
//
// Exception types raised by the mission core. Safety violations are not
// represented here; the safety gate reports them as values.

#pragma once

#include <stdexcept>
#include <string>

namespace harvest_bot {

/** @brief A mission command was addressed to a different robot. */
class RobotMismatchError final : public std::invalid_argument {
  public:
    RobotMismatchError(const std::string& command_robot_id, const std::string& executing_robot_id);

    [[nodiscard]] const std::string& command_robot_id() const noexcept;
    [[nodiscard]] const std::string& executing_robot_id() const noexcept;

  private:
    std::string str_command_robot_id_;
    std::string str_executing_robot_id_;
};

/** @brief Execution was requested before any command was loaded. */
class NoMissionLoadedError final : public std::logic_error {
  public:
    explicit NoMissionLoadedError(const std::string& robot_id);
};

/** @brief Navigation was requested while the robot has no position fix. */
class MissingPositionError final : public std::logic_error {
  public:
    explicit MissingPositionError(const std::string& what_arg);
};

/** @brief The robot is navigating and cannot accept the requested change. */
class MissionInProgressError final : public std::logic_error {
  public:
    explicit MissionInProgressError(const std::string& what_arg);
};

/** @brief A coordinate is outside the valid latitude/longitude range or not finite. */
class InvalidCoordinateError final : public std::invalid_argument {
  public:
    explicit InvalidCoordinateError(const std::string& what_arg);
};

}  // namespace harvest_bot
