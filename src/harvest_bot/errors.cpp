#include "harvest_bot/errors.hpp"

namespace harvest_bot {

RobotMismatchError::RobotMismatchError(const std::string& command_robot_id, const std::string& executing_robot_id)
    : std::invalid_argument("Command addressed to " + command_robot_id + ", not to " + executing_robot_id),
      str_command_robot_id_(command_robot_id),
      str_executing_robot_id_(executing_robot_id) {}

const std::string& RobotMismatchError::command_robot_id() const noexcept {
    return str_command_robot_id_;
}

const std::string& RobotMismatchError::executing_robot_id() const noexcept {
    return str_executing_robot_id_;
}

NoMissionLoadedError::NoMissionLoadedError(const std::string& robot_id)
    : std::logic_error("No mission loaded on robot " + robot_id) {}

MissingPositionError::MissingPositionError(const std::string& what_arg)
    : std::logic_error(what_arg) {}

MissionInProgressError::MissionInProgressError(const std::string& what_arg)
    : std::logic_error(what_arg) {}

InvalidCoordinateError::InvalidCoordinateError(const std::string& what_arg)
    : std::invalid_argument(what_arg) {}

}  // namespace harvest_bot
