#include "harvest_bot/mission_executor.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "harvest_bot/errors.hpp"
#include "harvest_bot/geodesy.hpp"
#include "harvest_bot/logging.hpp"

namespace harvest_bot {

namespace {
constexpr double k_percent_scale{100.0};
constexpr char k_cancel_reason[] = "cancel requested";
}  // namespace

MissionExecutor::MissionExecutor(std::string robot_id, ExecutorConfig config, MissionClockPtr clock)
    : str_robot_id_(std::move(robot_id)),
      config_(config),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (str_robot_id_.empty()) {
        throw std::invalid_argument("MissionExecutor robot identifier cannot be empty");
    }
    if (clock_ == nullptr) {
        throw std::invalid_argument("MissionExecutor requires a clock");
    }
    if (config_.waypoint_pacing.count() < 0.0) {
        throw std::invalid_argument("MissionExecutor waypoint pacing cannot be negative");
    }
    if (config_.nominal_battery_voltage_v <= 0.0) {
        throw std::invalid_argument("MissionExecutor nominal battery voltage must be positive");
    }
    struct_state_.status = RobotStatus::Idle;
    struct_state_.fuel_level_percent = k_percent_scale;
    struct_state_.hopper_fill_percent = 0.0;
    struct_state_.battery_voltage_v = config_.nominal_battery_voltage_v;
}

const std::string& MissionExecutor::robot_id() const noexcept {
    return str_robot_id_;
}

/**
 * @brief Expose the current state snapshot for observers.
 */
const RobotState& MissionExecutor::state() const noexcept {
    return struct_state_;
}

const TelemetryLog& MissionExecutor::telemetry_log() const noexcept {
    return telemetry_log_;
}

const ExecutorConfig& MissionExecutor::config() const noexcept {
    return config_;
}

const std::optional<MissionCommand>& MissionExecutor::command() const noexcept {
    return optional_command_;
}

bool MissionExecutor::has_pending_mission() const noexcept {
    return flag_mission_pending_;
}

void MissionExecutor::load_command(MissionCommand command) {
    if (command.robot_id != str_robot_id_) {
        logger_->error("Robot {} rejected command {} addressed to {}", str_robot_id_, command.command_id, command.robot_id);
        throw RobotMismatchError(command.robot_id, str_robot_id_);
    }
    if (struct_state_.status == RobotStatus::Navigating) {
        throw MissionInProgressError("Robot " + str_robot_id_ + " is navigating and cannot load command " + command.command_id);
    }
    validate_position(command.navigation_plan.start_position);

    struct_state_.current_position = command.navigation_plan.start_position;
    struct_state_.total_distance_m = 0.0;
    telemetry_log_.clear();
    flag_cancel_requested_.store(false);
    flag_mission_pending_ = true;

    logger_->info(
        R"({{"component":"mission","robot":"{}","event":"command_loaded","command":"{}","mission":"{}","zone":"{}","area_ha":{},"waypoints":{},"estimated_hours":{}}})",
        escape_json(str_robot_id_),
        escape_json(command.command_id),
        escape_json(command.mission_id),
        escape_json(command.zone_assignment.zone_name),
        command.zone_assignment.area_ha,
        command.navigation_plan.waypoints.size(),
        command.expected_results.estimated_duration_hours
    );
    optional_command_ = std::move(command);
}

/**
 * @brief Gate, then walk the plan one waypoint at a time.
 */
MissionOutcome MissionExecutor::execute_mission(const WaypointObserver& observer) {
    if (struct_state_.status == RobotStatus::Navigating) {
        throw MissionInProgressError("Robot " + str_robot_id_ + " is already executing a mission");
    }
    if (!optional_command_.has_value() || !flag_mission_pending_) {
        throw NoMissionLoadedError(str_robot_id_);
    }
    const MissionCommand& command = optional_command_.value();
    flag_mission_pending_ = false;

    MissionOutcome outcome{};
    outcome.safety_issues = check_preconditions(struct_state_, command.safety_limits);
    if (!outcome.safety_issues.empty()) {
        for (const SafetyIssue& issue : outcome.safety_issues) {
            logger_->warn("Robot {} safety check failed: {}", str_robot_id_, issue.message);
        }
        abort_mission(fmt::format("{} safety issue(s)", outcome.safety_issues.size()));
        outcome.status = struct_state_.status;
        return outcome;
    }

    log_mission_start(command);
    struct_state_.status = RobotStatus::Navigating;

    const std::vector<Waypoint>& list_waypoints = command.navigation_plan.waypoints;
    outcome.waypoint_results.reserve(list_waypoints.size());
    for (std::size_t index = 0; index < list_waypoints.size(); ++index) {
        if (flag_cancel_requested_.exchange(false)) {
            abort_mission(k_cancel_reason);
            outcome.status = struct_state_.status;
            return outcome;
        }

        try {
            WaypointResult result = execute_waypoint(list_waypoints[index]);
            logger_->debug("Robot {} [{}/{}] waypoint {} {}: {:.1f} m at {:.1f} deg",
                           str_robot_id_,
                           index + 1,
                           list_waypoints.size(),
                           result.waypoint_id,
                           to_string(result.action),
                           result.distance_m,
                           result.bearing_deg);
            outcome.waypoint_results.push_back(result);
            if (observer) {
                observer(outcome.waypoint_results.back());
            }
            if (index + 1 < list_waypoints.size()) {
                clock_->pace(config_.waypoint_pacing);
            }
        } catch (const std::exception& exc) {
            abort_mission(fmt::format("waypoint {} failed: {}", list_waypoints[index].id, exc.what()));
            throw;
        }
    }

    flag_cancel_requested_.store(false);
    struct_state_.status = RobotStatus::MissionCompleted;
    logger_->info(
        R"({{"component":"mission","robot":"{}","event":"completed","mission":"{}","distance_m":{:.1f},"fuel_percent":{},"hopper_percent":{},"telemetry_records":{}}})",
        escape_json(str_robot_id_),
        escape_json(command.mission_id),
        struct_state_.total_distance_m,
        struct_state_.fuel_level_percent,
        struct_state_.hopper_fill_percent,
        telemetry_log_.size()
    );
    outcome.status = struct_state_.status;
    return outcome;
}

void MissionExecutor::request_cancel() noexcept {
    flag_cancel_requested_.store(true);
}

void MissionExecutor::apply_sensor_reading(const SensorReading& reading) {
    if (struct_state_.status == RobotStatus::Navigating) {
        throw MissionInProgressError("Robot " + str_robot_id_ + " ignores sensor overrides while navigating");
    }
    if (reading.position.has_value() && !reading.gps_fix_lost) {
        validate_position(reading.position.value());
    }
    if (reading.fuel_level_percent.has_value()
        && (reading.fuel_level_percent.value() < 0.0 || reading.fuel_level_percent.value() > k_percent_scale)) {
        throw std::invalid_argument(fmt::format("Fuel reading {} outside [0, 100]", reading.fuel_level_percent.value()));
    }
    if (reading.battery_voltage_v.has_value() && reading.battery_voltage_v.value() < 0.0) {
        throw std::invalid_argument(fmt::format("Battery reading {} is negative", reading.battery_voltage_v.value()));
    }

    if (reading.gps_fix_lost) {
        struct_state_.current_position.reset();
        logger_->warn("Robot {} lost its GPS fix", str_robot_id_);
    } else if (reading.position.has_value()) {
        struct_state_.current_position = reading.position;
    }
    if (reading.fuel_level_percent.has_value()) {
        struct_state_.fuel_level_percent = reading.fuel_level_percent.value();
    }
    if (reading.battery_voltage_v.has_value()) {
        struct_state_.battery_voltage_v = reading.battery_voltage_v.value();
    }
}

MissionSummary MissionExecutor::summary() const {
    MissionSummary summary{};
    summary.robot_id = str_robot_id_;
    if (optional_command_.has_value()) {
        summary.mission_id = optional_command_->mission_id;
        summary.command_id = optional_command_->command_id;
        summary.planned_waypoint_count = optional_command_->navigation_plan.waypoints.size();
    }
    summary.status = struct_state_.status;
    summary.fuel_level_percent = struct_state_.fuel_level_percent;
    summary.battery_voltage_v = struct_state_.battery_voltage_v;
    summary.hopper_fill_percent = struct_state_.hopper_fill_percent;
    summary.total_distance_m = struct_state_.total_distance_m;
    summary.telemetry_record_count = telemetry_log_.size();
    return summary;
}

/**
 * @brief Compute the leg and its timestamp, then commit position, distance and resources together.
 */
WaypointResult MissionExecutor::execute_waypoint(const Waypoint& waypoint) {
    const WaypointResult result = plan_leg(struct_state_, waypoint);
    const TimePoint timestamp = clock_->now();

    RobotState next_state = struct_state_;
    next_state.current_position = result.arrival_position;
    next_state.velocity_mps = waypoint.velocity_mps;
    next_state.total_distance_m += result.distance_m;
    struct_state_ = apply_waypoint_effect(next_state, waypoint, config_.resources);

    record_telemetry(timestamp);
    return result;
}

void MissionExecutor::record_telemetry(TimePoint timestamp) {
    TelemetryRecord record{};
    record.timestamp = timestamp;
    record.position = struct_state_.current_position.value_or(GeoPosition{});
    record.velocity_mps = struct_state_.velocity_mps;
    record.fuel_level_percent = struct_state_.fuel_level_percent;
    record.battery_voltage_v = struct_state_.battery_voltage_v;
    record.hopper_fill_percent = struct_state_.hopper_fill_percent;
    record.harvest_rate_kg_per_min = struct_state_.harvest_rate_kg_per_min;
    record.status = struct_state_.status;
    telemetry_log_.append(record);
}

void MissionExecutor::abort_mission(const std::string& reason) {
    struct_state_.status = RobotStatus::Aborted;
    logger_->warn(
        R"({{"component":"mission","robot":"{}","event":"aborted","reason":"{}","waypoints_completed":{}}})",
        escape_json(str_robot_id_),
        escape_json(reason),
        telemetry_log_.size()
    );
}

void MissionExecutor::log_mission_start(const MissionCommand& command) const {
    const HarvestParameters& params = command.harvest_parameters;
    logger_->info(
        R"({{"component":"mission","robot":"{}","event":"started","mission":"{}","waypoints":{},"declared_path_m":{},"cutting_height_cm":{},"blade_rpm":{},"conveyor_mps":{},"hopper_capacity_kg":{}}})",
        escape_json(str_robot_id_),
        escape_json(command.mission_id),
        command.navigation_plan.waypoints.size(),
        command.navigation_plan.declared_path_length_m,
        params.cutting_height_cm,
        params.blade_speed_rpm,
        params.conveyor_speed_mps,
        params.hopper_capacity_kg
    );
}

}  // namespace harvest_bot
