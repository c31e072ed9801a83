#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "harvest_bot/mission_clock.hpp"
#include "harvest_bot/mission_command.hpp"
#include "harvest_bot/navigation.hpp"
#include "harvest_bot/resource_model.hpp"
#include "harvest_bot/robot_state.hpp"
#include "harvest_bot/safety_gate.hpp"
#include "harvest_bot/telemetry_log.hpp"
#include "harvest_bot/types.hpp"

namespace harvest_bot {

/**
 * @brief Tunables that govern how a robot executes its missions.
 */
struct ExecutorConfig final {
    Duration waypoint_pacing{Duration{0.5}};    /**< Delay between consecutive waypoints. */
    double nominal_battery_voltage_v{24.5};     /**< Battery voltage reported at power-on. */
    ResourceModelParams resources{};            /**< Per-waypoint consumption rules. */
};

/**
 * @brief Reading supplied by the sensor collaborator between missions.
 *
 * Unset fields leave the corresponding state untouched.
 */
struct SensorReading final {
    std::optional<GeoPosition> position{};      /**< Fresh GPS fix. */
    bool gps_fix_lost{};                        /**< Drop the current position; overrides @ref position. */
    std::optional<double> fuel_level_percent{}; /**< Measured fuel level, [0, 100]. */
    std::optional<double> battery_voltage_v{};  /**< Measured battery voltage, >= 0. */
};

/**
 * @brief Result of one execute_mission call.
 */
struct MissionOutcome final {
    RobotStatus status{RobotStatus::Idle};
    std::vector<SafetyIssue> safety_issues{};        /**< Non-empty only when the safety gate aborted the mission. */
    std::vector<WaypointResult> waypoint_results{};  /**< One entry per executed waypoint, in order. */
};

/**
 * @brief Final-status summary handed to persistence collaborators.
 */
struct MissionSummary final {
    std::string robot_id{};
    std::string mission_id{};
    std::string command_id{};
    RobotStatus status{RobotStatus::Idle};
    double fuel_level_percent{};
    double battery_voltage_v{};
    double hopper_fill_percent{};
    double total_distance_m{};
    std::size_t telemetry_record_count{};
    std::size_t planned_waypoint_count{};
};

/** @brief Callback receiving each waypoint result as soon as the waypoint completes. */
using WaypointObserver = std::function<void(const WaypointResult&)>;

/**
 * @brief Safety-gated state machine executing one robot's missions.
 *
 * The executor owns its RobotState and TelemetryLog exclusively. Waypoints run
 * strictly in order on the calling thread; request_cancel() is the only member
 * that may be invoked from another thread.
 */
class MissionExecutor final {
  public:
    /**
     * @brief Construct an idle robot with full fuel and an empty hopper.
     *
     * @param robot_id Identifier that mission commands must be addressed to.
     * @param config Pacing, battery and resource-model settings.
     * @param clock Time source used for telemetry stamps and pacing.
     */
    explicit MissionExecutor(
        std::string robot_id,
        ExecutorConfig config = {},
        MissionClockPtr clock = std::make_shared<SystemMissionClock>()
    );

    [[nodiscard]] const std::string& robot_id() const noexcept;
    [[nodiscard]] const RobotState& state() const noexcept;
    [[nodiscard]] const TelemetryLog& telemetry_log() const noexcept;
    [[nodiscard]] const ExecutorConfig& config() const noexcept;
    /** @brief Most recently loaded command, if any. */
    [[nodiscard]] const std::optional<MissionCommand>& command() const noexcept;
    /** @brief True when a loaded command has not been executed yet. */
    [[nodiscard]] bool has_pending_mission() const noexcept;

    /**
     * @brief Accept a mission addressed to this robot and move to its start position.
     *
     * Resets the distance counter and telemetry log for the new mission. The
     * status is left unchanged.
     *
     * @throws RobotMismatchError when the command targets another robot.
     * @throws MissionInProgressError while a mission is navigating.
     * @throws InvalidCoordinateError when the start position is malformed.
     */
    void load_command(MissionCommand command);

    /**
     * @brief Run the safety gate and, if it passes, execute every waypoint in order.
     *
     * A failing safety gate aborts the mission without touching any other
     * state. If a waypoint cannot be computed the exception propagates, the
     * state keeps the values of the last completed waypoint and the status
     * becomes Aborted.
     *
     * @throws NoMissionLoadedError when no pending command exists.
     * @throws MissionInProgressError on a re-entrant call.
     */
    MissionOutcome execute_mission(const WaypointObserver& observer = {});

    /** @brief Ask the running mission to abort before its next waypoint. */
    void request_cancel() noexcept;

    /**
     * @brief Apply externally measured position and resource readings.
     *
     * @throws MissionInProgressError while navigating.
     * @throws InvalidCoordinateError or std::invalid_argument for out-of-range readings.
     */
    void apply_sensor_reading(const SensorReading& reading);

    [[nodiscard]] MissionSummary summary() const;

  private:
    WaypointResult execute_waypoint(const Waypoint& waypoint);
    void record_telemetry(TimePoint timestamp);
    void abort_mission(const std::string& reason);
    void log_mission_start(const MissionCommand& command) const;

    std::string str_robot_id_;
    ExecutorConfig config_;
    MissionClockPtr clock_;
    RobotState struct_state_;
    TelemetryLog telemetry_log_;
    std::optional<MissionCommand> optional_command_;
    bool flag_mission_pending_{false};
    std::atomic<bool> flag_cancel_requested_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace harvest_bot
