#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "harvest_bot/errors.hpp"
#include "harvest_bot/geodesy.hpp"
#include "harvest_bot/mission_executor.hpp"
#include "logging_test_fixture.hpp"
#include "mission_fixtures.hpp"

using namespace harvest_bot;
using namespace harvest_bot::test;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    harvest_bot::test::ensure_logger_initialized();
    return true;
}();

/** @brief Clock whose pacing or time source fails on demand. */
class FaultyClock final : public MissionClock {
  public:
    bool fail_now{false};
    bool fail_pace{false};

    [[nodiscard]] TimePoint now() const override {
        if (fail_now) {
            throw std::runtime_error("time source unavailable");
        }
        return TimePoint{};
    }

    void pace(const Duration&) override {
        if (fail_pace) {
            throw std::runtime_error("pacing timer fault");
        }
    }
};
}  // namespace

TEST_CASE("New robots start idle with full fuel and an empty hopper") {
    auto executor = make_executor();

    REQUIRE(executor->state().status == RobotStatus::Idle);
    REQUIRE(executor->state().fuel_level_percent == 100.0);
    REQUIRE(executor->state().hopper_fill_percent == 0.0);
    REQUIRE(executor->state().battery_voltage_v == Approx(24.5));
    REQUIRE_FALSE(executor->state().current_position.has_value());
    REQUIRE_FALSE(executor->has_pending_mission());
}

TEST_CASE("Executor rejects invalid construction arguments") {
    REQUIRE_THROWS_AS(MissionExecutor("", ExecutorConfig{}, std::make_shared<ManualMissionClock>()), std::invalid_argument);
    REQUIRE_THROWS_AS(MissionExecutor(k_robot_id, ExecutorConfig{}, nullptr), std::invalid_argument);

    ExecutorConfig config{};
    config.waypoint_pacing = Duration{-1.0};
    REQUIRE_THROWS_AS(MissionExecutor(k_robot_id, config, std::make_shared<ManualMissionClock>()), std::invalid_argument);
}

TEST_CASE("Loading a command moves the robot to the start position") {
    auto executor = make_executor();
    const MissionCommand command = make_command();

    executor->load_command(command);

    REQUIRE(executor->state().status == RobotStatus::Idle);
    REQUIRE(executor->has_pending_mission());
    REQUIRE(executor->state().current_position.has_value());
    REQUIRE(executor->state().current_position->latitude_deg == command.navigation_plan.start_position.latitude_deg);
    REQUIRE(executor->command()->mission_id == command.mission_id);
}

TEST_CASE("Commands for another robot are rejected without side effects") {
    auto executor = make_executor();
    MissionCommand command = make_command();
    command.robot_id = "MICROBOT-002";

    REQUIRE_THROWS_AS(executor->load_command(command), RobotMismatchError);
    REQUIRE(executor->state().status == RobotStatus::Idle);
    REQUIRE_FALSE(executor->state().current_position.has_value());
    REQUIRE_FALSE(executor->command().has_value());
}

TEST_CASE("Mismatched command leaves a terminal status unchanged") {
    auto executor = make_executor();
    executor->load_command(make_command());
    executor->execute_mission();
    REQUIRE(executor->state().status == RobotStatus::MissionCompleted);

    MissionCommand foreign = make_command();
    foreign.robot_id = "MICROBOT-009";
    REQUIRE_THROWS_AS(executor->load_command(foreign), RobotMismatchError);
    REQUIRE(executor->state().status == RobotStatus::MissionCompleted);
}

TEST_CASE("Executing without a loaded command fails fast") {
    auto executor = make_executor();
    REQUIRE_THROWS_AS(executor->execute_mission(), NoMissionLoadedError);
    REQUIRE(executor->state().status == RobotStatus::Idle);
}

TEST_CASE("Harvest mission completes and accounts for resources") {
    auto clock = std::make_shared<ManualMissionClock>();
    auto executor = make_executor(clock);
    const MissionCommand command = make_command();
    executor->load_command(command);

    std::vector<std::string> observed_ids;
    const MissionOutcome outcome = executor->execute_mission([&observed_ids](const WaypointResult& result) {
        observed_ids.push_back(result.waypoint_id);
    });

    const RobotState& state = executor->state();
    REQUIRE(outcome.status == RobotStatus::MissionCompleted);
    REQUIRE(outcome.safety_issues.empty());
    REQUIRE(state.status == RobotStatus::MissionCompleted);
    REQUIRE(state.fuel_level_percent == Approx(98.5));
    REQUIRE(state.hopper_fill_percent == Approx(30.0));
    REQUIRE(state.harvest_rate_kg_per_min == Approx(180.0));
    REQUIRE(executor->telemetry_log().size() == 3);
    REQUIRE(observed_ids == std::vector<std::string>{"WP-001", "WP-002", "WP-003"});
    REQUIRE_FALSE(executor->has_pending_mission());

    // Pacing runs between waypoints only.
    REQUIRE(clock->now() == TimePoint{} + std::chrono::duration_cast<WallClock::duration>(Duration{1.0}));
}

TEST_CASE("Total distance is the sum of the legs and never decreases") {
    auto executor = make_executor();
    const MissionCommand command = make_command();
    executor->load_command(command);

    std::vector<double> running_totals;
    const MissionOutcome outcome = executor->execute_mission([&executor, &running_totals](const WaypointResult&) {
        running_totals.push_back(executor->state().total_distance_m);
    });

    double expected_total_m = 0.0;
    GeoPosition previous = command.navigation_plan.start_position;
    for (const Waypoint& waypoint : command.navigation_plan.waypoints) {
        expected_total_m += haversine_distance_m(previous, waypoint.position);
        previous = waypoint.position;
    }

    REQUIRE(executor->state().total_distance_m == Approx(expected_total_m));
    REQUIRE(summarize_navigation(outcome.waypoint_results, 0.0).total_distance_m == Approx(expected_total_m));
    for (std::size_t index = 1; index < running_totals.size(); ++index) {
        REQUIRE(running_totals[index] >= running_totals[index - 1]);
    }
}

TEST_CASE("Telemetry mirrors the state after each waypoint") {
    auto executor = make_executor();
    const MissionCommand command = make_command();
    executor->load_command(command);
    const MissionOutcome outcome = executor->execute_mission();

    const auto& records = executor->telemetry_log().records();
    REQUIRE(records.size() == command.navigation_plan.waypoints.size());
    for (std::size_t index = 0; index < records.size(); ++index) {
        const Waypoint& waypoint = command.navigation_plan.waypoints[index];
        REQUIRE(records[index].status == RobotStatus::Navigating);
        REQUIRE(records[index].position.latitude_deg == waypoint.position.latitude_deg);
        REQUIRE(records[index].position.longitude_deg == waypoint.position.longitude_deg);
        REQUIRE(records[index].position.heading_deg == outcome.waypoint_results[index].bearing_deg);
        REQUIRE(records[index].velocity_mps == waypoint.velocity_mps);
    }
    REQUIRE(records[0].fuel_level_percent == Approx(99.5));
    REQUIRE(records[1].hopper_fill_percent == Approx(15.0));
    REQUIRE(records[2].hopper_fill_percent == Approx(30.0));
    REQUIRE(records[1].timestamp > records[0].timestamp);
}

TEST_CASE("Low fuel aborts the mission before any waypoint") {
    auto executor = make_executor();
    executor->load_command(make_command());
    executor->apply_sensor_reading(SensorReading{std::nullopt, false, 5.0, std::nullopt});
    const RobotState before = executor->state();

    const MissionOutcome outcome = executor->execute_mission();

    REQUIRE(outcome.status == RobotStatus::Aborted);
    REQUIRE(outcome.safety_issues.size() == 1);
    REQUIRE(outcome.safety_issues.front().kind == SafetyIssueKind::LowFuel);
    REQUIRE(outcome.waypoint_results.empty());
    REQUIRE(executor->state().status == RobotStatus::Aborted);
    REQUIRE(executor->state().total_distance_m == 0.0);
    REQUIRE(executor->state().fuel_level_percent == before.fuel_level_percent);
    REQUIRE(executor->state().current_position->latitude_deg == before.current_position->latitude_deg);
    REQUIRE(executor->telemetry_log().empty());
}

TEST_CASE("Safety abort reports every violation at once") {
    auto executor = make_executor();
    executor->load_command(make_command());
    executor->apply_sensor_reading(SensorReading{std::nullopt, true, 5.0, 18.0});

    const MissionOutcome outcome = executor->execute_mission();

    REQUIRE(outcome.safety_issues.size() == 3);
    REQUIRE(executor->state().status == RobotStatus::Aborted);
}

TEST_CASE("An aborted robot accepts a corrected mission") {
    auto executor = make_executor();
    executor->load_command(make_command());
    executor->apply_sensor_reading(SensorReading{std::nullopt, false, 5.0, std::nullopt});
    executor->execute_mission();
    REQUIRE(executor->state().status == RobotStatus::Aborted);
    REQUIRE_THROWS_AS(executor->execute_mission(), NoMissionLoadedError);

    executor->apply_sensor_reading(SensorReading{std::nullopt, false, 90.0, std::nullopt});
    MissionCommand corrected = make_command();
    corrected.command_id = "CMD-0002";
    executor->load_command(corrected);
    REQUIRE(executor->state().status == RobotStatus::Aborted);

    const MissionOutcome outcome = executor->execute_mission();
    REQUIRE(outcome.status == RobotStatus::MissionCompleted);
    REQUIRE(executor->state().fuel_level_percent == Approx(88.5));
    REQUIRE(executor->summary().command_id == "CMD-0002");
}

TEST_CASE("A malformed waypoint stops the mission at the last completed waypoint") {
    std::vector<Waypoint> waypoints;
    waypoints.push_back(make_waypoint("WP-001", -22.7145, -47.6479, WaypointAction::HarvestStart));
    waypoints.push_back(make_waypoint("WP-BAD", -122.0, -47.6479, WaypointAction::Navigate));
    waypoints.push_back(make_waypoint("WP-003", -22.7135, -47.6489, WaypointAction::HarvestContinue));

    auto executor = make_executor();
    executor->load_command(make_command(waypoints));

    REQUIRE_THROWS_AS(executor->execute_mission(), InvalidCoordinateError);

    const RobotState& state = executor->state();
    REQUIRE(state.status == RobotStatus::Aborted);
    REQUIRE(executor->telemetry_log().size() == 1);
    REQUIRE(state.current_position->longitude_deg == -47.6479);
    REQUIRE(state.fuel_level_percent == Approx(99.5));
    REQUIRE(state.hopper_fill_percent == Approx(15.0));
}

TEST_CASE("Cancellation takes effect between waypoints") {
    auto executor = make_executor();
    executor->load_command(make_command());

    std::size_t observed_count = 0;
    const MissionOutcome outcome = executor->execute_mission([&executor, &observed_count](const WaypointResult&) {
        ++observed_count;
        if (observed_count == 1) {
            executor->request_cancel();
        }
    });

    REQUIRE(outcome.status == RobotStatus::Aborted);
    REQUIRE(outcome.waypoint_results.size() == 1);
    REQUIRE(executor->telemetry_log().size() == 1);
    REQUIRE(executor->state().status == RobotStatus::Aborted);
}

TEST_CASE("A navigating robot refuses new commands and sensor overrides") {
    auto executor = make_executor();
    executor->load_command(make_command());

    bool checked = false;
    executor->execute_mission([&executor, &checked](const WaypointResult&) {
        if (checked) {
            return;
        }
        checked = true;
        REQUIRE(executor->state().status == RobotStatus::Navigating);
        REQUIRE_THROWS_AS(executor->load_command(make_command()), MissionInProgressError);
        REQUIRE_THROWS_AS(executor->execute_mission(), MissionInProgressError);
        REQUIRE_THROWS_AS(executor->apply_sensor_reading(SensorReading{}), MissionInProgressError);
    });

    REQUIRE(checked);
    REQUIRE(executor->state().status == RobotStatus::MissionCompleted);
}

TEST_CASE("Sensor readings are validated before they are applied") {
    auto executor = make_executor();

    REQUIRE_THROWS_AS(executor->apply_sensor_reading(SensorReading{GeoPosition{95.0, 0.0}, false, 50.0, std::nullopt}),
                      InvalidCoordinateError);
    REQUIRE_THROWS_AS(executor->apply_sensor_reading(SensorReading{std::nullopt, false, 150.0, std::nullopt}),
                      std::invalid_argument);
    REQUIRE(executor->state().fuel_level_percent == 100.0);

    executor->apply_sensor_reading(SensorReading{GeoPosition{-22.7, -47.6}, false, std::nullopt, 23.0});
    REQUIRE(executor->state().current_position->latitude_deg == -22.7);
    REQUIRE(executor->state().battery_voltage_v == 23.0);
}

TEST_CASE("Loading a command with a malformed start position changes nothing") {
    auto executor = make_executor();
    MissionCommand command = make_command();
    command.navigation_plan.start_position = GeoPosition{0.0, 200.0};

    REQUIRE_THROWS_AS(executor->load_command(command), InvalidCoordinateError);
    REQUIRE_FALSE(executor->command().has_value());
    REQUIRE_FALSE(executor->state().current_position.has_value());
}

TEST_CASE("Hopper and fuel stay bounded over a long harvest") {
    std::vector<Waypoint> waypoints;
    for (int index = 0; index < 250; ++index) {
        waypoints.push_back(make_waypoint("WP-" + std::to_string(index),
                                          -22.7145 + 0.0001 * index,
                                          -47.6489,
                                          WaypointAction::HarvestContinue,
                                          0.0));
    }
    auto executor = make_executor();
    executor->load_command(make_command(waypoints));

    const MissionOutcome outcome = executor->execute_mission();

    REQUIRE(outcome.status == RobotStatus::MissionCompleted);
    REQUIRE(executor->state().fuel_level_percent == 0.0);
    REQUIRE(executor->state().hopper_fill_percent == 100.0);
    for (const WaypointResult& result : outcome.waypoint_results) {
        REQUIRE(result.estimated_time_s == 0.0);
    }
}

TEST_CASE("Summary reports the final mission status") {
    auto executor = make_executor();
    executor->load_command(make_command());
    executor->execute_mission();

    const MissionSummary summary = executor->summary();
    REQUIRE(summary.robot_id == k_robot_id);
    REQUIRE(summary.mission_id == "MISSION-2026-014");
    REQUIRE(summary.status == RobotStatus::MissionCompleted);
    REQUIRE(summary.telemetry_record_count == 3);
    REQUIRE(summary.planned_waypoint_count == 3);
    REQUIRE(summary.fuel_level_percent == Approx(98.5));
    REQUIRE(summary.total_distance_m == Approx(executor->state().total_distance_m));
}

TEST_CASE("Robots execute missions independently on separate threads") {
    constexpr std::size_t k_robot_count{4};
    std::vector<std::unique_ptr<MissionExecutor>> list_executors;
    for (std::size_t index = 0; index < k_robot_count; ++index) {
        list_executors.push_back(make_executor());
        list_executors.back()->load_command(make_command());
    }

    std::vector<std::thread> list_threads;
    for (const auto& executor : list_executors) {
        list_threads.emplace_back([&executor]() { executor->execute_mission(); });
    }
    for (std::thread& thread : list_threads) {
        thread.join();
    }

    for (const auto& executor : list_executors) {
        REQUIRE(executor->state().status == RobotStatus::MissionCompleted);
        REQUIRE(executor->telemetry_log().size() == 3);
    }
}

TEST_CASE("A pacing fault aborts the mission and frees the robot") {
    auto clock = std::make_shared<FaultyClock>();
    clock->fail_pace = true;
    MissionExecutor executor{k_robot_id, ExecutorConfig{}, clock};
    executor.load_command(make_command());

    REQUIRE_THROWS_AS(executor.execute_mission(), std::runtime_error);

    REQUIRE(executor.state().status == RobotStatus::Aborted);
    REQUIRE(executor.telemetry_log().size() == 1);
    REQUIRE(executor.state().current_position->longitude_deg == -47.6479);

    std::vector<Waypoint> single_leg;
    single_leg.push_back(make_waypoint("WP-001", -22.7145, -47.6479, WaypointAction::Navigate));
    REQUIRE_NOTHROW(executor.load_command(make_command(single_leg)));
    REQUIRE(executor.execute_mission().status == RobotStatus::MissionCompleted);
}

TEST_CASE("A time source fault leaves the waypoint uncommitted") {
    auto clock = std::make_shared<FaultyClock>();
    clock->fail_now = true;
    MissionExecutor executor{k_robot_id, ExecutorConfig{}, clock};
    executor.load_command(make_command());

    REQUIRE_THROWS_AS(executor.execute_mission(), std::runtime_error);

    REQUIRE(executor.state().status == RobotStatus::Aborted);
    REQUIRE(executor.telemetry_log().empty());
    REQUIRE(executor.state().total_distance_m == 0.0);
    REQUIRE(executor.state().fuel_level_percent == 100.0);
    REQUIRE_NOTHROW(executor.load_command(make_command()));
}
