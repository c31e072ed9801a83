// === Telemetry Log ===========================================================
//
// Append-only record of the robot state captured after every executed
// waypoint. The owning mission executor is the only writer; collaborators that
// persist or display telemetry receive a read-only view.

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "harvest_bot/types.hpp"

namespace harvest_bot {

/** @brief Immutable snapshot of the robot taken after a waypoint completes. */
struct TelemetryRecord final {
    TimePoint timestamp{};
    GeoPosition position{};
    double velocity_mps{};
    double fuel_level_percent{};
    double battery_voltage_v{};
    double hopper_fill_percent{};
    double harvest_rate_kg_per_min{};
    RobotStatus status{RobotStatus::Idle};
};

/** @brief Ordered, append-only sequence of telemetry records. */
class TelemetryLog final {
  public:
    /** @brief Append a record after all previously appended ones. */
    void append(const TelemetryRecord& record);
    /** @brief Drop every record; used when a new mission replaces the previous one. */
    void clear() noexcept;

    /** @brief Records in execution order. */
    [[nodiscard]] const std::vector<TelemetryRecord>& records() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    /** @brief Most recent record, if any. */
    [[nodiscard]] std::optional<TelemetryRecord> latest() const;

  private:
    std::vector<TelemetryRecord> list_records_;
};

}  // namespace harvest_bot
