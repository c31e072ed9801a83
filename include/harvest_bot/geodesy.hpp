// === Geodesy =================================================================
//
// Great-circle helpers shared by every component that reasons about positions.
// All functions are pure; the inputs are validated so a malformed coordinate
// surfaces as InvalidCoordinateError instead of propagating NaNs.

#pragma once

#include <numbers>

#include "harvest_bot/types.hpp"

namespace harvest_bot {

inline constexpr double k_earth_radius_m{6'371'000.0}; /**< Mean Earth radius used for geodesic calculations. */

/**
 * @brief Convert degrees to radians.
 */
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

/**
 * @brief Convert radians to degrees.
 */
constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

/** @brief True when latitude and longitude are finite and within range. */
[[nodiscard]] bool is_valid_position(const GeoPosition& position) noexcept;

/**
 * @brief Throw InvalidCoordinateError when @p position is not a valid coordinate.
 */
void validate_position(const GeoPosition& position);

/**
 * @brief Great-circle distance in metres between two positions (Haversine).
 *
 * Symmetric in its arguments and zero for identical positions.
 */
[[nodiscard]] double haversine_distance_m(const GeoPosition& from, const GeoPosition& to);

/**
 * @brief Initial great-circle bearing from @p from toward @p to, in [0, 360).
 *
 * 0 is north and 90 is east. Coincident positions have no defined bearing;
 * the function returns 0 for them.
 */
[[nodiscard]] double initial_bearing_deg(const GeoPosition& from, const GeoPosition& to);

}  // namespace harvest_bot
