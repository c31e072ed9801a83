#include "harvest_bot/geodesy.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "harvest_bot/errors.hpp"

namespace harvest_bot {

namespace {
constexpr double k_max_latitude_deg{90.0};
constexpr double k_max_longitude_deg{180.0};
constexpr double k_full_circle_deg{360.0};
}  // namespace

bool is_valid_position(const GeoPosition& position) noexcept {
    if (!std::isfinite(position.latitude_deg) || !std::isfinite(position.longitude_deg)) {
        return false;
    }
    return std::abs(position.latitude_deg) <= k_max_latitude_deg
        && std::abs(position.longitude_deg) <= k_max_longitude_deg;
}

void validate_position(const GeoPosition& position) {
    if (!is_valid_position(position)) {
        throw InvalidCoordinateError(
            fmt::format("Invalid coordinate ({}, {})", position.latitude_deg, position.longitude_deg)
        );
    }
}

double haversine_distance_m(const GeoPosition& from, const GeoPosition& to) {
    validate_position(from);
    validate_position(to);

    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = degrees_to_radians(to.latitude_deg - from.latitude_deg);
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    // Rounding can push near-antipodal pairs just past 1.
    const double a = std::min(1.0, std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2));
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

double initial_bearing_deg(const GeoPosition& from, const GeoPosition& to) {
    validate_position(from);
    validate_position(to);

    if (from.latitude_deg == to.latitude_deg && from.longitude_deg == to.longitude_deg) {
        return 0.0;
    }

    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double x = std::sin(delta_lon) * std::cos(lat2);
    const double y = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(delta_lon);
    const double bearing = std::fmod(radians_to_degrees(std::atan2(x, y)) + k_full_circle_deg, k_full_circle_deg);
    // fmod can round a tiny negative angle up to exactly 360.
    return bearing >= k_full_circle_deg ? 0.0 : bearing;
}

}  // namespace harvest_bot
