// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the mission executor.
//
// Responsibilities
// - Enforce defaults and sane bounds for pacing, battery and resource-model
//   knobs.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
//
// Note: This file does not read from disk; callers are expected to populate
// the process environment ahead of time.

#include "harvest_bot/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "harvest_bot/logging.hpp"
#include "harvest_bot/version.hpp"

namespace harvest_bot {

namespace {
constexpr double k_default_waypoint_pacing_s{0.5};
constexpr double k_default_nominal_battery_v{24.5};
constexpr double k_max_percent{100.0};
constexpr std::string_view k_default_log_directory{"logs"};

enum class Bound {
    NonNegative,
    Positive,
    Percent
};

bool within_bound(double value, Bound bound) {
    switch (bound) {
        case Bound::NonNegative:
            return value >= 0.0;
        case Bound::Positive:
            return value > 0.0;
        case Bound::Percent:
            return value >= 0.0 && value <= k_max_percent;
    }
    return false;
}

double parse_double(const char* variable_name, double fallback, Bound bound) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    auto logger = get_logger();
    try {
        std::size_t consumed = 0;
        const double parsed_value = std::stod(raw_value, &consumed);
        if (consumed != std::string_view{raw_value}.size() || !within_bound(parsed_value, bound)) {
            logger->warn("Rejected {}={}; using fallback {}", variable_name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        logger->warn("Failed to parse double from {}; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("HARVEST_BOT_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

std::optional<std::string> parse_log_level() {
    const char* raw_level = std::getenv("HARVEST_BOT_LOG_LEVEL");
    if (raw_level == nullptr || std::string_view{raw_level}.empty()) {
        return std::nullopt;
    }
    return std::string{raw_level};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    config.log_level = parse_log_level();
    if (config.log_level.has_value()) {
        set_log_level(config.log_level.value());
    }
    logger->info("Loading harvest_bot {} configuration from environment", k_version);

    config.executor = load_executor_config();

    logger->info("Configuration loaded: waypoint_pacing_s={} nominal_battery_v={} fuel_per_waypoint={} hopper_per_harvest={} harvest_rate={}",
                 config.executor.waypoint_pacing.count(),
                 config.executor.nominal_battery_voltage_v,
                 config.executor.resources.fuel_per_waypoint_percent,
                 config.executor.resources.hopper_fill_per_harvest_percent,
                 config.executor.resources.harvest_rate_kg_per_min);

    return config;
}

ExecutorConfig ConfigurationLoader::load_executor_config() {
    const ResourceModelParams default_resources{};

    ExecutorConfig executor{};
    executor.waypoint_pacing = Duration{
        parse_double("HARVEST_BOT_WAYPOINT_PACING_S", k_default_waypoint_pacing_s, Bound::NonNegative)
    };
    executor.nominal_battery_voltage_v = parse_double("HARVEST_BOT_NOMINAL_BATTERY_V", k_default_nominal_battery_v, Bound::Positive);
    executor.resources.fuel_per_waypoint_percent = parse_double(
        "HARVEST_BOT_FUEL_PER_WAYPOINT_PERCENT", default_resources.fuel_per_waypoint_percent, Bound::Percent
    );
    executor.resources.hopper_fill_per_harvest_percent = parse_double(
        "HARVEST_BOT_HOPPER_FILL_PER_HARVEST_PERCENT", default_resources.hopper_fill_per_harvest_percent, Bound::Percent
    );
    executor.resources.harvest_rate_kg_per_min = parse_double(
        "HARVEST_BOT_HARVEST_RATE_KG_PER_MIN", default_resources.harvest_rate_kg_per_min, Bound::NonNegative
    );
    return executor;
}

}  // namespace harvest_bot
