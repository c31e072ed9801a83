// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the mission core.
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <optional>
#include <string>

#include "harvest_bot/mission_executor.hpp"

namespace harvest_bot {

/**
 * @brief Immutable bundle of runtime knobs for a robot controller process.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};           /**< Destination directory for structured logs. */
    std::optional<std::string> log_level{}; /**< Requested log level, applied at load time. */
    ExecutorConfig executor{};             /**< Pacing, battery and resource-model settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /**
     * @brief Initialize logging and read every HARVEST_BOT_* variable.
     *
     * Values that fail to parse or fall outside their valid range are
     * reported as warnings and replaced by their defaults.
     */
    static Configuration load();

  private:
    static ExecutorConfig load_executor_config();
};

}  // namespace harvest_bot
