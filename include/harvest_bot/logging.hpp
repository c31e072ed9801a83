// === Logging =================================================================
//
// Process-wide spdlog logger shared by every robot executor. Console output is
// plain text; the rotating file sink writes one JSON object per line, so
// structured messages must embed string fields through escape_json().

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace harvest_bot {

/**
 * @brief Create the shared logger writing to @p log_directory/harvest_bot.log.
 *
 * Only the first call has an effect; later calls return the existing logger.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger; throws std::runtime_error before initialize_logger(). */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/**
 * @brief Escape @p raw for use inside a quoted JSON string field.
 */
[[nodiscard]] std::string escape_json(std::string_view raw);

}  // namespace harvest_bot
