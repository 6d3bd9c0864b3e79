/**
 * @file Logging.hpp
 * @brief Library logger
 *
 * All strata components log through one named spdlog logger ("strata")
 * writing to a colored, thread-safe stderr sink. The library only logs
 * at debug and trace level; the CLI raises or lowers the threshold with
 * set_log_level().
 */

#ifndef STRATA_LOGGING_HPP
#define STRATA_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace strata {

/**
 * @brief Get the shared "strata" logger, creating it on first use
 *
 * Default level is warning, so library debug output stays silent unless
 * requested.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Convert a level name to an spdlog level
 *
 * Accepts (case-insensitive) "quiet", "error", "warning", "info",
 * "debug" and "trace".
 *
 * @param name Level name
 * @return Matching spdlog level
 * @throws ConfigError for an unknown name
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Set the threshold of the "strata" logger by name
 * @throws ConfigError for an unknown name
 */
void set_log_level(const std::string& name);

} // namespace strata

#endif // STRATA_LOGGING_HPP
