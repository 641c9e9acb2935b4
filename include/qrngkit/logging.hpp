/**
 * @file logging.hpp
 * @brief Library logger.
 *
 * All qrngkit components log through one spdlog logger named "qrngkit"
 * writing to stderr. Applications adjust verbosity with set_log_level() or
 * through spdlog's own SPDLOG_LEVEL environment handling.
 */

#ifndef QRNGKIT_LOGGING_HPP
#define QRNGKIT_LOGGING_HPP

#include <spdlog/spdlog.h>

namespace qrngkit {

/// Name under which the library logger is registered with spdlog
inline constexpr const char* LOGGER_NAME = "qrngkit";

/**
 * @brief Get the library logger, creating it on first use.
 */
spdlog::logger& logger();

/**
 * @brief Set the library log level.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace qrngkit

#endif // QRNGKIT_LOGGING_HPP
