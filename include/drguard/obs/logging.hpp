#pragma once
/**
 * @file logging.hpp
 * @brief spdlog setup: level, pattern, optional rotating file, named component loggers.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "drguard/config/constants.hpp"

namespace drguard::obs {

/** @struct LoggingConfig
 *  @brief Logging sinks and verbosity.
 */
struct LoggingConfig {
    std::string level{"info"};               ///< trace|debug|info|warn|error|critical|off
    bool        json{false};                 ///< One JSON object per line instead of plain text
    std::optional<std::string> file;         ///< Rotating log file; console only when empty
    std::size_t max_bytes{drguard::config::constants::LOG_MAX_BYTES};
    std::size_t max_files{drguard::config::constants::LOG_MAX_FILES};
};

/// Install the default logger. Safe to call more than once; later calls replace sinks.
void configure_logging(const LoggingConfig& cfg);

/// Named component logger sharing the default logger's sinks and level.
std::shared_ptr<spdlog::logger> logger(std::string_view name);

} // namespace drguard::obs
