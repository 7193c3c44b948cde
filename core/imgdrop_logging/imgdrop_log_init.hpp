// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_LOG_INIT_HPP
#define IMGDROP_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "imgdrop_console_sink.hpp"
#include "imgdrop_file_sink.hpp"
#include "imgdrop_log_severity.hpp"

namespace imgdrop {
namespace logging {

/**
 * Sink setup for imgdrop processes.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (any case).
 *
 * @return The parsed level, or std::nullopt if the string is not a level name
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment overrides in place:
 *   IMGDROP_LOG_LEVEL           - both sinks
 *   IMGDROP_LOG_CONSOLE_LEVEL   - console sink
 *   IMGDROP_LOG_FILE_LEVEL      - file sink
 *   IMGDROP_LOG_FILE_DIR        - file sink directory
 *   IMGDROP_LOG_FORMAT          - "json" or "text"
 *   IMGDROP_LOG_FILE_ENABLED    - "true"/"false"
 *   IMGDROP_LOG_CONSOLE_ENABLED - "true"/"false"
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. A second call without shutdown_logging() is ignored.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console only, INFO, colours on.
 */
void init_logging_default();

/**
 * Stop the async sinks, drain their queues and detach them from the core.
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);
void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Shut down and re-initialise with config plus environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace imgdrop

#endif  // IMGDROP_LOG_INIT_HPP
