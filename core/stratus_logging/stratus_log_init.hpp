// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_LOG_INIT_HPP
#define STRATUS_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "stratus_console_sink.hpp"
#include "stratus_log_severity.hpp"

namespace stratus {
namespace logging {

/**
 * Logging configuration for processes embedding the store.
 *
 * component_levels lets a host turn one part of the store up or down, e.g.
 * {"ingestion": debug, "s3_client": warn}, while everything else stays at
 * console_level.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;
  component_levels_t component_levels;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error", "fatal" (case-insensitive).
 *
 * @return The level, or std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Parse a component threshold list: "ingestion=debug,s3_client=warn".
 *
 * Whitespace around names and levels is ignored, as are empty entries.
 *
 * @return The thresholds, or std::nullopt if an entry lacks '=' or names an
 *         unknown level
 */
std::optional<component_levels_t> parse_component_levels(const std::string& text);

/**
 * Apply environment overrides in place.
 *
 *   STRATUS_LOG_LEVEL       - console level
 *   STRATUS_LOG_COLORS      - "true"/"false"
 *   STRATUS_LOG_ENABLED     - "true"/"false"
 *   STRATUS_LOG_COMPONENTS  - component thresholds, merged over the configured ones
 *
 * Unparseable values leave the field untouched.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. A second call without shutdown is ignored.
 */
void init_logging(const LoggingConfig& config);

/**
 * Install an INFO console sink with colors, after environment overrides.
 */
void init_logging_default();

/**
 * Stop the async sinks, drain their queues and detach them from the core.
 */
void shutdown_logging();

/**
 * Register an additional sink (for example a host application's own sink).
 * Sinks added here are detached by shutdown_logging().
 */
void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

bool is_logging_initialized();

}  // namespace logging
}  // namespace stratus

#endif  // STRATUS_LOG_INIT_HPP
