// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_CONSOLE_SINK_HPP
#define STRATUS_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <ostream>

#include "stratus_log_severity.hpp"

namespace stratus {
namespace logging {

/**
 * Async console sink with a bounded queue.
 * Records are dropped on overflow so part uploads never block on stderr.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<2048, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Create the console sink.
 *
 * Line layout: [timestamp] [LEVEL] [component] message | file_id=<id>
 *
 * @param min_level Minimum severity that passes the filter
 * @param use_colors Wrap the level in ANSI color codes
 * @param stream Destination stream, std::clog when null
 * @param component_levels Thresholds replacing min_level for the listed components
 * @return Shared pointer to the sink (not yet registered with the core)
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true,
  std::ostream* stream = nullptr, const component_levels_t& component_levels = {}
);

/**
 * Filter decision shared by the sinks: the component's own threshold when it has
 * one, min_level otherwise.
 */
bool passes_threshold(
  severity_level level, const std::string& component, severity_level min_level,
  const component_levels_t& component_levels
);

/**
 * ANSI color escape for a severity level, empty for unknown levels.
 */
const char* severity_color(severity_level level);

}  // namespace logging
}  // namespace stratus

#endif  // STRATUS_CONSOLE_SINK_HPP
