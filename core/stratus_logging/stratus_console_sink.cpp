// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stratus_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <string>

namespace stratus {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

constexpr const char* kResetColor = "\033[0m";

void format_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[";
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
  strm << "] ";

  auto level = boost::log::extract<severity_level>("Severity", rec);
  if (level) {
    if (use_colors) {
      strm << severity_color(*level) << "[" << *level << "]" << kResetColor << " ";
    } else {
      strm << "[" << *level << "] ";
    }
  }

  auto component = boost::log::extract<std::string>("Component", rec);
  if (component) {
    strm << "[" << *component << "] ";
  }

  strm << rec[expr::smessage];

  auto file_id = boost::log::extract<std::string>("FileID", rec);
  if (file_id) {
    strm << " | file_id=" << *file_id;
  }
}

}  // namespace

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
    default:
      return "";
  }
}

bool passes_threshold(
  severity_level level, const std::string& component, severity_level min_level,
  const component_levels_t& component_levels
) {
  auto it = component_levels.find(component);
  const severity_level threshold = it != component_levels.end() ? it->second : min_level;
  return level >= threshold;
}

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors, std::ostream* stream,
  const component_levels_t& component_levels
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  std::ostream* target = stream ? stream : &std::clog;
  backend->add_stream(boost::shared_ptr<std::ostream>(target, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  if (component_levels.empty()) {
    sink->set_filter(severity >= min_level);
  } else {
    sink->set_filter(
      [min_level, component_levels](boost::log::attribute_value_set const& attrs) {
        auto level = attrs[severity];
        if (!level) {
          return false;
        }
        auto component = attrs[component_attr];
        return passes_threshold(
          level.get(), component ? component.get() : std::string(), min_level, component_levels
        );
      }
    );
  }
  sink->set_formatter(
    [use_colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_record(rec, strm, use_colors);
    }
  );

  return sink;
}

}  // namespace logging
}  // namespace stratus
