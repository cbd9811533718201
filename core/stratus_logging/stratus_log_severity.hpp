// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_LOG_SEVERITY_HPP
#define STRATUS_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <map>
#include <ostream>
#include <string>

namespace stratus {
namespace logging {

/**
 * Severity levels for stratus logging.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  const auto index = static_cast<std::size_t>(level);
  if (index < sizeof(names) / sizeof(*names)) {
    strm << names[index];
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

/**
 * Per-component severity thresholds, keyed by STRATUS_LOG_COMPONENT value.
 * Components without an entry use the sink's own threshold.
 */
typedef std::map<std::string, severity_level> component_levels_t;

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(component_attr, "Component", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(file_id_attr, "FileID", std::string)

}  // namespace logging
}  // namespace stratus

#endif  // STRATUS_LOG_SEVERITY_HPP
