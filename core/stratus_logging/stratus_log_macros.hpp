// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_LOG_MACROS_HPP
#define STRATUS_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <sstream>
#include <string>

#include "stratus_log_severity.hpp"

namespace stratus {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger used by the STRATUS_LOG_* macros.
 * Defined in stratus_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value field for structured messages.
 * Usage: STRATUS_LOG_INFO("part committed" << kv("number", 3));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace stratus

// Define STRATUS_LOG_COMPONENT before including this header to tag every record
// emitted from the translation unit. The tag is the "Component" attribute that
// per-component thresholds match against.
#ifndef STRATUS_LOG_COMPONENT
#define STRATUS_LOG_COMPONENT "stratus"
#endif

// DEBUG records are compiled out of release builds.
#ifdef NDEBUG
#define STRATUS_LOG_ENABLE_DEBUG 0
#else
#define STRATUS_LOG_ENABLE_DEBUG 1
#endif

#define STRATUS_LOG_SEV(level, msg)                                                   \
  do {                                                                                \
    BOOST_LOG_SEV(::stratus::logging::get_logger(), level)                            \
      << ::boost::log::add_value(                                                     \
           ::stratus::logging::component_attr, std::string(STRATUS_LOG_COMPONENT)     \
         )                                                                            \
      << msg;                                                                         \
  } while (0)

#define STRATUS_LOG_DEBUG(msg)                                                        \
  do {                                                                                \
    if (STRATUS_LOG_ENABLE_DEBUG) {                                                   \
      STRATUS_LOG_SEV(::stratus::logging::severity_level::debug, msg);                \
    }                                                                                 \
  } while (0)

#define STRATUS_LOG_INFO(msg) STRATUS_LOG_SEV(::stratus::logging::severity_level::info, msg)
#define STRATUS_LOG_WARN(msg) STRATUS_LOG_SEV(::stratus::logging::severity_level::warn, msg)
#define STRATUS_LOG_ERROR(msg) STRATUS_LOG_SEV(::stratus::logging::severity_level::error, msg)
#define STRATUS_LOG_FATAL(msg) STRATUS_LOG_SEV(::stratus::logging::severity_level::fatal, msg)

// Tags every record emitted on this thread until scope exit with the upload's FileId.
// Usage: STRATUS_LOG_SCOPED_FILE(record.file_id);
#define STRATUS_LOG_SCOPED_FILE(file_id_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR(              \
    "FileID", boost::log::attributes::constant<std::string>(file_id_val))

#endif  // STRATUS_LOG_MACROS_HPP
