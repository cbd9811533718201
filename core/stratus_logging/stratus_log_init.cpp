// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stratus_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <vector>

#include "stratus_log_macros.hpp"

namespace stratus {
namespace logging {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

std::optional<std::string> env_value(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<bool> parse_flag(const std::string& s) {
  const std::string lower = to_lower(trim(s));
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

/**
 * Sinks this library attached to the Boost.Log core
 *
 * The console sink is tracked separately so flush and shutdown can drain its
 * queue before it is detached.
 */
class SinkRegistry {
public:
  static SinkRegistry& instance() {
    static SinkRegistry registry;
    return registry;
  }

  void install(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
      return;
    }

    boost::log::add_common_attributes();
    if (config.console_enabled) {
      console_ = create_console_sink(
        config.console_level, config.console_colors, nullptr, config.component_levels
      );
      attach(console_);
    }
    initialized_ = true;
  }

  void uninstall() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      return;
    }

    if (console_) {
      console_->stop();
      console_->flush();
    }
    auto core = boost::log::core::get();
    for (const auto& sink : sinks_) {
      core->remove_sink(sink);
    }
    sinks_.clear();
    console_.reset();
    initialized_ = false;
  }

  void add(boost::shared_ptr<boost::log::sinks::sink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    attach(std::move(sink));
  }

  void remove(const boost::shared_ptr<boost::log::sinks::sink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    boost::log::core::get()->remove_sink(sink);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
  }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
      console_->flush();
    }
  }

  bool initialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
  }

private:
  SinkRegistry() = default;

  // Requires mutex_
  void attach(boost::shared_ptr<boost::log::sinks::sink> sink) {
    boost::log::core::get()->add_sink(sink);
    sinks_.push_back(std::move(sink));
  }

  std::mutex mutex_;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> sinks_;
  boost::shared_ptr<async_console_sink_t> console_;
  bool initialized_ = false;
};

}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = to_lower(trim(level_str));
  if (lower == "debug") {
    return severity_level::debug;
  }
  if (lower == "info") {
    return severity_level::info;
  }
  if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  }
  if (lower == "error") {
    return severity_level::error;
  }
  if (lower == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

std::optional<component_levels_t> parse_component_levels(const std::string& text) {
  component_levels_t levels;
  std::istringstream entries(text);
  std::string entry;
  while (std::getline(entries, entry, ',')) {
    if (trim(entry).empty()) {
      continue;
    }
    const auto eq = entry.find('=');
    if (eq == std::string::npos) {
      return std::nullopt;
    }
    const std::string component = trim(entry.substr(0, eq));
    auto level = parse_severity_level(entry.substr(eq + 1));
    if (component.empty() || !level) {
      return std::nullopt;
    }
    levels[component] = *level;
  }
  return levels;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto text = env_value("STRATUS_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*text)) {
      config.console_level = *level;
    }
  }
  if (auto text = env_value("STRATUS_LOG_COLORS")) {
    if (auto colors = parse_flag(*text)) {
      config.console_colors = *colors;
    }
  }
  if (auto text = env_value("STRATUS_LOG_ENABLED")) {
    if (auto enabled = parse_flag(*text)) {
      config.console_enabled = *enabled;
    }
  }
  if (auto text = env_value("STRATUS_LOG_COMPONENTS")) {
    if (auto levels = parse_component_levels(*text)) {
      for (const auto& [component, level] : *levels) {
        config.component_levels[component] = level;
      }
    }
  }
}

void init_logging(const LoggingConfig& config) {
  SinkRegistry::instance().install(config);
}

void init_logging_default() {
  LoggingConfig config;
  apply_env_overrides(config);
  init_logging(config);
}

void shutdown_logging() {
  SinkRegistry::instance().uninstall();
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry::instance().add(std::move(sink));
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry::instance().remove(sink);
}

void flush_logging() {
  SinkRegistry::instance().flush();
}

bool is_logging_initialized() {
  return SinkRegistry::instance().initialized();
}

}  // namespace logging
}  // namespace stratus
