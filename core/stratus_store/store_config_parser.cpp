// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "store_config_parser.hpp"

#include <fstream>

#define STRATUS_LOG_COMPONENT "config_parser"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

bool StoreConfigParser::load_from_file(const std::string& path, StratusConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool StoreConfigParser::load_from_string(const std::string& yaml_content, StratusConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["s3"] && !parse_s3(node["s3"], config.store.s3)) {
      return false;
    }
    if (node["store"] && !parse_store(node["store"], config.store)) {
      return false;
    }
    if (node["parts"] && !parse_parts(node["parts"], config.store.part_limits)) {
      return false;
    }
    if (node["sweeper"] && !parse_sweeper(node["sweeper"], config.store)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    STRATUS_LOG_DEBUG("Configuration loaded" << logging::kv("bucket", config.store.s3.bucket));
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool StoreConfigParser::parse_s3(const YAML::Node& node, S3Config& s3) {
  if (!node.IsMap()) {
    last_error_ = "s3 must be a map";
    return false;
  }
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    s3.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_sdk_retries"]) {
    s3.max_sdk_retries = node["max_sdk_retries"].as<int>();
  }
  return true;
}

bool StoreConfigParser::parse_store(const YAML::Node& node, StoreConfig& store) {
  if (!node.IsMap()) {
    last_error_ = "store must be a map";
    return false;
  }
  if (node["file_prefix"]) {
    store.file_prefix = node["file_prefix"].as<std::string>();
  }
  if (node["state_prefix"]) {
    store.state_prefix = node["state_prefix"].as<std::string>();
  }
  if (node["default_expiration_sec"]) {
    store.default_expiration = std::chrono::seconds(node["default_expiration_sec"].as<int64_t>());
  }
  if (node["orphan_grace_period_sec"]) {
    store.orphan_grace_period =
      std::chrono::seconds(node["orphan_grace_period_sec"].as<int64_t>());
  }
  if (node["content_chunk_size"]) {
    store.content_chunk_size = node["content_chunk_size"].as<uint64_t>();
  }
  return true;
}

bool StoreConfigParser::parse_parts(const YAML::Node& node, PartSizeLimits& limits) {
  if (!node.IsMap()) {
    last_error_ = "parts must be a map";
    return false;
  }
  if (node["min_part_size"]) {
    limits.min_part_size = node["min_part_size"].as<int64_t>();
  }
  if (node["max_part_size"]) {
    limits.max_part_size = node["max_part_size"].as<int64_t>();
  }
  if (node["preferred_part_size"]) {
    limits.preferred_part_size = node["preferred_part_size"].as<int64_t>();
  }
  if (node["max_part_count"]) {
    limits.max_part_count = node["max_part_count"].as<int64_t>();
  }
  return true;
}

bool StoreConfigParser::parse_sweeper(const YAML::Node& node, StoreConfig& store) {
  if (!node.IsMap()) {
    last_error_ = "sweeper must be a map";
    return false;
  }
  if (node["interval_sec"]) {
    store.sweep_interval = std::chrono::seconds(node["interval_sec"].as<int64_t>());
  }
  return true;
}

bool StoreConfigParser::parse_logging(
  const YAML::Node& node, logging::LoggingConfig& log_config
) {
  if (!node["console"]) {
    return true;
  }
  const auto& console = node["console"];
  if (console["enabled"]) {
    log_config.console_enabled = console["enabled"].as<bool>();
  }
  if (console["colors"]) {
    log_config.console_colors = console["colors"].as<bool>();
  }
  if (console["level"]) {
    const std::string level_str = console["level"].as<std::string>();
    auto level = logging::parse_severity_level(level_str);
    if (!level) {
      last_error_ = "Invalid logging.console.level: " + level_str;
      return false;
    }
    log_config.console_level = *level;
  }
  if (console["components"]) {
    const auto& components = console["components"];
    if (!components.IsMap()) {
      last_error_ = "logging.console.components must be a map";
      return false;
    }
    for (const auto& entry : components) {
      const std::string component = entry.first.as<std::string>();
      const std::string level_str = entry.second.as<std::string>();
      auto level = logging::parse_severity_level(level_str);
      if (!level) {
        last_error_ = "Invalid logging.console.components." + component + ": " + level_str;
        return false;
      }
      log_config.component_levels[component] = *level;
    }
  }
  return true;
}

bool StoreConfigParser::validate(const StratusConfig& config, std::string& error_msg) {
  const S3Config& s3 = config.store.s3;

  if (s3.bucket.empty()) {
    error_msg = "s3.bucket is not configured";
    return false;
  }

  // Basic URL validation - should start with http:// or https://
  if (!s3.endpoint_url.empty() && s3.endpoint_url.find("http://") != 0 &&
      s3.endpoint_url.find("https://") != 0) {
    error_msg = "Invalid s3.endpoint_url - must start with http:// or https://";
    return false;
  }

  if (s3.connect_timeout_ms <= 0 || s3.request_timeout_ms <= 0) {
    error_msg = "Invalid s3 timeouts - must be > 0";
    return false;
  }

  if (s3.max_sdk_retries < 0 || s3.max_sdk_retries > 100) {
    error_msg = "Invalid s3.max_sdk_retries - must be between 0 and 100";
    return false;
  }

  if (config.store.sweep_interval.count() <= 0) {
    error_msg = "Invalid sweeper.interval_sec - must be > 0";
    return false;
  }

  return validateStoreConfig(config.store, error_msg);
}

}  // namespace store
}  // namespace stratus
