// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_STORE_CONFIG_PARSER_HPP
#define STRATUS_STORE_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include <stratus_log_init.hpp>

#include "store_config.hpp"

namespace stratus {
namespace store {

/**
 * Everything a host process needs to run a store
 */
struct StratusConfig {
  StoreConfig store;
  ::stratus::logging::LoggingConfig logging;
};

/**
 * YAML loader for StratusConfig
 *
 * Missing keys keep their defaults. Layout:
 *
 *   s3:
 *     endpoint_url: "http://localhost:9000"
 *     bucket: uploads
 *     region: us-east-1
 *     use_ssl: false
 *     verify_ssl: true
 *     access_key: ...            # optional, env fallback
 *     secret_key: ...
 *     connect_timeout_ms: 10000
 *     request_timeout_ms: 300000
 *     max_sdk_retries: 3
 *   store:
 *     file_prefix: files/
 *     state_prefix: upload-info/
 *     default_expiration_sec: 86400
 *     orphan_grace_period_sec: 3600
 *     content_chunk_size: 8388608
 *   parts:
 *     min_part_size: 5242880
 *     max_part_size: 5368709120
 *     preferred_part_size: 52428800
 *     max_part_count: 1000
 *   sweeper:
 *     interval_sec: 300
 *   logging:
 *     console:
 *       enabled: true
 *       colors: true
 *       level: info
 *       components:               # optional per-component thresholds
 *         ingestion: debug
 */
class StoreConfigParser {
public:
  StoreConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, StratusConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, StratusConfig& config);

  /**
   * Validate configuration, including the S3 connection settings
   */
  static bool validate(const StratusConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_s3(const YAML::Node& node, S3Config& s3);
  bool parse_store(const YAML::Node& node, StoreConfig& store);
  bool parse_parts(const YAML::Node& node, PartSizeLimits& limits);
  bool parse_sweeper(const YAML::Node& node, StoreConfig& store);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& log_config);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_STORE_CONFIG_PARSER_HPP
