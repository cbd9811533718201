// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_STORE_CONFIG_HPP
#define STRATUS_STORE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "part_size_planner.hpp"

namespace stratus {
namespace store {

/**
 * S3 connection options
 */
struct S3Config {
  std::string endpoint_url;  // e.g., "https://play.min.io"; empty for AWS S3
  std::string bucket;
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // Empty values fall back to AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // Parts can be several hundred MB

  // Retries inside the SDK. Part commits are not retried by the store itself; a
  // failed append is resumed by the client from the persisted offset.
  int max_sdk_retries = 3;
};

/**
 * Upload store configuration
 */
struct StoreConfig {
  S3Config s3;

  // Key namespaces. Normalized to end with '/'; non-empty, and neither may contain
  // the other.
  std::string file_prefix = "files/";
  std::string state_prefix = "upload-info/";

  PartSizeLimits part_limits;

  // Expiration assigned to new uploads
  std::chrono::seconds default_expiration{std::chrono::hours(24)};

  // Multipart uploads younger than this are never aborted as orphans; their state
  // record may not be visible yet. Zero disables the guard.
  std::chrono::seconds orphan_grace_period{std::chrono::hours(1)};

  // Range size used when streaming assembled objects back
  uint64_t content_chunk_size = 8 * 1024 * 1024;

  // Period of the background expiration sweep
  std::chrono::seconds sweep_interval{std::chrono::minutes(5)};
};

/**
 * Append '/' to a non-empty prefix that lacks it
 */
std::string normalizePrefix(const std::string& prefix);

/**
 * Validate store settings (prefixes, part limits, chunk size)
 *
 * S3 connection settings are not checked here; an injected backend does not need
 * them.
 *
 * @param config Configuration to check
 * @param error_msg Set to a description of the first problem
 * @return true if valid
 */
bool validateStoreConfig(const StoreConfig& config, std::string& error_msg);

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_STORE_CONFIG_HPP
