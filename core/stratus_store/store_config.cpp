// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "store_config.hpp"

namespace stratus {
namespace store {

std::string normalizePrefix(const std::string& prefix) {
  if (!prefix.empty() && prefix.back() != '/') {
    return prefix + "/";
  }
  return prefix;
}

bool validateStoreConfig(const StoreConfig& config, std::string& error_msg) {
  const std::string file_prefix = normalizePrefix(config.file_prefix);
  const std::string state_prefix = normalizePrefix(config.state_prefix);

  if (file_prefix.empty() || state_prefix.empty()) {
    error_msg = "file_prefix and state_prefix must not be empty";
    return false;
  }
  if (file_prefix == state_prefix) {
    error_msg = "file_prefix and state_prefix must differ (both are '" + file_prefix + "')";
    return false;
  }
  // Listing one namespace must never return keys of the other
  if (file_prefix.compare(0, state_prefix.size(), state_prefix) == 0 ||
      state_prefix.compare(0, file_prefix.size(), file_prefix) == 0) {
    error_msg = "file_prefix '" + file_prefix + "' and state_prefix '" + state_prefix +
                "' must not be nested";
    return false;
  }
  if (!validatePartSizeLimits(config.part_limits, error_msg)) {
    return false;
  }
  if (config.content_chunk_size == 0) {
    error_msg = "content_chunk_size must be positive";
    return false;
  }
  if (config.default_expiration.count() <= 0) {
    error_msg = "default_expiration must be positive";
    return false;
  }
  if (config.orphan_grace_period.count() < 0) {
    error_msg = "orphan_grace_period must not be negative";
    return false;
  }
  return true;
}

}  // namespace store
}  // namespace stratus
