// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_size_planner.hpp"

namespace stratus {
namespace store {

int64_t planPartSize(int64_t total_size, const PartSizeLimits& limits) {
  int64_t part_size;

  if (total_size <= limits.preferred_part_size ||
      total_size <= limits.preferred_part_size * limits.max_part_count) {
    part_size = limits.preferred_part_size;
  } else if (total_size % limits.max_part_count == 0) {
    part_size = total_size / limits.max_part_count;
  } else {
    // Integer division rounds down; one more byte per part keeps the upload
    // within max_part_count parts.
    part_size = total_size / limits.max_part_count + 1;
  }

  if (part_size > limits.max_part_size) {
    part_size = limits.preferred_part_size;
  }
  if (part_size < limits.min_part_size) {
    part_size = limits.preferred_part_size;
  }

  return part_size;
}

bool validatePartSizeLimits(const PartSizeLimits& limits, std::string& error_msg) {
  if (limits.min_part_size < 1) {
    error_msg = "min_part_size must be at least 1 byte";
    return false;
  }
  if (limits.max_part_count < 1) {
    error_msg = "max_part_count must be at least 1";
    return false;
  }
  if (limits.min_part_size > limits.max_part_size) {
    error_msg = "min_part_size (" + std::to_string(limits.min_part_size) +
                ") exceeds max_part_size (" + std::to_string(limits.max_part_size) + ")";
    return false;
  }
  if (limits.preferred_part_size < limits.min_part_size ||
      limits.preferred_part_size > limits.max_part_size) {
    error_msg = "preferred_part_size (" + std::to_string(limits.preferred_part_size) +
                ") is outside [min_part_size, max_part_size]";
    return false;
  }
  return true;
}

}  // namespace store
}  // namespace stratus
