// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_PART_SIZE_PLANNER_HPP
#define STRATUS_PART_SIZE_PLANNER_HPP

#include <cstdint>
#include <string>

namespace stratus {
namespace store {

constexpr int64_t kMegaByte = 1024 * 1024;
constexpr int64_t kGigaByte = 1024 * kMegaByte;

/**
 * Part size bounds of the backend's multipart upload
 *
 * Defaults follow AWS S3: 5MB minimum, 5GB maximum, 1000 parts per upload
 * (S3 accepts 10000, fewer parts keep state records small).
 */
struct PartSizeLimits {
  int64_t min_part_size = 5 * kMegaByte;
  int64_t max_part_size = 5 * kGigaByte;
  int64_t preferred_part_size = 50 * kMegaByte;
  int64_t max_part_count = 1000;
};

/**
 * Compute the part size used to slice an upload
 *
 * Uploads that fit into max_part_count parts of preferred_part_size use the
 * preferred size. Larger uploads are divided evenly over max_part_count parts,
 * rounding up. A result above max_part_size or below min_part_size falls back to
 * preferred_part_size without re-clamping, so limits with preferred outside
 * [min, max] yield a size outside the bounds (see validatePartSizeLimits).
 *
 * @param total_size Declared upload length, -1 when deferred
 * @param limits Configured bounds
 * @return Part size in bytes
 */
int64_t planPartSize(int64_t total_size, const PartSizeLimits& limits);

/**
 * Check that limits are usable: 1 <= min <= preferred <= max and
 * max_part_count >= 1.
 *
 * @param limits Limits to check
 * @param error_msg Set to a description of the first violation
 * @return true if the limits are consistent
 */
bool validatePartSizeLimits(const PartSizeLimits& limits, std::string& error_msg);

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_PART_SIZE_PLANNER_HPP
