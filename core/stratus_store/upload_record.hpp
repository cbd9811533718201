// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_UPLOAD_RECORD_HPP
#define STRATUS_UPLOAD_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "store_result.hpp"

namespace stratus {
namespace store {

/**
 * Upload length value for uploads created with a deferred length
 */
constexpr int64_t kDeferredLength = -1;

/**
 * One committed part of a multipart upload
 */
struct PartRecord {
  int number = 0;              // 1-based, contiguous in commit order
  int64_t size_in_bytes = 0;   // Bytes uploaded in this part
  std::string etag;            // Backend token required to complete the upload
};

/**
 * Persisted state of one resumable upload
 */
struct UploadRecord {
  std::string file_id;                              // Immutable, assigned at creation
  std::string upload_id;                            // Backend multipart handle
  std::string metadata;                             // Opaque client metadata
  int64_t upload_length = kDeferredLength;          // Declared size, -1 while deferred
  int64_t upload_offset = 0;                        // Bytes durably committed
  std::vector<PartRecord> parts;                    // Ordered by number
  std::chrono::system_clock::time_point expires;    // Expiration deadline (UTC)
  std::chrono::system_clock::time_point created_at;

  bool lengthKnown() const {
    return upload_length >= 0;
  }

  /**
   * All declared bytes committed
   */
  bool isComplete() const {
    return lengthKnown() && upload_offset == upload_length;
  }

  /**
   * Highest committed part number, 0 when no part exists
   */
  int lastPartNumber() const;
};

/**
 * Format a time point as ISO 8601 UTC with second precision ("2026-01-02T03:04:05Z")
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/**
 * Parse the format written by formatTimestamp()
 *
 * @return Time point, or std::nullopt if the text is not a valid timestamp
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

/**
 * Serialize a record to its persisted JSON document
 *
 * JSON strings must be valid UTF-8. A record whose metadata or identifiers are not
 * is rejected with INVALID_ARGUMENT.
 *
 * @return Document body or INVALID_ARGUMENT
 */
Result<std::string> encodeUploadRecord(const UploadRecord& record);

/**
 * Parse a persisted JSON document
 *
 * Besides the JSON shape, the record invariants are checked: the offset equals
 * the sum of part sizes, part numbers run 1..n, and the offset does not exceed a
 * known length. Any violation is reported as CORRUPT_STATE.
 *
 * @param json Document body
 * @return Decoded record or CORRUPT_STATE
 */
Result<UploadRecord> decodeUploadRecord(const std::string& json);

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_UPLOAD_RECORD_HPP
