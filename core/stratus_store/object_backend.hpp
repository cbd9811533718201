// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_OBJECT_BACKEND_HPP
#define STRATUS_OBJECT_BACKEND_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "store_result.hpp"

namespace stratus {
namespace store {

/**
 * Object attributes returned by headObject()
 */
struct ObjectHead {
  uint64_t content_length = 0;
  std::string etag;
  std::map<std::string, std::string> metadata;  // User metadata, keys without x-amz-meta-
};

struct ObjectSummary {
  std::string key;
  uint64_t size = 0;
};

/**
 * One page of a prefix listing
 */
struct ObjectListingPage {
  std::vector<ObjectSummary> objects;
  bool truncated = false;
  std::string next_continuation_token;  // Valid when truncated
};

/**
 * An incomplete multipart upload as reported by the backend
 */
struct MultipartUploadSummary {
  std::string key;
  std::string upload_id;
  std::chrono::system_clock::time_point initiated;
};

/**
 * One page of an incomplete multipart upload listing
 */
struct MultipartListingPage {
  std::vector<MultipartUploadSummary> uploads;
  bool truncated = false;
  std::string next_key_marker;        // Valid when truncated
  std::string next_upload_id_marker;  // Valid when truncated
};

/**
 * Part reference submitted to completeMultipartUpload()
 */
struct CompletedPart {
  int number = 0;
  std::string etag;
};

/**
 * Interface for the object store operations the upload store relies on
 *
 * Models S3 semantics, including eventual consistency: a successful write may not
 * be visible to an immediately following read or listing. Every call takes a
 * cancellation token; implementations must report an observed cancellation as
 * CANCELLED, never as success or as a generic error.
 *
 * Error contract:
 * - absent objects and unknown upload ids are NOT_FOUND
 * - transient faults (timeouts, throttling, 5xx, networking) are BACKEND_UNAVAILABLE
 * - everything else is BACKEND_ERROR
 */
class IObjectBackend {
public:
  virtual ~IObjectBackend() = default;

  /**
   * Write a whole object. Succeeds only once the backend acknowledged the write.
   */
  virtual Status putObject(
    const std::string& key, const std::string& body, const std::string& content_type,
    const std::map<std::string, std::string>& metadata, const CancellationToken& cancel
  ) = 0;

  virtual Result<std::string> getObject(
    const std::string& key, const CancellationToken& cancel
  ) = 0;

  /**
   * Read length bytes starting at offset. Returns fewer bytes at the object end.
   */
  virtual Result<std::string> getObjectRange(
    const std::string& key, uint64_t offset, uint64_t length, const CancellationToken& cancel
  ) = 0;

  virtual Result<ObjectHead> headObject(
    const std::string& key, const CancellationToken& cancel
  ) = 0;

  /**
   * Delete an object. Deleting an absent key succeeds.
   */
  virtual Status deleteObject(const std::string& key, const CancellationToken& cancel) = 0;

  /**
   * List keys directly under prefix ("/" delimited), one page per call
   *
   * @param continuation_token Empty for the first page
   */
  virtual Result<ObjectListingPage> listObjects(
    const std::string& prefix, const std::string& continuation_token,
    const CancellationToken& cancel
  ) = 0;

  /**
   * Open a multipart upload for key
   *
   * @return Backend-assigned upload id
   */
  virtual Result<std::string> createMultipartUpload(
    const std::string& key, const std::map<std::string, std::string>& metadata,
    const CancellationToken& cancel
  ) = 0;

  /**
   * Upload one part. Re-uploading an existing part number replaces it.
   *
   * @return ETag of the stored part
   */
  virtual Result<std::string> uploadPart(
    const std::string& key, const std::string& upload_id, int part_number,
    const std::string& data, const CancellationToken& cancel
  ) = 0;

  /**
   * Assemble the object from the given parts and close the upload
   */
  virtual Status completeMultipartUpload(
    const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts,
    const CancellationToken& cancel
  ) = 0;

  /**
   * Discard an upload and its parts. Unknown upload ids are NOT_FOUND.
   */
  virtual Status abortMultipartUpload(
    const std::string& key, const std::string& upload_id, const CancellationToken& cancel
  ) = 0;

  /**
   * List incomplete multipart uploads under prefix, one page per call
   *
   * @param key_marker Empty for the first page
   * @param upload_id_marker Empty for the first page
   */
  virtual Result<MultipartListingPage> listMultipartUploads(
    const std::string& prefix, const std::string& key_marker, const std::string& upload_id_marker,
    const CancellationToken& cancel
  ) = 0;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_OBJECT_BACKEND_HPP
