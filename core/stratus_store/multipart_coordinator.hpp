// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_MULTIPART_COORDINATOR_HPP
#define STRATUS_MULTIPART_COORDINATOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "object_backend.hpp"
#include "store_result.hpp"
#include "upload_record.hpp"
#include "upload_state_store.hpp"

namespace stratus {
namespace store {

/**
 * User metadata key holding the opaque upload metadata on the assembled object
 */
constexpr const char* kUploadMetadataKey = "upload-metadata";

class MultipartUploadCoordinator;

/**
 * Lazy cursor over incomplete multipart uploads under the file prefix
 */
class MultipartUploadCursor {
public:
  /**
   * @return Next upload, std::nullopt when exhausted, or the listing error
   */
  Result<std::optional<MultipartUploadSummary>> next(const CancellationToken& cancel = {});

private:
  friend class MultipartUploadCoordinator;

  explicit MultipartUploadCursor(const MultipartUploadCoordinator& coordinator)
      : coordinator_(&coordinator) {}

  const MultipartUploadCoordinator* coordinator_;
  std::vector<MultipartUploadSummary> page_;
  size_t position_ = 0;
  std::string key_marker_;
  std::string upload_id_marker_;
  bool started_ = false;
  bool exhausted_ = false;
};

/**
 * Drives the backend multipart lifecycle of uploads
 *
 * Every committed part is recorded through the UploadStateStore before
 * uploadPart() returns, so a crash never loses an acknowledged part. Parts of one
 * upload must be committed sequentially by a single caller.
 */
class MultipartUploadCoordinator {
public:
  /**
   * @param backend Object store
   * @param state_store Record persistence, must outlive the coordinator
   * @param file_prefix Key prefix of assembled objects, normalized to end with '/'
   */
  MultipartUploadCoordinator(
    IObjectBackend& backend, UploadStateStore& state_store, std::string file_prefix
  );

  // Non-copyable, non-movable
  MultipartUploadCoordinator(const MultipartUploadCoordinator&) = delete;
  MultipartUploadCoordinator& operator=(const MultipartUploadCoordinator&) = delete;
  MultipartUploadCoordinator(MultipartUploadCoordinator&&) = delete;
  MultipartUploadCoordinator& operator=(MultipartUploadCoordinator&&) = delete;

  /**
   * Open a multipart upload for file_id
   *
   * @param metadata Opaque client metadata, attached as user metadata
   * @return Backend upload id
   */
  Result<std::string> initiate(
    const std::string& file_id, const std::string& metadata, const CancellationToken& cancel = {}
  );

  /**
   * Upload data as the next part and persist the updated record
   *
   * record is updated only when both the part upload and the record write
   * succeeded. On any failure it is left untouched.
   *
   * @return The committed part; NOT_FOUND if the backend no longer knows the upload
   */
  Result<PartRecord> uploadPart(
    UploadRecord& record, const std::string& data, const CancellationToken& cancel = {}
  );

  /**
   * Assemble the uploaded parts into the final object
   *
   * Idempotent: if the backend no longer knows the upload but the assembled
   * object exists, the upload was already finalized and this succeeds.
   *
   * @return INVALID_STATE unless the record is complete
   */
  Status finalize(const UploadRecord& record, const CancellationToken& cancel = {});

  /**
   * Discard a multipart upload. An unknown upload id counts as success.
   */
  Status abort(
    const std::string& file_id, const std::string& upload_id, const CancellationToken& cancel = {}
  );

  /**
   * Remove every trace of an upload: abort the handle, delete the assembled
   * object, delete the record
   *
   * A failed abort is logged and the removal continues; the reconciler aborts the
   * left-over handle later as an orphan.
   */
  Status terminate(const UploadRecord& record, const CancellationToken& cancel = {});

  /**
   * Start a lazy enumeration of incomplete multipart uploads under the file prefix
   */
  MultipartUploadCursor listIncompleteUploads() const;

  std::string fileKey(const std::string& file_id) const;

  const std::string& prefix() const {
    return file_prefix_;
  }

private:
  friend class MultipartUploadCursor;

  Status finalizeEmpty(const UploadRecord& record, const CancellationToken& cancel);

  IObjectBackend& backend_;
  UploadStateStore& state_store_;
  std::string file_prefix_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_MULTIPART_COORDINATOR_HPP
