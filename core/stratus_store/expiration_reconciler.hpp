// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_EXPIRATION_RECONCILER_HPP
#define STRATUS_EXPIRATION_RECONCILER_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "multipart_coordinator.hpp"
#include "store_result.hpp"
#include "upload_record.hpp"
#include "upload_state_store.hpp"

namespace stratus {
namespace store {

/**
 * Finds and purges expired uploads, and aborts multipart uploads no record
 * refers to
 */
class ExpirationReconciler {
public:
  /**
   * @param orphan_grace_period Multipart uploads initiated more recently than this
   *        are never aborted as orphans. Zero disables the guard.
   */
  ExpirationReconciler(
    UploadStateStore& state_store, MultipartUploadCoordinator& coordinator,
    std::chrono::seconds orphan_grace_period
  );

  // Non-copyable, non-movable
  ExpirationReconciler(const ExpirationReconciler&) = delete;
  ExpirationReconciler& operator=(const ExpirationReconciler&) = delete;
  ExpirationReconciler(ExpirationReconciler&&) = delete;
  ExpirationReconciler& operator=(ExpirationReconciler&&) = delete;

  /**
   * FileIds of expired incomplete uploads
   */
  Result<std::vector<std::string>> findExpired(const CancellationToken& cancel = {});

  /**
   * Run one reconciliation pass
   *
   * 1. Enumerate records, collecting known upload ids and expired uploads.
   * 2. Abort every incomplete multipart upload under the file prefix whose upload
   *    id no record knows.
   * 3. Terminate every expired upload.
   *
   * A failed listing fails the pass; records are listed first, so nothing is
   * aborted without a complete set of known upload ids. Failures on individual
   * orphans or expired uploads are logged and the pass continues.
   *
   * @return Number of expired uploads removed
   */
  Result<size_t> reconcile(const CancellationToken& cancel = {});

  /**
   * Expiration predicate: the deadline passed and the offset is below the
   * declared length. Uploads whose length is still deferred do not qualify.
   */
  static bool isExpired(const UploadRecord& record, std::chrono::system_clock::time_point now);

private:
  UploadStateStore& state_store_;
  MultipartUploadCoordinator& coordinator_;
  std::chrono::seconds orphan_grace_period_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_EXPIRATION_RECONCILER_HPP
