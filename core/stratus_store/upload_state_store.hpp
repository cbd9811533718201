// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_UPLOAD_STATE_STORE_HPP
#define STRATUS_UPLOAD_STATE_STORE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "object_backend.hpp"
#include "store_result.hpp"
#include "upload_record.hpp"

namespace stratus {
namespace store {

class UploadStateStore;

/**
 * Lazy cursor over every readable upload record
 *
 * Pages of the state prefix listing are fetched on demand. Records that fail to
 * decode are skipped (and counted), as are records deleted between listing and
 * reading. Listing and backend read failures are returned to the caller; calling
 * next() again retries the failed step.
 */
class UploadRecordCursor {
public:
  /**
   * Advance to the next record
   *
   * @return Next record, std::nullopt when exhausted, or the listing/read error
   */
  Result<std::optional<UploadRecord>> next(const CancellationToken& cancel = {});

  /**
   * Number of records skipped so far as unreadable
   */
  size_t skipped() const {
    return skipped_;
  }

private:
  friend class UploadStateStore;

  explicit UploadRecordCursor(const UploadStateStore& store)
      : store_(&store) {}

  Status fetchPage(const CancellationToken& cancel);

  const UploadStateStore* store_;
  std::vector<ObjectSummary> page_;
  size_t position_ = 0;
  std::string continuation_token_;
  bool started_ = false;
  bool exhausted_ = false;
  size_t skipped_ = 0;
};

/**
 * Persists upload records as JSON objects under the state prefix
 *
 * One object per upload, keyed state_prefix + file_id. Writes replace the whole
 * document; there is no conditional write, so concurrent writers to the same
 * record race with last-writer-wins semantics.
 */
class UploadStateStore {
public:
  /**
   * @param backend Object store holding the records
   * @param state_prefix Key prefix, normalized to end with '/'
   */
  UploadStateStore(IObjectBackend& backend, std::string state_prefix);

  // Non-copyable, non-movable
  UploadStateStore(const UploadStateStore&) = delete;
  UploadStateStore& operator=(const UploadStateStore&) = delete;
  UploadStateStore(UploadStateStore&&) = delete;
  UploadStateStore& operator=(UploadStateStore&&) = delete;

  /**
   * Persist a new record
   *
   * The existence check and the write are separate requests, so two creators
   * racing on the same FileId may both succeed.
   *
   * @return ALREADY_EXISTS if a record for record.file_id is visible
   */
  Status create(const UploadRecord& record, const CancellationToken& cancel = {});

  /**
   * Load a record
   *
   * @return NOT_FOUND if absent, CORRUPT_STATE if undecodable or owned by another id
   */
  Result<UploadRecord> get(const std::string& file_id, const CancellationToken& cancel = {}) const;

  /**
   * Replace a record
   */
  Status put(const UploadRecord& record, const CancellationToken& cancel = {});

  /**
   * Delete a record. Removing an absent record succeeds.
   */
  Status remove(const std::string& file_id, const CancellationToken& cancel = {});

  /**
   * Check whether a record object is visible
   */
  Result<bool> exists(const std::string& file_id, const CancellationToken& cancel = {}) const;

  /**
   * Start a lazy enumeration of all records
   */
  UploadRecordCursor list() const;

  std::string recordKey(const std::string& file_id) const;

  const std::string& prefix() const {
    return state_prefix_;
  }

private:
  friend class UploadRecordCursor;

  IObjectBackend& backend_;
  std::string state_prefix_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_UPLOAD_STATE_STORE_HPP
