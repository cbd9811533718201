// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "expiration_reconciler.hpp"

#include <set>
#include <utility>

#define STRATUS_LOG_COMPONENT "reconciler"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

namespace {

Status cancelledPass() {
  return Status::Failure(StoreErrorKind::CANCELLED, "reconciliation cancelled");
}

}  // namespace

ExpirationReconciler::ExpirationReconciler(
  UploadStateStore& state_store, MultipartUploadCoordinator& coordinator,
  std::chrono::seconds orphan_grace_period
)
    : state_store_(state_store)
    , coordinator_(coordinator)
    , orphan_grace_period_(orphan_grace_period) {}

bool ExpirationReconciler::isExpired(
  const UploadRecord& record, std::chrono::system_clock::time_point now
) {
  if (record.expires >= now) {
    return false;
  }
  // A deferred length (-1) is never above the offset, so such uploads do not qualify
  return record.upload_offset < record.upload_length;
}

Result<std::vector<std::string>> ExpirationReconciler::findExpired(const CancellationToken& cancel) {
  const auto now = std::chrono::system_clock::now();
  std::vector<std::string> expired;

  UploadRecordCursor cursor = state_store_.list();
  while (true) {
    if (cancel.isCancellationRequested()) {
      return Result<std::vector<std::string>>::Failure(cancelledPass().error());
    }
    auto next = cursor.next(cancel);
    if (!next) {
      return Result<std::vector<std::string>>::Failure(next.error());
    }
    if (!next.value()) {
      break;
    }
    const UploadRecord& record = *next.value();
    if (isExpired(record, now)) {
      expired.push_back(record.file_id);
    }
  }
  return Result<std::vector<std::string>>::Success(std::move(expired));
}

Result<size_t> ExpirationReconciler::reconcile(const CancellationToken& cancel) {
  const auto now = std::chrono::system_clock::now();
  std::set<std::string> known_upload_ids;
  std::vector<UploadRecord> expired;

  UploadRecordCursor records = state_store_.list();
  while (true) {
    if (cancel.isCancellationRequested()) {
      return Result<size_t>::Failure(cancelledPass().error());
    }
    auto next = records.next(cancel);
    if (!next) {
      STRATUS_LOG_ERROR(
        "Record listing failed, pass aborted" << logging::kv("error", next.error().message)
      );
      return Result<size_t>::Failure(next.error());
    }
    if (!next.value()) {
      break;
    }
    UploadRecord& record = *next.value();
    known_upload_ids.insert(record.upload_id);
    if (isExpired(record, now)) {
      expired.push_back(std::move(record));
    }
  }
  if (records.skipped() > 0) {
    STRATUS_LOG_WARN("Unreadable records skipped" << logging::kv("count", records.skipped()));
  }

  size_t orphans_aborted = 0;
  MultipartUploadCursor uploads = coordinator_.listIncompleteUploads();
  while (true) {
    if (cancel.isCancellationRequested()) {
      return Result<size_t>::Failure(cancelledPass().error());
    }
    auto next = uploads.next(cancel);
    if (!next) {
      return Result<size_t>::Failure(next.error());
    }
    if (!next.value()) {
      break;
    }
    const MultipartUploadSummary& upload = *next.value();
    if (known_upload_ids.count(upload.upload_id) > 0) {
      continue;
    }
    if (orphan_grace_period_.count() > 0 && now - upload.initiated < orphan_grace_period_) {
      continue;
    }

    const std::string& file_prefix = coordinator_.prefix();
    if (upload.key.compare(0, file_prefix.size(), file_prefix) != 0) {
      continue;
    }
    const std::string file_id = upload.key.substr(file_prefix.size());
    Status aborted = coordinator_.abort(file_id, upload.upload_id, cancel);
    if (aborted.is(StoreErrorKind::CANCELLED)) {
      return Result<size_t>::Failure(aborted.error());
    }
    if (!aborted) {
      STRATUS_LOG_WARN(
        "Failed to abort orphan upload" << logging::kv("key", upload.key)
                                        << logging::kv("error", aborted.error().message)
      );
      continue;
    }
    ++orphans_aborted;
    STRATUS_LOG_INFO(
      "Orphan multipart upload aborted" << logging::kv("key", upload.key)
                                        << logging::kv("upload_id", upload.upload_id)
    );
  }

  size_t removed = 0;
  for (const auto& record : expired) {
    if (cancel.isCancellationRequested()) {
      return Result<size_t>::Failure(cancelledPass().error());
    }
    STRATUS_LOG_SCOPED_FILE(record.file_id);
    Status terminated = coordinator_.terminate(record, cancel);
    if (terminated.is(StoreErrorKind::CANCELLED)) {
      return Result<size_t>::Failure(terminated.error());
    }
    if (!terminated) {
      STRATUS_LOG_WARN(
        "Failed to remove expired upload" << logging::kv("error", terminated.error().message)
      );
      continue;
    }
    ++removed;
    STRATUS_LOG_INFO(
      "Expired upload removed" << logging::kv("expires", formatTimestamp(record.expires))
    );
  }

  STRATUS_LOG_INFO(
    "Reconciliation pass done" << logging::kv("expired_removed", removed)
                               << logging::kv("orphans_aborted", orphans_aborted)
  );
  return Result<size_t>::Success(removed);
}

}  // namespace store
}  // namespace stratus
