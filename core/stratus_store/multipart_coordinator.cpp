// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_coordinator.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "store_config.hpp"

#define STRATUS_LOG_COMPONENT "multipart"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

namespace {

constexpr const char* kContentType = "application/octet-stream";

}  // namespace

MultipartUploadCoordinator::MultipartUploadCoordinator(
  IObjectBackend& backend, UploadStateStore& state_store, std::string file_prefix
)
    : backend_(backend)
    , state_store_(state_store)
    , file_prefix_(normalizePrefix(file_prefix)) {}

std::string MultipartUploadCoordinator::fileKey(const std::string& file_id) const {
  return file_prefix_ + file_id;
}

Result<std::string> MultipartUploadCoordinator::initiate(
  const std::string& file_id, const std::string& metadata, const CancellationToken& cancel
) {
  std::map<std::string, std::string> user_metadata;
  if (!metadata.empty()) {
    user_metadata[kUploadMetadataKey] = metadata;
  }

  auto upload_id = backend_.createMultipartUpload(fileKey(file_id), user_metadata, cancel);
  if (!upload_id) {
    STRATUS_LOG_ERROR(
      "Failed to open multipart upload" << logging::kv("file_id", file_id)
                                        << logging::kv("error", upload_id.error().message)
    );
  }
  return upload_id;
}

Result<PartRecord> MultipartUploadCoordinator::uploadPart(
  UploadRecord& record, const std::string& data, const CancellationToken& cancel
) {
  if (data.empty()) {
    return Result<PartRecord>::Failure(StoreErrorKind::INVALID_ARGUMENT, "empty part");
  }

  PartRecord part;
  part.number = record.lastPartNumber() + 1;
  part.size_in_bytes = static_cast<int64_t>(data.size());

  auto etag = backend_.uploadPart(fileKey(record.file_id), record.upload_id, part.number, data, cancel);
  if (!etag) {
    if (etag.is(StoreErrorKind::NOT_FOUND)) {
      return Result<PartRecord>::Failure(
        StoreErrorKind::NOT_FOUND,
        "multipart upload " + record.upload_id + " no longer exists", etag.error().code
      );
    }
    return Result<PartRecord>::Failure(etag.error());
  }
  part.etag = std::move(etag.value());

  UploadRecord updated = record;
  updated.parts.push_back(part);
  updated.upload_offset += part.size_in_bytes;

  Status persisted = state_store_.put(updated, cancel);
  if (!persisted) {
    // The uploaded part stays unreferenced; the next attempt reuses its number and
    // replaces it
    STRATUS_LOG_ERROR(
      "Part uploaded but record not persisted" << logging::kv("part", part.number)
                                               << logging::kv("error", persisted.error().message)
    );
    return Result<PartRecord>::Failure(persisted.error());
  }

  record = std::move(updated);
  STRATUS_LOG_DEBUG(
    "Part committed" << logging::kv("part", part.number) << logging::kv("size", part.size_in_bytes)
                     << logging::kv("offset", record.upload_offset)
  );
  return Result<PartRecord>::Success(std::move(part));
}

Status MultipartUploadCoordinator::finalize(
  const UploadRecord& record, const CancellationToken& cancel
) {
  if (!record.isComplete()) {
    return Status::Failure(
      StoreErrorKind::INVALID_STATE,
      "upload " + record.file_id + " is incomplete (offset " + std::to_string(record.upload_offset) +
        " of " + std::to_string(record.upload_length) + ")"
    );
  }

  if (record.parts.empty()) {
    return finalizeEmpty(record, cancel);
  }

  std::vector<PartRecord> ordered = record.parts;
  std::sort(ordered.begin(), ordered.end(), [](const PartRecord& a, const PartRecord& b) {
    return a.number < b.number;
  });
  std::vector<CompletedPart> parts;
  parts.reserve(ordered.size());
  for (const auto& part : ordered) {
    parts.push_back(CompletedPart{part.number, part.etag});
  }

  const std::string key = fileKey(record.file_id);
  Status completed = backend_.completeMultipartUpload(key, record.upload_id, parts, cancel);
  if (completed) {
    STRATUS_LOG_INFO(
      "Upload finalized" << logging::kv("parts", parts.size())
                         << logging::kv("size", record.upload_length)
    );
    return completed;
  }
  if (!completed.is(StoreErrorKind::NOT_FOUND)) {
    return completed;
  }

  // The handle is gone: either an earlier finalize succeeded or the upload was aborted
  auto head = backend_.headObject(key, cancel);
  if (head) {
    STRATUS_LOG_DEBUG("Upload already finalized" << logging::kv("upload_id", record.upload_id));
    return Status::Success();
  }
  if (head.is(StoreErrorKind::NOT_FOUND)) {
    return Status::Failure(
      StoreErrorKind::NOT_FOUND,
      "multipart upload " + record.upload_id + " no longer exists and " + key + " is absent"
    );
  }
  return head.status();
}

Status MultipartUploadCoordinator::finalizeEmpty(
  const UploadRecord& record, const CancellationToken& cancel
) {
  // Backends reject completing a multipart upload without parts
  std::map<std::string, std::string> user_metadata;
  if (!record.metadata.empty()) {
    user_metadata[kUploadMetadataKey] = record.metadata;
  }
  Status written =
    backend_.putObject(fileKey(record.file_id), std::string(), kContentType, user_metadata, cancel);
  if (!written) {
    return written;
  }

  Status aborted = abort(record.file_id, record.upload_id, cancel);
  if (!aborted) {
    STRATUS_LOG_WARN(
      "Empty upload written but handle not aborted" << logging::kv("upload_id", record.upload_id)
                                                    << logging::kv("error", aborted.error().message)
    );
  }
  STRATUS_LOG_INFO("Empty upload finalized");
  return Status::Success();
}

Status MultipartUploadCoordinator::abort(
  const std::string& file_id, const std::string& upload_id, const CancellationToken& cancel
) {
  Status aborted = backend_.abortMultipartUpload(fileKey(file_id), upload_id, cancel);
  if (aborted.is(StoreErrorKind::NOT_FOUND)) {
    return Status::Success();
  }
  return aborted;
}

Status MultipartUploadCoordinator::terminate(
  const UploadRecord& record, const CancellationToken& cancel
) {
  Status aborted = abort(record.file_id, record.upload_id, cancel);
  if (aborted.is(StoreErrorKind::CANCELLED)) {
    return aborted;
  }
  if (!aborted) {
    STRATUS_LOG_WARN(
      "Abort failed, continuing removal" << logging::kv("file_id", record.file_id)
                                         << logging::kv("error", aborted.error().message)
    );
  }

  Status deleted = backend_.deleteObject(fileKey(record.file_id), cancel);
  if (!deleted) {
    return deleted;
  }

  // The record goes last so an interrupted termination can be repeated
  return state_store_.remove(record.file_id, cancel);
}

MultipartUploadCursor MultipartUploadCoordinator::listIncompleteUploads() const {
  return MultipartUploadCursor(*this);
}

// =============================================================================
// MultipartUploadCursor
// =============================================================================

Result<std::optional<MultipartUploadSummary>> MultipartUploadCursor::next(
  const CancellationToken& cancel
) {
  using NextResult = Result<std::optional<MultipartUploadSummary>>;

  while (position_ >= page_.size()) {
    if (started_ && exhausted_) {
      return NextResult::Success(std::nullopt);
    }
    if (cancel.isCancellationRequested()) {
      return NextResult::Failure(StoreErrorKind::CANCELLED, "multipart listing cancelled");
    }

    auto page = coordinator_->backend_.listMultipartUploads(
      coordinator_->file_prefix_, key_marker_, upload_id_marker_, cancel
    );
    if (!page) {
      return NextResult::Failure(page.error());
    }
    started_ = true;
    page_ = std::move(page.value().uploads);
    position_ = 0;
    if (page.value().truncated) {
      key_marker_ = page.value().next_key_marker;
      upload_id_marker_ = page.value().next_upload_id_marker;
    } else {
      exhausted_ = true;
    }
  }

  return NextResult::Success(page_[position_++]);
}

}  // namespace store
}  // namespace stratus
