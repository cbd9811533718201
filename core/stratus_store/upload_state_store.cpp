// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_state_store.hpp"

#include <utility>

#include "store_config.hpp"

#define STRATUS_LOG_COMPONENT "state_store"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

namespace {

constexpr const char* kRecordContentType = "application/json";

}  // namespace

UploadStateStore::UploadStateStore(IObjectBackend& backend, std::string state_prefix)
    : backend_(backend)
    , state_prefix_(normalizePrefix(state_prefix)) {}

std::string UploadStateStore::recordKey(const std::string& file_id) const {
  return state_prefix_ + file_id;
}

Status UploadStateStore::create(const UploadRecord& record, const CancellationToken& cancel) {
  auto found = exists(record.file_id, cancel);
  if (!found) {
    return found.status();
  }
  if (found.value()) {
    return Status::Failure(
      StoreErrorKind::ALREADY_EXISTS, "upload record already exists: " + record.file_id
    );
  }
  return put(record, cancel);
}

Result<UploadRecord> UploadStateStore::get(
  const std::string& file_id, const CancellationToken& cancel
) const {
  auto body = backend_.getObject(recordKey(file_id), cancel);
  if (!body) {
    if (body.is(StoreErrorKind::NOT_FOUND)) {
      return Result<UploadRecord>::Failure(
        StoreErrorKind::NOT_FOUND, "no upload record for " + file_id
      );
    }
    return Result<UploadRecord>::Failure(body.error());
  }

  auto record = decodeUploadRecord(body.value());
  if (!record) {
    return Result<UploadRecord>::Failure(
      StoreErrorKind::CORRUPT_STATE,
      "upload record " + file_id + " is unreadable: " + record.error().message
    );
  }
  if (record.value().file_id != file_id) {
    return Result<UploadRecord>::Failure(
      StoreErrorKind::CORRUPT_STATE,
      "upload record " + file_id + " belongs to " + record.value().file_id
    );
  }
  return record;
}

Status UploadStateStore::put(const UploadRecord& record, const CancellationToken& cancel) {
  if (record.file_id.empty()) {
    return Status::Failure(StoreErrorKind::INVALID_ARGUMENT, "upload record without file id");
  }
  auto body = encodeUploadRecord(record);
  if (!body) {
    return body.status();
  }
  return backend_.putObject(recordKey(record.file_id), body.value(), kRecordContentType, {}, cancel);
}

Status UploadStateStore::remove(const std::string& file_id, const CancellationToken& cancel) {
  return backend_.deleteObject(recordKey(file_id), cancel);
}

Result<bool> UploadStateStore::exists(
  const std::string& file_id, const CancellationToken& cancel
) const {
  auto head = backend_.headObject(recordKey(file_id), cancel);
  if (head) {
    return Result<bool>::Success(true);
  }
  if (head.is(StoreErrorKind::NOT_FOUND)) {
    return Result<bool>::Success(false);
  }
  return Result<bool>::Failure(head.error());
}

UploadRecordCursor UploadStateStore::list() const {
  return UploadRecordCursor(*this);
}

// =============================================================================
// UploadRecordCursor
// =============================================================================

Status UploadRecordCursor::fetchPage(const CancellationToken& cancel) {
  auto page = store_->backend_.listObjects(store_->state_prefix_, continuation_token_, cancel);
  if (!page) {
    return page.status();
  }
  started_ = true;
  page_ = std::move(page.value().objects);
  position_ = 0;
  if (page.value().truncated) {
    continuation_token_ = page.value().next_continuation_token;
  } else {
    exhausted_ = true;
    continuation_token_.clear();
  }
  return Status::Success();
}

Result<std::optional<UploadRecord>> UploadRecordCursor::next(const CancellationToken& cancel) {
  using NextResult = Result<std::optional<UploadRecord>>;
  const std::string& prefix = store_->state_prefix_;

  while (true) {
    if (position_ >= page_.size()) {
      if (started_ && exhausted_) {
        return NextResult::Success(std::nullopt);
      }
      Status fetched = fetchPage(cancel);
      if (!fetched) {
        return NextResult::Failure(fetched.error());
      }
      continue;
    }

    const ObjectSummary& object = page_[position_++];
    if (object.key.size() <= prefix.size()) {
      continue;  // The prefix placeholder itself
    }
    std::string file_id = object.key.substr(prefix.size());

    auto record = store_->get(file_id, cancel);
    if (record) {
      return NextResult::Success(std::move(record.value()));
    }
    if (record.is(StoreErrorKind::NOT_FOUND)) {
      STRATUS_LOG_DEBUG("Upload record vanished while listing" << logging::kv("file_id", file_id));
    } else if (record.is(StoreErrorKind::CORRUPT_STATE)) {
      STRATUS_LOG_WARN(
        "Skipping unreadable upload record" << logging::kv("file_id", file_id)
                                            << logging::kv("error", record.error().message)
      );
    } else {
      // Backend faults are not skipped: callers must not mistake a transiently
      // unreadable record for an absent one
      --position_;
      return NextResult::Failure(record.error());
    }
    ++skipped_;
  }
}

}  // namespace store
}  // namespace stratus
