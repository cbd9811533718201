// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_store.hpp"

#include <stdexcept>
#include <utility>

#include "s3_client.hpp"

#define STRATUS_LOG_COMPONENT "upload_store"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

namespace {

StoreConfig checkedConfig(const StoreConfig& config) {
  std::string error_msg;
  if (!validateStoreConfig(config, error_msg)) {
    throw std::invalid_argument("Invalid store configuration: " + error_msg);
  }
  StoreConfig normalized = config;
  normalized.file_prefix = normalizePrefix(config.file_prefix);
  normalized.state_prefix = normalizePrefix(config.state_prefix);
  return normalized;
}

std::shared_ptr<IObjectBackend> checkedBackend(std::shared_ptr<IObjectBackend> backend) {
  if (!backend) {
    throw std::invalid_argument("Invalid store configuration: no object backend");
  }
  return backend;
}

std::shared_ptr<IObjectBackend> makeS3Backend(const S3Config& s3) {
  if (s3.bucket.empty()) {
    throw std::invalid_argument("Invalid store configuration: s3.bucket is not configured");
  }
  return std::make_shared<S3Client>(s3);
}

}  // namespace

UploadStore::UploadStore(const StoreConfig& config)
    : UploadStore(config, makeS3Backend(config.s3)) {}

UploadStore::UploadStore(
  const StoreConfig& config, std::shared_ptr<IObjectBackend> backend,
  std::shared_ptr<FileIdProvider> id_provider
)
    : config_(checkedConfig(config))
    , backend_(checkedBackend(std::move(backend)))
    , id_provider_(id_provider ? std::move(id_provider) : std::make_shared<UuidFileIdProvider>())
    , state_store_(*backend_, config_.state_prefix)
    , coordinator_(*backend_, state_store_, config_.file_prefix)
    , pipeline_(state_store_, coordinator_, config_.part_limits)
    , reconciler_(state_store_, coordinator_, config_.orphan_grace_period)
    , reader_(state_store_, *backend_, config_.file_prefix, config_.content_chunk_size) {
  STRATUS_LOG_INFO(
    "Upload store ready" << logging::kv("file_prefix", config_.file_prefix)
                         << logging::kv("state_prefix", config_.state_prefix)
  );
}

UploadStore::~UploadStore() = default;

Result<UploadRecord> UploadStore::load(const std::string& file_id, const CancellationToken& cancel) {
  return state_store_.get(file_id, cancel);
}

Result<bool> UploadStore::exists(const std::string& file_id, const CancellationToken& cancel) {
  return state_store_.exists(file_id, cancel);
}

Result<std::string> UploadStore::createUpload(
  int64_t upload_length, const std::string& metadata, const CancellationToken& cancel
) {
  if (upload_length < kDeferredLength) {
    return Result<std::string>::Failure(
      StoreErrorKind::INVALID_ARGUMENT, "invalid upload length " + std::to_string(upload_length)
    );
  }

  const std::string file_id = id_provider_->createId(metadata);
  STRATUS_LOG_SCOPED_FILE(file_id);

  auto upload_id = coordinator_.initiate(file_id, metadata, cancel);
  if (!upload_id) {
    return Result<std::string>::Failure(upload_id.error());
  }

  UploadRecord record;
  record.file_id = file_id;
  record.upload_id = upload_id.value();
  record.metadata = metadata;
  record.upload_length = upload_length;
  record.upload_offset = 0;
  record.created_at = std::chrono::system_clock::now();
  record.expires = record.created_at + config_.default_expiration;

  Status created = state_store_.create(record, cancel);
  if (!created) {
    // Without a record nothing refers to the handle; drop it now rather than
    // waiting for the orphan sweep
    Status aborted = coordinator_.abort(file_id, record.upload_id, CancellationToken());
    if (!aborted) {
      STRATUS_LOG_WARN(
        "Failed to abort unrecorded upload" << logging::kv("error", aborted.error().message)
      );
    }
    return Result<std::string>::Failure(created.error());
  }

  STRATUS_LOG_DEBUG("Upload created" << logging::kv("length", upload_length));
  return Result<std::string>::Success(file_id);
}

Result<AppendResult> UploadStore::appendFromStream(
  const std::string& file_id, ByteSource& source, const CancellationToken& cancel
) {
  return pipeline_.appendFromStream(file_id, source, cancel);
}

Result<AppendResult> UploadStore::appendFromReader(
  const std::string& file_id, ChunkReader& reader, const CancellationToken& cancel
) {
  return pipeline_.appendFromReader(file_id, reader, cancel);
}

Result<int64_t> UploadStore::uploadLength(const std::string& file_id, const CancellationToken& cancel) {
  auto record = load(file_id, cancel);
  if (!record) {
    return Result<int64_t>::Failure(record.error());
  }
  return Result<int64_t>::Success(record.value().upload_length);
}

Result<int64_t> UploadStore::uploadOffset(const std::string& file_id, const CancellationToken& cancel) {
  auto record = load(file_id, cancel);
  if (!record) {
    return Result<int64_t>::Failure(record.error());
  }
  return Result<int64_t>::Success(record.value().upload_offset);
}

Result<std::string> UploadStore::uploadMetadata(
  const std::string& file_id, const CancellationToken& cancel
) {
  auto record = load(file_id, cancel);
  if (!record) {
    return Result<std::string>::Failure(record.error());
  }
  return Result<std::string>::Success(record.value().metadata);
}

Status UploadStore::setUploadLength(
  const std::string& file_id, int64_t upload_length, const CancellationToken& cancel
) {
  STRATUS_LOG_SCOPED_FILE(file_id);

  auto loaded = load(file_id, cancel);
  if (!loaded) {
    return loaded.status();
  }
  UploadRecord record = std::move(loaded.value());

  if (record.lengthKnown()) {
    return Status::Failure(
      StoreErrorKind::INVALID_STATE,
      "upload length of " + file_id + " is already " + std::to_string(record.upload_length)
    );
  }
  if (upload_length < record.upload_offset) {
    return Status::Failure(
      StoreErrorKind::INVALID_ARGUMENT,
      "upload length " + std::to_string(upload_length) + " is below the offset " +
        std::to_string(record.upload_offset)
    );
  }

  record.upload_length = upload_length;
  Status persisted = state_store_.put(record, cancel);
  if (!persisted) {
    return persisted;
  }
  STRATUS_LOG_DEBUG("Upload length stored" << logging::kv("length", upload_length));

  if (record.isComplete()) {
    return coordinator_.finalize(record, cancel);
  }
  return Status::Success();
}

Status UploadStore::deleteUpload(const std::string& file_id, const CancellationToken& cancel) {
  STRATUS_LOG_SCOPED_FILE(file_id);

  auto record = load(file_id, cancel);
  if (record.is(StoreErrorKind::NOT_FOUND)) {
    STRATUS_LOG_WARN("Deletion of unknown upload ignored");
    return Status::Success();
  }
  if (record.is(StoreErrorKind::CORRUPT_STATE)) {
    // The handle is unknown; the orphan sweep aborts it
    STRATUS_LOG_WARN("Deleting upload with unreadable record");
    Status deleted = backend_->deleteObject(coordinator_.fileKey(file_id), cancel);
    if (!deleted) {
      return deleted;
    }
    return state_store_.remove(file_id, cancel);
  }
  if (!record) {
    return record.status();
  }

  Status terminated = coordinator_.terminate(record.value(), cancel);
  if (terminated) {
    STRATUS_LOG_DEBUG("Upload deleted");
  }
  return terminated;
}

Result<std::chrono::system_clock::time_point> UploadStore::expiration(
  const std::string& file_id, const CancellationToken& cancel
) {
  using ExpirationResult = Result<std::chrono::system_clock::time_point>;
  auto record = load(file_id, cancel);
  if (!record) {
    return ExpirationResult::Failure(record.error());
  }
  return ExpirationResult::Success(record.value().expires);
}

Status UploadStore::setExpiration(
  const std::string& file_id, std::chrono::system_clock::time_point expires,
  const CancellationToken& cancel
) {
  auto loaded = load(file_id, cancel);
  if (!loaded) {
    return loaded.status();
  }
  UploadRecord record = std::move(loaded.value());
  record.expires = expires;
  return state_store_.put(record, cancel);
}

Result<std::vector<std::string>> UploadStore::findExpired(const CancellationToken& cancel) {
  return reconciler_.findExpired(cancel);
}

Result<size_t> UploadStore::removeExpired(const CancellationToken& cancel) {
  return reconciler_.reconcile(cancel);
}

}  // namespace store
}  // namespace stratus
