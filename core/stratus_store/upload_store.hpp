// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_UPLOAD_STORE_HPP
#define STRATUS_UPLOAD_STORE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "byte_source.hpp"
#include "cancellation.hpp"
#include "expiration_reconciler.hpp"
#include "file_id_provider.hpp"
#include "file_reader.hpp"
#include "ingestion_pipeline.hpp"
#include "multipart_coordinator.hpp"
#include "object_backend.hpp"
#include "store_config.hpp"
#include "store_result.hpp"
#include "upload_state_store.hpp"

namespace stratus {
namespace store {

/**
 * Resumable-upload store over S3 multipart uploads
 *
 * Entry point for protocol engines. Uploads are created with a declared or
 * deferred length, filled by successive appends and assembled into
 * file_prefix + file_id once every byte arrived. Per-upload state lives in
 * state_prefix + file_id.
 *
 * All methods are synchronous and may be called from any thread. Calls for the
 * same FileId must be serialized by the caller.
 */
class UploadStore {
public:
  /**
   * Create a store talking to S3 as configured in config.s3
   *
   * @throws std::invalid_argument on invalid store settings
   */
  explicit UploadStore(const StoreConfig& config);

  /**
   * Create a store on an injected backend
   *
   * @param id_provider FileId strategy; random UUIDs when null
   * @throws std::invalid_argument on invalid store settings or a null backend
   */
  UploadStore(
    const StoreConfig& config, std::shared_ptr<IObjectBackend> backend,
    std::shared_ptr<FileIdProvider> id_provider = nullptr
  );

  ~UploadStore();

  // Non-copyable, non-movable
  UploadStore(const UploadStore&) = delete;
  UploadStore& operator=(const UploadStore&) = delete;
  UploadStore(UploadStore&&) = delete;
  UploadStore& operator=(UploadStore&&) = delete;

  // ---------------------------------------------------------------------------
  // Core
  // ---------------------------------------------------------------------------

  /**
   * Check whether an upload exists
   */
  Result<bool> exists(const std::string& file_id, const CancellationToken& cancel = {});

  /**
   * Create an upload
   *
   * Opens the multipart upload, then persists the record with
   * expires = now + default_expiration.
   *
   * @param upload_length Declared size in bytes, or kDeferredLength
   * @param metadata Opaque client metadata
   * @return The new FileId
   */
  Result<std::string> createUpload(
    int64_t upload_length, const std::string& metadata, const CancellationToken& cancel = {}
  );

  /**
   * Append the contents of a pull stream at the current offset
   */
  Result<AppendResult> appendFromStream(
    const std::string& file_id, ByteSource& source, const CancellationToken& cancel = {}
  );

  /**
   * Append the contents of a push reader at the current offset
   */
  Result<AppendResult> appendFromReader(
    const std::string& file_id, ChunkReader& reader, const CancellationToken& cancel = {}
  );

  /**
   * Declared size, kDeferredLength while deferred
   */
  Result<int64_t> uploadLength(const std::string& file_id, const CancellationToken& cancel = {});

  /**
   * Bytes committed so far
   */
  Result<int64_t> uploadOffset(const std::string& file_id, const CancellationToken& cancel = {});

  /**
   * Opaque metadata given at creation
   */
  Result<std::string> uploadMetadata(
    const std::string& file_id, const CancellationToken& cancel = {}
  );

  // ---------------------------------------------------------------------------
  // Deferred length
  // ---------------------------------------------------------------------------

  /**
   * Declare the size of a deferred-length upload
   *
   * If every declared byte already arrived, the upload is finalized right away.
   *
   * @return INVALID_STATE if the length is already known, INVALID_ARGUMENT if
   *         upload_length is below the current offset
   */
  Status setUploadLength(
    const std::string& file_id, int64_t upload_length, const CancellationToken& cancel = {}
  );

  // ---------------------------------------------------------------------------
  // Termination
  // ---------------------------------------------------------------------------

  /**
   * Remove an upload: abort the multipart upload, delete the assembled object and
   * the record. Deleting an unknown FileId succeeds.
   */
  Status deleteUpload(const std::string& file_id, const CancellationToken& cancel = {});

  // ---------------------------------------------------------------------------
  // Expiration
  // ---------------------------------------------------------------------------

  Result<std::chrono::system_clock::time_point> expiration(
    const std::string& file_id, const CancellationToken& cancel = {}
  );

  Status setExpiration(
    const std::string& file_id, std::chrono::system_clock::time_point expires,
    const CancellationToken& cancel = {}
  );

  /**
   * FileIds of expired incomplete uploads
   */
  Result<std::vector<std::string>> findExpired(const CancellationToken& cancel = {});

  /**
   * Purge expired uploads and orphaned multipart uploads
   *
   * @return Number of expired uploads removed
   */
  Result<size_t> removeExpired(const CancellationToken& cancel = {});

  // ---------------------------------------------------------------------------
  // Read projection
  // ---------------------------------------------------------------------------

  /**
   * Read access to uploads (content and decoded metadata)
   */
  const FileReader& openFile() const {
    return reader_;
  }

  const StoreConfig& config() const {
    return config_;
  }

private:
  Result<UploadRecord> load(const std::string& file_id, const CancellationToken& cancel);

  StoreConfig config_;
  std::shared_ptr<IObjectBackend> backend_;
  std::shared_ptr<FileIdProvider> id_provider_;

  UploadStateStore state_store_;
  MultipartUploadCoordinator coordinator_;
  IngestionPipeline pipeline_;
  ExpirationReconciler reconciler_;
  FileReader reader_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_UPLOAD_STORE_HPP
