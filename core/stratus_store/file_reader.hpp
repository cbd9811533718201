// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_FILE_READER_HPP
#define STRATUS_FILE_READER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "byte_source.hpp"
#include "cancellation.hpp"
#include "object_backend.hpp"
#include "store_result.hpp"
#include "upload_record.hpp"
#include "upload_state_store.hpp"

namespace stratus {
namespace store {

/**
 * Decoder of the opaque metadata blob stored with an upload
 *
 * The store never interprets metadata; the protocol layer supplies its codec.
 */
class MetadataCodec {
public:
  virtual ~MetadataCodec() = default;

  /**
   * @return Decoded key/value pairs, or INVALID_ARGUMENT for malformed input
   */
  virtual Result<std::map<std::string, std::string>> decode(const std::string& metadata) const = 0;
};

/**
 * Read-only view of uploads: existence, assembled content, decoded metadata
 */
class FileReader {
public:
  /**
   * @param chunk_size Bytes fetched per ranged read when streaming content
   */
  FileReader(
    UploadStateStore& state_store, IObjectBackend& backend, std::string file_prefix,
    uint64_t chunk_size
  );

  // Non-copyable, non-movable
  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;
  FileReader(FileReader&&) = delete;
  FileReader& operator=(FileReader&&) = delete;

  /**
   * Check whether an upload record exists for file_id
   */
  Result<bool> exists(const std::string& file_id, const CancellationToken& cancel = {}) const;

  /**
   * Open the assembled object as a stream
   *
   * Content is fetched lazily with ranged reads of at most chunk_size bytes. Every
   * call returns an independent source.
   *
   * @return NOT_FOUND without a record, INVALID_STATE while the upload is
   *         incomplete
   */
  Result<std::unique_ptr<ByteSource>> openContent(
    const std::string& file_id, const CancellationToken& cancel = {}
  ) const;

  /**
   * Decode the upload's metadata blob with codec
   */
  Result<std::map<std::string, std::string>> metadata(
    const std::string& file_id, const MetadataCodec& codec, const CancellationToken& cancel = {}
  ) const;

  /**
   * Size of the assembled object
   */
  Result<uint64_t> contentLength(
    const std::string& file_id, const CancellationToken& cancel = {}
  ) const;

  /**
   * Persisted state of the upload
   */
  Result<UploadRecord> uploadRecord(
    const std::string& file_id, const CancellationToken& cancel = {}
  ) const;

private:
  Result<ObjectHead> headAssembled(const std::string& file_id, const CancellationToken& cancel) const;

  UploadStateStore& state_store_;
  IObjectBackend& backend_;
  std::string file_prefix_;
  uint64_t chunk_size_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_FILE_READER_HPP
