// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_reader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "store_config.hpp"

#define STRATUS_LOG_COMPONENT "file_reader"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

namespace {

/**
 * Streams an object through consecutive ranged reads
 */
class ObjectContentSource : public ByteSource {
public:
  ObjectContentSource(IObjectBackend& backend, std::string key, uint64_t length, uint64_t chunk_size)
      : backend_(backend)
      , key_(std::move(key))
      , length_(length)
      , chunk_size_(chunk_size) {}

  Result<size_t> read(char* buffer, size_t size, const CancellationToken& cancel) override {
    if (size == 0) {
      return Result<size_t>::Success(0);
    }

    if (chunk_position_ >= chunk_.size()) {
      if (fetched_ >= length_) {
        return Result<size_t>::Success(0);
      }
      uint64_t wanted = std::min(chunk_size_, length_ - fetched_);
      auto range = backend_.getObjectRange(key_, fetched_, wanted, cancel);
      if (!range) {
        return Result<size_t>::Failure(range.error());
      }
      if (range.value().empty()) {
        return Result<size_t>::Failure(
          StoreErrorKind::BACKEND_ERROR,
          key_ + " ended at " + std::to_string(fetched_) + " of " + std::to_string(length_) + " bytes"
        );
      }
      chunk_ = std::move(range.value());
      chunk_position_ = 0;
      fetched_ += chunk_.size();
    }

    size_t n = std::min(size, chunk_.size() - chunk_position_);
    std::memcpy(buffer, chunk_.data() + chunk_position_, n);
    chunk_position_ += n;
    return Result<size_t>::Success(n);
  }

  void close() override {
    chunk_.clear();
    chunk_position_ = 0;
    fetched_ = length_;
  }

private:
  IObjectBackend& backend_;
  std::string key_;
  uint64_t length_;
  uint64_t chunk_size_;

  std::string chunk_;
  size_t chunk_position_ = 0;
  uint64_t fetched_ = 0;
};

}  // namespace

FileReader::FileReader(
  UploadStateStore& state_store, IObjectBackend& backend, std::string file_prefix,
  uint64_t chunk_size
)
    : state_store_(state_store)
    , backend_(backend)
    , file_prefix_(normalizePrefix(file_prefix))
    , chunk_size_(chunk_size) {}

Result<bool> FileReader::exists(const std::string& file_id, const CancellationToken& cancel) const {
  return state_store_.exists(file_id, cancel);
}

Result<ObjectHead> FileReader::headAssembled(
  const std::string& file_id, const CancellationToken& cancel
) const {
  auto record = state_store_.get(file_id, cancel);
  if (!record) {
    return Result<ObjectHead>::Failure(record.error());
  }

  auto head = backend_.headObject(file_prefix_ + file_id, cancel);
  if (head.is(StoreErrorKind::NOT_FOUND) && !record.value().isComplete()) {
    return Result<ObjectHead>::Failure(
      StoreErrorKind::INVALID_STATE, "upload " + file_id + " is not complete"
    );
  }
  return head;
}

Result<std::unique_ptr<ByteSource>> FileReader::openContent(
  const std::string& file_id, const CancellationToken& cancel
) const {
  auto head = headAssembled(file_id, cancel);
  if (!head) {
    return Result<std::unique_ptr<ByteSource>>::Failure(head.error());
  }

  STRATUS_LOG_DEBUG(
    "Opening content" << logging::kv("file_id", file_id)
                      << logging::kv("size", head.value().content_length)
  );
  std::unique_ptr<ByteSource> source = std::make_unique<ObjectContentSource>(
    backend_, file_prefix_ + file_id, head.value().content_length, chunk_size_
  );
  return Result<std::unique_ptr<ByteSource>>::Success(std::move(source));
}

Result<std::map<std::string, std::string>> FileReader::metadata(
  const std::string& file_id, const MetadataCodec& codec, const CancellationToken& cancel
) const {
  auto record = state_store_.get(file_id, cancel);
  if (!record) {
    return Result<std::map<std::string, std::string>>::Failure(record.error());
  }
  return codec.decode(record.value().metadata);
}

Result<uint64_t> FileReader::contentLength(
  const std::string& file_id, const CancellationToken& cancel
) const {
  auto head = headAssembled(file_id, cancel);
  if (!head) {
    return Result<uint64_t>::Failure(head.error());
  }
  return Result<uint64_t>::Success(head.value().content_length);
}

Result<UploadRecord> FileReader::uploadRecord(
  const std::string& file_id, const CancellationToken& cancel
) const {
  return state_store_.get(file_id, cancel);
}

}  // namespace store
}  // namespace stratus
