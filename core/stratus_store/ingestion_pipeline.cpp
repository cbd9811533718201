// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ingestion_pipeline.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#define STRATUS_LOG_COMPONENT "ingestion"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

/**
 * Source of part-sized slices over either input style
 */
class SliceProducer {
public:
  struct Slice {
    std::string data;
    bool end_of_input = false;  // No bytes follow this slice
    bool cancelled = false;     // The input observed cancellation; stop after this slice
  };

  virtual ~SliceProducer() = default;

  /**
   * Read up to max_size bytes. An empty slice ends the input.
   */
  virtual Result<Slice> next(size_t max_size, const CancellationToken& cancel) = 0;

  virtual void release() = 0;
};

namespace {

// Upper bound of a single read from a pull stream
constexpr size_t kStreamReadSize = 1024 * 1024;

class StreamSliceProducer : public SliceProducer {
public:
  explicit StreamSliceProducer(ByteSource& source)
      : source_(source) {}

  Result<Slice> next(size_t max_size, const CancellationToken& cancel) override {
    Slice slice;
    std::vector<char> buffer(std::min(max_size, kStreamReadSize));

    // Short reads keep filling the slice; only a zero-byte read ends the input
    while (slice.data.size() < max_size) {
      size_t wanted = std::min(buffer.size(), max_size - slice.data.size());
      auto n = source_.read(buffer.data(), wanted, cancel);
      if (!n) {
        if (n.is(StoreErrorKind::CANCELLED)) {
          slice.cancelled = true;
          break;
        }
        return Result<Slice>::Failure(n.error());
      }
      if (n.value() == 0) {
        slice.end_of_input = true;
        break;
      }
      slice.data.append(buffer.data(), n.value());
    }
    return Result<Slice>::Success(std::move(slice));
  }

  void release() override {
    source_.close();
  }

private:
  ByteSource& source_;
};

class ReaderSliceProducer : public SliceProducer {
public:
  explicit ReaderSliceProducer(ChunkReader& reader)
      : reader_(reader) {}

  Result<Slice> next(size_t max_size, const CancellationToken& cancel) override {
    Slice slice;
    auto view = reader_.readAtLeast(max_size, cancel);
    if (!view) {
      if (view.is(StoreErrorKind::CANCELLED)) {
        slice.cancelled = true;
        return Result<Slice>::Success(std::move(slice));
      }
      return Result<Slice>::Failure(view.error());
    }

    const ChunkView& chunk = view.value();
    size_t taken = std::min(chunk.size, max_size);
    if (taken > 0) {
      slice.data.assign(chunk.data, taken);
    }
    reader_.advance(taken);

    slice.end_of_input = chunk.completed && taken == chunk.size;
    slice.cancelled = chunk.cancelled;
    return Result<Slice>::Success(std::move(slice));
  }

  void release() override {
    reader_.complete();
  }

private:
  ChunkReader& reader_;
};

// Releases the input when the drain loop exits, whichever way it exits
class ReleaseGuard {
public:
  explicit ReleaseGuard(SliceProducer& producer)
      : producer_(producer) {}

  ~ReleaseGuard() {
    producer_.release();
  }

  ReleaseGuard(const ReleaseGuard&) = delete;
  ReleaseGuard& operator=(const ReleaseGuard&) = delete;

private:
  SliceProducer& producer_;
};

// Bytes to request for the next slice. When the rest of a known length fits in
// one part, one byte more is requested so an overrun is seen before the last part
// is committed.
size_t sliceRequest(const UploadRecord& record, int64_t part_size) {
  if (!record.lengthKnown()) {
    return static_cast<size_t>(part_size);
  }
  const int64_t remaining = record.upload_length - record.upload_offset;
  if (remaining <= part_size) {
    return static_cast<size_t>(remaining + 1);
  }
  return static_cast<size_t>(part_size);
}

Result<AppendResult> overrun(const UploadRecord& record, int64_t incoming) {
  STRATUS_LOG_WARN(
    "Request exceeds upload length" << logging::kv("offset", record.upload_offset)
                                    << logging::kv("incoming", incoming)
                                    << logging::kv("length", record.upload_length)
  );
  return Result<AppendResult>::Failure(
    StoreErrorKind::CLIENT_OVERRUN,
    "request contains more data than the upload length: " +
      std::to_string(record.upload_offset + incoming) + " > " + std::to_string(record.upload_length)
  );
}

Result<AppendResult> cancelledAppend(int64_t bytes_accepted) {
  AppendResult result;
  result.bytes_accepted = bytes_accepted;
  result.cancelled = true;
  return Result<AppendResult>::Success(result);
}

}  // namespace

IngestionPipeline::IngestionPipeline(
  UploadStateStore& state_store, MultipartUploadCoordinator& coordinator,
  const PartSizeLimits& limits
)
    : state_store_(state_store)
    , coordinator_(coordinator)
    , limits_(limits) {}

Result<AppendResult> IngestionPipeline::appendFromStream(
  const std::string& file_id, ByteSource& source, const CancellationToken& cancel
) {
  StreamSliceProducer producer(source);
  return drain(file_id, producer, cancel);
}

Result<AppendResult> IngestionPipeline::appendFromReader(
  const std::string& file_id, ChunkReader& reader, const CancellationToken& cancel
) {
  ReaderSliceProducer producer(reader);
  return drain(file_id, producer, cancel);
}

Result<AppendResult> IngestionPipeline::drain(
  const std::string& file_id, SliceProducer& producer, const CancellationToken& cancel
) {
  STRATUS_LOG_SCOPED_FILE(file_id);
  ReleaseGuard guard(producer);

  auto loaded = state_store_.get(file_id, cancel);
  if (!loaded) {
    if (loaded.is(StoreErrorKind::CANCELLED)) {
      return cancelledAppend(0);
    }
    return Result<AppendResult>::Failure(loaded.error());
  }
  UploadRecord record = std::move(loaded.value());

  if (record.isComplete()) {
    STRATUS_LOG_DEBUG("Upload length reached, finalizing");
    Status finalized = coordinator_.finalize(record, cancel);
    if (finalized.is(StoreErrorKind::CANCELLED)) {
      return cancelledAppend(0);
    }
    if (!finalized) {
      return Result<AppendResult>::Failure(finalized.error());
    }

    // Nothing more is accepted; any byte left in the input is an overrun
    auto trailing = producer.next(1, cancel);
    if (!trailing) {
      return Result<AppendResult>::Failure(trailing.error());
    }
    if (!trailing.value().data.empty()) {
      return overrun(record, static_cast<int64_t>(trailing.value().data.size()));
    }
    if (trailing.value().cancelled) {
      return cancelledAppend(0);
    }
    return Result<AppendResult>::Success(AppendResult{});
  }

  const int64_t part_size = planPartSize(record.upload_length, limits_);
  AppendResult result;

  while (true) {
    if (cancel.isCancellationRequested()) {
      result.cancelled = true;
      break;
    }

    auto next = producer.next(sliceRequest(record, part_size), cancel);
    if (!next) {
      return Result<AppendResult>::Failure(next.error());
    }
    const SliceProducer::Slice& slice = next.value();
    const auto slice_size = static_cast<int64_t>(slice.data.size());

    if (slice_size > 0) {
      if (record.lengthKnown() && record.upload_offset + slice_size > record.upload_length) {
        return overrun(record, slice_size);
      }

      // The slice was taken from the input; commit it regardless of cancellation
      auto part = coordinator_.uploadPart(record, slice.data, CancellationToken());
      if (!part) {
        return Result<AppendResult>::Failure(part.error());
      }
      result.bytes_accepted += slice_size;

      if (record.isComplete()) {
        Status finalized = coordinator_.finalize(record, cancel);
        if (finalized.is(StoreErrorKind::CANCELLED)) {
          result.cancelled = true;
          break;
        }
        if (!finalized) {
          return Result<AppendResult>::Failure(finalized.error());
        }
      }
    }

    if (slice.cancelled) {
      result.cancelled = true;
      break;
    }
    if (slice_size == 0 || slice.end_of_input) {
      break;
    }
  }

  if (result.cancelled) {
    STRATUS_LOG_WARN("Append cancelled" << logging::kv("accepted", result.bytes_accepted));
  } else {
    STRATUS_LOG_DEBUG(
      "Append done" << logging::kv("accepted", result.bytes_accepted)
                    << logging::kv("offset", record.upload_offset)
    );
  }
  return Result<AppendResult>::Success(result);
}

}  // namespace store
}  // namespace stratus
