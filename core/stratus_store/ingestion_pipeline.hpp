// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_INGESTION_PIPELINE_HPP
#define STRATUS_INGESTION_PIPELINE_HPP

#include <cstdint>
#include <string>

#include "byte_source.hpp"
#include "cancellation.hpp"
#include "multipart_coordinator.hpp"
#include "part_size_planner.hpp"
#include "store_result.hpp"
#include "upload_state_store.hpp"

namespace stratus {
namespace store {

/**
 * Outcome of one append call
 */
struct AppendResult {
  int64_t bytes_accepted = 0;  // Bytes committed by this call
  bool cancelled = false;      // The call stopped early on cancellation
};

class SliceProducer;

/**
 * Drains client input into multipart parts
 *
 * Input is sliced into parts of the planned size and committed one part at a
 * time; each commit persists the upload record before the next slice is read. The
 * upload is finalized as soon as its offset reaches the declared length.
 *
 * A slice that would carry the offset past a known length fails the call with
 * CLIENT_OVERRUN and is not committed. Once the rest of the length fits into one
 * part, one extra byte is read ahead, so an overrun is caught before the final
 * part; larger overruns keep the full parts committed before the overflowing
 * slice. Appending to a complete upload finalizes it and fails with
 * CLIENT_OVERRUN if the input still holds data. That check reads up to one byte
 * of input; a complete upload otherwise consumes nothing and accepts 0 bytes.
 *
 * Cancellation is checked before every slice and passed to the input while
 * reading. Bytes already read when cancellation is observed are still committed,
 * with a token that cannot be cancelled, so no part is left half-committed. The
 * call then returns with AppendResult::cancelled set; cancellation is never
 * reported as an error.
 *
 * The input is released (ByteSource::close(), ChunkReader::complete()) on every
 * exit path.
 */
class IngestionPipeline {
public:
  IngestionPipeline(
    UploadStateStore& state_store, MultipartUploadCoordinator& coordinator,
    const PartSizeLimits& limits
  );

  // Non-copyable, non-movable
  IngestionPipeline(const IngestionPipeline&) = delete;
  IngestionPipeline& operator=(const IngestionPipeline&) = delete;
  IngestionPipeline(IngestionPipeline&&) = delete;
  IngestionPipeline& operator=(IngestionPipeline&&) = delete;

  /**
   * Append the contents of a pull stream
   *
   * @return Bytes accepted, or NOT_FOUND / CLIENT_OVERRUN / backend errors
   */
  Result<AppendResult> appendFromStream(
    const std::string& file_id, ByteSource& source, const CancellationToken& cancel = {}
  );

  /**
   * Append the contents of a push reader
   */
  Result<AppendResult> appendFromReader(
    const std::string& file_id, ChunkReader& reader, const CancellationToken& cancel = {}
  );

private:
  Result<AppendResult> drain(
    const std::string& file_id, SliceProducer& producer, const CancellationToken& cancel
  );

  UploadStateStore& state_store_;
  MultipartUploadCoordinator& coordinator_;
  PartSizeLimits limits_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_INGESTION_PIPELINE_HPP
