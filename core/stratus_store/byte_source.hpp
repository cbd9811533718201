// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_BYTE_SOURCE_HPP
#define STRATUS_BYTE_SOURCE_HPP

#include <cstddef>

#include "cancellation.hpp"
#include "store_result.hpp"

namespace stratus {
namespace store {

/**
 * Pull-style byte stream
 *
 * Reads may return fewer bytes than requested; a read of 0 bytes marks the end of
 * input. Implementations that observe cancellation while blocked return
 * CANCELLED.
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;

  /**
   * Read up to size bytes into buffer
   *
   * @return Number of bytes read, 0 at end of input
   */
  virtual Result<size_t> read(char* buffer, size_t size, const CancellationToken& cancel) = 0;

  /**
   * Release the underlying input. Called once the consumer is done, on every
   * exit path. Must not fail.
   */
  virtual void close() {}
};

/**
 * Buffered bytes handed out by a ChunkReader
 */
struct ChunkView {
  const char* data = nullptr;
  size_t size = 0;
  bool completed = false;  // No more bytes will follow this view
  bool cancelled = false;  // The producer cancelled the pending read
};

/**
 * Push-style reader over a producer-owned buffer
 *
 * readAtLeast() exposes buffered bytes without copying; advance() tells the reader
 * how many of them were consumed, the rest is returned again by the next read.
 */
class ChunkReader {
public:
  virtual ~ChunkReader() = default;

  /**
   * Wait until at least minimum bytes are buffered or the input completed
   *
   * The view stays valid until the next advance().
   */
  virtual Result<ChunkView> readAtLeast(size_t minimum, const CancellationToken& cancel) = 0;

  /**
   * Consume the first consumed bytes of the last view
   */
  virtual void advance(size_t consumed) = 0;

  /**
   * Signal that no further reads will be made. Must not fail.
   */
  virtual void complete() = 0;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_BYTE_SOURCE_HPP
