// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_EXPIRATION_SWEEPER_HPP
#define STRATUS_EXPIRATION_SWEEPER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "cancellation.hpp"
#include "store_result.hpp"
#include "upload_store.hpp"

namespace stratus {
namespace store {

/**
 * Sweep statistics
 */
struct SweeperStats {
  std::atomic<uint64_t> passes_completed{0};
  std::atomic<uint64_t> passes_failed{0};
  std::atomic<uint64_t> uploads_removed{0};
};

/**
 * Background thread purging expired uploads
 *
 * Runs UploadStore::removeExpired() once right after start() and then every
 * interval. A failed pass is logged and retried at the next interval. stop()
 * cancels the pass in flight and joins the thread.
 */
class ExpirationSweeper {
public:
  /**
   * Sweep every config().sweep_interval
   */
  explicit ExpirationSweeper(UploadStore& store);

  ExpirationSweeper(UploadStore& store, std::chrono::milliseconds interval);

  ~ExpirationSweeper();

  // Non-copyable, non-movable
  ExpirationSweeper(const ExpirationSweeper&) = delete;
  ExpirationSweeper& operator=(const ExpirationSweeper&) = delete;
  ExpirationSweeper(ExpirationSweeper&&) = delete;
  ExpirationSweeper& operator=(ExpirationSweeper&&) = delete;

  /**
   * Start the sweep thread. No-op if already running.
   */
  void start();

  /**
   * Stop the sweep thread and wait for it. No-op if not running.
   */
  void stop();

  bool isRunning() const;

  /**
   * Run one pass on the calling thread
   *
   * @return Number of expired uploads removed
   */
  Result<size_t> runOnce(const CancellationToken& cancel = {});

  const SweeperStats& stats() const {
    return stats_;
  }

  std::chrono::milliseconds interval() const {
    return interval_;
  }

private:
  void workerLoop(CancellationToken cancel);

  UploadStore& store_;
  std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  CancellationSource cancel_source_;
  std::thread worker_;

  SweeperStats stats_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_EXPIRATION_SWEEPER_HPP
