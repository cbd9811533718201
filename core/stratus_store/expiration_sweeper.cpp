// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "expiration_sweeper.hpp"

#define STRATUS_LOG_COMPONENT "sweeper"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

ExpirationSweeper::ExpirationSweeper(UploadStore& store)
    : ExpirationSweeper(
        store, std::chrono::duration_cast<std::chrono::milliseconds>(store.config().sweep_interval)
      ) {}

ExpirationSweeper::ExpirationSweeper(UploadStore& store, std::chrono::milliseconds interval)
    : store_(store)
    , interval_(interval) {}

ExpirationSweeper::~ExpirationSweeper() {
  stop();
}

void ExpirationSweeper::start() {
  if (running_.exchange(true)) {
    return;  // Already running
  }

  CancellationToken token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
    cancel_source_ = CancellationSource();
    token = cancel_source_.token();
  }
  worker_ = std::thread(&ExpirationSweeper::workerLoop, this, token);
  STRATUS_LOG_INFO("Expiration sweeper started" << logging::kv("interval_ms", interval_.count()));
}

void ExpirationSweeper::stop() {
  if (!running_.exchange(false)) {
    return;  // Already stopped
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    cancel_source_.cancel();
  }
  cv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
  STRATUS_LOG_INFO("Expiration sweeper stopped");
}

bool ExpirationSweeper::isRunning() const {
  return running_.load();
}

Result<size_t> ExpirationSweeper::runOnce(const CancellationToken& cancel) {
  STRATUS_LOG_DEBUG("Running expiration sweep");
  auto removed = store_.removeExpired(cancel);
  if (!removed) {
    if (removed.is(StoreErrorKind::CANCELLED)) {
      STRATUS_LOG_DEBUG("Expiration sweep cancelled");
    } else {
      STRATUS_LOG_WARN("Expiration sweep failed" << logging::kv("error", removed.error().message));
    }
    stats_.passes_failed++;
    return removed;
  }

  stats_.passes_completed++;
  stats_.uploads_removed += removed.value();
  STRATUS_LOG_INFO(
    "Expired uploads removed" << logging::kv("count", removed.value())
                              << logging::kv("next_run_ms", interval_.count())
  );
  return removed;
}

void ExpirationSweeper::workerLoop(CancellationToken cancel) {
  while (true) {
    auto result = runOnce(cancel);
    (void)result;  // Logged and counted by runOnce()

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, interval_, [this] {
      return stop_requested_;
    });
    if (stop_requested_) {
      break;
    }
  }
}

}  // namespace store
}  // namespace stratus
