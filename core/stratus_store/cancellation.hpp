// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_CANCELLATION_HPP
#define STRATUS_CANCELLATION_HPP

#include <atomic>
#include <memory>
#include <utility>

namespace stratus {
namespace store {

/**
 * Read side of a cooperative cancellation flag.
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy and
 * share the flag of the CancellationSource that issued them.
 */
class CancellationToken {
public:
  CancellationToken() = default;

  bool isCancellationRequested() const {
    return state_ && state_->load(std::memory_order_acquire);
  }

private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<const std::atomic<bool>> state_;
};

/**
 * Owner of a cancellation flag
 *
 * Thread-safe: cancel() may be called from any thread while tokens are polled.
 */
class CancellationSource {
public:
  CancellationSource()
      : state_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() {
    state_->store(true, std::memory_order_release);
  }

  bool isCancellationRequested() const {
    return state_->load(std::memory_order_acquire);
  }

  CancellationToken token() const {
    return CancellationToken(state_);
  }

private:
  std::shared_ptr<std::atomic<bool>> state_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_CANCELLATION_HPP
