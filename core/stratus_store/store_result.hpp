// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_STORE_RESULT_HPP
#define STRATUS_STORE_RESULT_HPP

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace stratus {
namespace store {

/**
 * Error kinds surfaced by the store
 */
enum class StoreErrorKind {
  NOT_FOUND,            // No state record (or backend object/handle) for the id
  ALREADY_EXISTS,       // A record already exists for the FileId
  CLIENT_OVERRUN,       // Incoming bytes would exceed the declared upload length
  CANCELLED,            // Cooperative cancellation observed
  BACKEND_UNAVAILABLE,  // Transient backend or network fault
  BACKEND_ERROR,        // Any other backend fault
  CORRUPT_STATE,        // Persisted record failed to parse or violates its invariants
  INVALID_STATE,        // Operation not valid for the upload's current state
  INVALID_ARGUMENT      // Caller supplied an out-of-range value
};

inline const char* storeErrorKindToString(StoreErrorKind kind) {
  switch (kind) {
    case StoreErrorKind::NOT_FOUND:
      return "not_found";
    case StoreErrorKind::ALREADY_EXISTS:
      return "already_exists";
    case StoreErrorKind::CLIENT_OVERRUN:
      return "client_overrun";
    case StoreErrorKind::CANCELLED:
      return "cancelled";
    case StoreErrorKind::BACKEND_UNAVAILABLE:
      return "backend_unavailable";
    case StoreErrorKind::BACKEND_ERROR:
      return "backend_error";
    case StoreErrorKind::CORRUPT_STATE:
      return "corrupt_state";
    case StoreErrorKind::INVALID_STATE:
      return "invalid_state";
    case StoreErrorKind::INVALID_ARGUMENT:
      return "invalid_argument";
    default:
      return "unknown";
  }
}

inline std::ostream& operator<<(std::ostream& os, StoreErrorKind kind) {
  return os << storeErrorKindToString(kind);
}

/**
 * Error value carried by failed results
 */
struct StoreError {
  StoreErrorKind kind = StoreErrorKind::BACKEND_ERROR;
  std::string message;
  std::string code;  // Backend error code when the error came from the object store

  StoreError() = default;
  StoreError(StoreErrorKind k, std::string msg, std::string c = "")
      : kind(k)
      , message(std::move(msg))
      , code(std::move(c)) {}
};

inline std::ostream& operator<<(std::ostream& os, const StoreError& error) {
  os << error.kind << ": " << error.message;
  if (!error.code.empty()) {
    os << " (code: " << error.code << ")";
  }
  return os;
}

/**
 * Outcome of an operation that produces no value
 */
class Status {
public:
  static Status Success() {
    return Status();
  }

  static Status Failure(StoreError error) {
    Status status;
    status.error_ = std::move(error);
    return status;
  }

  static Status Failure(StoreErrorKind kind, std::string message, std::string code = "") {
    return Failure(StoreError(kind, std::move(message), std::move(code)));
  }

  bool ok() const {
    return !error_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  /**
   * True if this is a failure of the given kind
   */
  bool is(StoreErrorKind kind) const {
    return error_.has_value() && error_->kind == kind;
  }

  /**
   * Error of a failed status. Must not be called on success.
   */
  const StoreError& error() const {
    return *error_;
  }

private:
  std::optional<StoreError> error_;
};

/**
 * Outcome of an operation producing a T on success
 */
template<typename T>
class Result {
public:
  static Result Success(T value) {
    Result result;
    result.value_ = std::move(value);
    return result;
  }

  static Result Failure(StoreError error) {
    Result result;
    result.error_ = std::move(error);
    return result;
  }

  static Result Failure(StoreErrorKind kind, std::string message, std::string code = "") {
    return Failure(StoreError(kind, std::move(message), std::move(code)));
  }

  bool ok() const {
    return value_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  bool is(StoreErrorKind kind) const {
    return !ok() && error_.kind == kind;
  }

  const T& value() const& {
    return *value_;
  }

  T& value() & {
    return *value_;
  }

  T&& value() && {
    return std::move(*value_);
  }

  const StoreError& error() const {
    return error_;
  }

  /**
   * Drop the value, keeping only success or the error
   */
  Status status() const {
    return ok() ? Status::Success() : Status::Failure(error_);
  }

private:
  std::optional<T> value_;
  StoreError error_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_STORE_RESULT_HPP
