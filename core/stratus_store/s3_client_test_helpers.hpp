// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_S3_CLIENT_TEST_HELPERS_HPP
#define STRATUS_S3_CLIENT_TEST_HELPERS_HPP

// This header is for testing only - exposes internal implementations
// so error mapping can be tested without a live endpoint

#include <cstdint>
#include <string>

#include "store_result.hpp"

namespace stratus {
namespace store {

// Defined in s3_client.cpp

/**
 * Map a failed SDK outcome to a store error
 *
 * @param exception_name SDK exception name (S3 error code)
 * @param http_status HTTP response code, 0 when no response was received
 * @param sdk_retryable The SDK's own retryability verdict
 * @param cancelled Whether the caller's token was cancelled
 * @param message SDK error message
 * @return Classified error; code carries exception_name
 */
StoreError classifyS3ErrorImpl(
  const std::string& exception_name, int http_status, bool sdk_retryable, bool cancelled,
  const std::string& message
);

/**
 * Strip the quotes S3 puts around ETag values
 */
std::string unquoteETagImpl(const std::string& etag);

/**
 * Build an HTTP Range header value for [offset, offset + length)
 */
std::string formatByteRangeImpl(uint64_t offset, uint64_t length);

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_S3_CLIENT_TEST_HELPERS_HPP
