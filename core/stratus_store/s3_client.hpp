// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_S3_CLIENT_HPP
#define STRATUS_S3_CLIENT_HPP

#include <memory>
#include <string>

#include "object_backend.hpp"
#include "store_config.hpp"

namespace stratus {
namespace store {

/**
 * Object backend on top of the AWS SDK for C++
 *
 * Works against AWS S3 and S3-compatible storage (MinIO, Ceph RGW). Custom
 * endpoints are addressed path-style. Credentials not set in the configuration are
 * read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY.
 *
 * Cancellation tokens are polled by the SDK's HTTP layer while a request is in
 * flight, so a cancelled token interrupts long part uploads as well.
 *
 * Thread-safe: the underlying SDK client is shared by all calls.
 */
class S3Client : public IObjectBackend {
public:
  /**
   * Create S3 client with configuration
   *
   * @param config S3 configuration (endpoint, bucket, credentials, etc.)
   */
  explicit S3Client(const S3Config& config);
  ~S3Client() override;

  // Non-copyable, non-movable
  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;
  S3Client(S3Client&&) = delete;
  S3Client& operator=(S3Client&&) = delete;

  Status putObject(
    const std::string& key, const std::string& body, const std::string& content_type,
    const std::map<std::string, std::string>& metadata, const CancellationToken& cancel
  ) override;

  Result<std::string> getObject(const std::string& key, const CancellationToken& cancel) override;

  Result<std::string> getObjectRange(
    const std::string& key, uint64_t offset, uint64_t length, const CancellationToken& cancel
  ) override;

  Result<ObjectHead> headObject(const std::string& key, const CancellationToken& cancel) override;

  Status deleteObject(const std::string& key, const CancellationToken& cancel) override;

  Result<ObjectListingPage> listObjects(
    const std::string& prefix, const std::string& continuation_token,
    const CancellationToken& cancel
  ) override;

  Result<std::string> createMultipartUpload(
    const std::string& key, const std::map<std::string, std::string>& metadata,
    const CancellationToken& cancel
  ) override;

  Result<std::string> uploadPart(
    const std::string& key, const std::string& upload_id, int part_number,
    const std::string& data, const CancellationToken& cancel
  ) override;

  Status completeMultipartUpload(
    const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts,
    const CancellationToken& cancel
  ) override;

  Status abortMultipartUpload(
    const std::string& key, const std::string& upload_id, const CancellationToken& cancel
  ) override;

  Result<MultipartListingPage> listMultipartUploads(
    const std::string& prefix, const std::string& key_marker, const std::string& upload_id_marker,
    const CancellationToken& cancel
  ) override;

  /**
   * Check if an error code denotes a transient fault
   *
   * @param error_code S3 error code or SDK exception name
   * @return true for throttling, timeouts, service and networking errors
   */
  static bool isTransientError(const std::string& error_code);

  /**
   * Get the bucket name
   */
  const std::string& bucket() const;

  /**
   * Get the endpoint URL
   */
  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_S3_CLIENT_HPP
