// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListMultipartUploadsRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <chrono>
#include <cstdlib>
#include <iterator>
#include <mutex>
#include <set>

#include "s3_client_test_helpers.hpp"

#define STRATUS_LOG_COMPONENT "s3_client"
#include <stratus_log_macros.hpp>

namespace stratus {
namespace store {

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// The AWS SDK requires InitAPI/ShutdownAPI to be called exactly once per process.
// We use a reference-counted singleton to manage this lifecycle.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      // SDK logging is off; failures are reported through store results
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Error mapping
// =============================================================================

StoreError classifyS3ErrorImpl(
  const std::string& exception_name, int http_status, bool sdk_retryable, bool cancelled,
  const std::string& message
) {
  std::string text = message;
  if (text.empty()) {
    text = exception_name.empty() ? "HTTP " + std::to_string(http_status) : exception_name;
  }

  if (cancelled) {
    return StoreError(StoreErrorKind::CANCELLED, "request cancelled: " + text, exception_name);
  }

  // A missing bucket is a configuration fault, not an absent object
  if (exception_name == "NoSuchBucket") {
    return StoreError(StoreErrorKind::BACKEND_ERROR, text, exception_name);
  }

  if (exception_name == "NoSuchUpload" || exception_name == "NoSuchKey" ||
      exception_name == "NotFound" || exception_name == "ResourceNotFound" ||
      http_status == 404) {
    return StoreError(StoreErrorKind::NOT_FOUND, text, exception_name);
  }

  if (S3Client::isTransientError(exception_name) || sdk_retryable || http_status <= 0 ||
      http_status == 429 || http_status >= 500) {
    return StoreError(StoreErrorKind::BACKEND_UNAVAILABLE, text, exception_name);
  }

  return StoreError(StoreErrorKind::BACKEND_ERROR, text, exception_name);
}

std::string unquoteETagImpl(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

std::string formatByteRangeImpl(uint64_t offset, uint64_t length) {
  return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
}

namespace {

template<typename Outcome>
StoreError toStoreError(const Outcome& outcome, const CancellationToken& cancel) {
  const auto& error = outcome.GetError();
  return classifyS3ErrorImpl(
    error.GetExceptionName(),
    static_cast<int>(error.GetResponseCode()),
    error.ShouldRetry(),
    cancel.isCancellationRequested(),
    error.GetMessage()
  );
}

// The HTTP client polls the handler between transfer chunks and aborts the
// request once it returns false.
template<typename Request>
void bindCancellation(Request& request, const CancellationToken& cancel) {
  request.SetContinueRequestHandler([cancel](const Aws::Http::HttpRequest*) {
    return !cancel.isCancellationRequested();
  });
}

StoreError cancelledBeforeRequest(const std::string& operation, const std::string& key) {
  return StoreError(StoreErrorKind::CANCELLED, operation + " cancelled: " + key);
}

Aws::Map<Aws::String, Aws::String> toAwsMetadata(const std::map<std::string, std::string>& metadata) {
  Aws::Map<Aws::String, Aws::String> aws_metadata;
  for (const auto& [key, value] : metadata) {
    aws_metadata[key] = value;
  }
  return aws_metadata;
}

std::shared_ptr<Aws::IOStream> makeBody(const std::string& data) {
  auto body = Aws::MakeShared<Aws::StringStream>("StratusS3Body");
  body->write(data.data(), static_cast<std::streamsize>(data.size()));
  return body;
}

}  // namespace

// =============================================================================
// S3Client Implementation
// =============================================================================

class S3Client::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // The SDK client must be destroyed before release(), which may invoke
    // Aws::ShutdownAPI() when the reference count reaches zero.
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    // The endpoint should NOT include the bucket name
    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;

    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "StratusS3Retry", static_cast<long>(config.max_sdk_retries)
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Custom endpoints (MinIO, etc.) need path-style addressing; AWS S3 uses
    // virtual-hosted style
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3Client::S3Client(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  // Load credentials from environment if not provided
  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  STRATUS_LOG_DEBUG(
    "S3 client ready" << logging::kv("bucket", impl_->config.bucket)
                      << logging::kv("endpoint", impl_->config.endpoint_url)
  );
}

S3Client::~S3Client() = default;

Status S3Client::putObject(
  const std::string& key, const std::string& body, const std::string& content_type,
  const std::map<std::string, std::string>& metadata, const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Status::Failure(cancelledBeforeRequest("PutObject", key));
  }

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetContentType(content_type);
  request.SetContentLength(static_cast<long long>(body.size()));
  request.SetBody(makeBody(body));
  if (!metadata.empty()) {
    request.SetMetadata(toAwsMetadata(metadata));
  }
  bindCancellation(request, cancel);

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return Status::Failure(toStoreError(outcome, cancel));
  }
  return Status::Success();
}

Result<std::string> S3Client::getObject(const std::string& key, const CancellationToken& cancel) {
  if (cancel.isCancellationRequested()) {
    return Result<std::string>::Failure(cancelledBeforeRequest("GetObject", key));
  }

  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  bindCancellation(request, cancel);

  auto outcome = impl_->client->GetObject(request);
  if (!outcome.IsSuccess()) {
    return Result<std::string>::Failure(toStoreError(outcome, cancel));
  }

  Aws::S3::Model::GetObjectResult result = outcome.GetResultWithOwnership();
  auto& stream = result.GetBody();
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  return Result<std::string>::Success(std::move(content));
}

Result<std::string> S3Client::getObjectRange(
  const std::string& key, uint64_t offset, uint64_t length, const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Result<std::string>::Failure(cancelledBeforeRequest("GetObject", key));
  }
  if (length == 0) {
    return Result<std::string>::Success(std::string());
  }

  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetRange(formatByteRangeImpl(offset, length));
  bindCancellation(request, cancel);

  auto outcome = impl_->client->GetObject(request);
  if (!outcome.IsSuccess()) {
    // 416: the range starts at or past the object end
    if (static_cast<int>(outcome.GetError().GetResponseCode()) == 416) {
      return Result<std::string>::Success(std::string());
    }
    return Result<std::string>::Failure(toStoreError(outcome, cancel));
  }

  Aws::S3::Model::GetObjectResult result = outcome.GetResultWithOwnership();
  auto& stream = result.GetBody();
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  return Result<std::string>::Success(std::move(content));
}

Result<ObjectHead> S3Client::headObject(const std::string& key, const CancellationToken& cancel) {
  if (cancel.isCancellationRequested()) {
    return Result<ObjectHead>::Failure(cancelledBeforeRequest("HeadObject", key));
  }

  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  bindCancellation(request, cancel);

  auto outcome = impl_->client->HeadObject(request);
  if (!outcome.IsSuccess()) {
    return Result<ObjectHead>::Failure(toStoreError(outcome, cancel));
  }

  const auto& head_result = outcome.GetResult();
  ObjectHead head;
  head.content_length = static_cast<uint64_t>(head_result.GetContentLength());
  head.etag = unquoteETagImpl(head_result.GetETag());
  for (const auto& [meta_key, value] : head_result.GetMetadata()) {
    head.metadata[meta_key] = value;
  }
  return Result<ObjectHead>::Success(std::move(head));
}

Status S3Client::deleteObject(const std::string& key, const CancellationToken& cancel) {
  if (cancel.isCancellationRequested()) {
    return Status::Failure(cancelledBeforeRequest("DeleteObject", key));
  }

  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  bindCancellation(request, cancel);

  auto outcome = impl_->client->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    StoreError error = toStoreError(outcome, cancel);
    // S3 itself answers 204 for absent keys; some compatible stores answer 404
    if (error.kind == StoreErrorKind::NOT_FOUND) {
      return Status::Success();
    }
    return Status::Failure(std::move(error));
  }
  return Status::Success();
}

Result<ObjectListingPage> S3Client::listObjects(
  const std::string& prefix, const std::string& continuation_token, const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Result<ObjectListingPage>::Failure(cancelledBeforeRequest("ListObjectsV2", prefix));
  }

  Aws::S3::Model::ListObjectsV2Request request;
  request.SetBucket(impl_->config.bucket);
  request.SetPrefix(prefix);
  request.SetDelimiter("/");
  if (!continuation_token.empty()) {
    request.SetContinuationToken(continuation_token);
  }
  bindCancellation(request, cancel);

  auto outcome = impl_->client->ListObjectsV2(request);
  if (!outcome.IsSuccess()) {
    return Result<ObjectListingPage>::Failure(toStoreError(outcome, cancel));
  }

  const auto& list_result = outcome.GetResult();
  ObjectListingPage page;
  for (const auto& object : list_result.GetContents()) {
    ObjectSummary summary;
    summary.key = object.GetKey();
    summary.size = static_cast<uint64_t>(object.GetSize());
    page.objects.push_back(std::move(summary));
  }
  page.truncated = list_result.GetIsTruncated();
  if (page.truncated) {
    page.next_continuation_token = list_result.GetNextContinuationToken();
  }
  return Result<ObjectListingPage>::Success(std::move(page));
}

Result<std::string> S3Client::createMultipartUpload(
  const std::string& key, const std::map<std::string, std::string>& metadata,
  const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Result<std::string>::Failure(cancelledBeforeRequest("CreateMultipartUpload", key));
  }

  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetContentType("application/octet-stream");
  if (!metadata.empty()) {
    request.SetMetadata(toAwsMetadata(metadata));
  }
  bindCancellation(request, cancel);

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return Result<std::string>::Failure(toStoreError(outcome, cancel));
  }

  std::string upload_id = outcome.GetResult().GetUploadId();
  STRATUS_LOG_DEBUG("Multipart upload created" << logging::kv("key", key)
                                               << logging::kv("upload_id", upload_id));
  return Result<std::string>::Success(std::move(upload_id));
}

Result<std::string> S3Client::uploadPart(
  const std::string& key, const std::string& upload_id, int part_number, const std::string& data,
  const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Result<std::string>::Failure(cancelledBeforeRequest("UploadPart", key));
  }

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(data.size()));
  request.SetBody(makeBody(data));
  bindCancellation(request, cancel);

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return Result<std::string>::Failure(toStoreError(outcome, cancel));
  }
  return Result<std::string>::Success(unquoteETagImpl(outcome.GetResult().GetETag()));
}

Status S3Client::completeMultipartUpload(
  const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts,
  const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Status::Failure(cancelledBeforeRequest("CompleteMultipartUpload", key));
  }

  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const auto& part : parts) {
    completed.AddParts(
      Aws::S3::Model::CompletedPart().WithPartNumber(part.number).WithETag(part.etag)
    );
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(completed);
  bindCancellation(request, cancel);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return Status::Failure(toStoreError(outcome, cancel));
  }
  return Status::Success();
}

Status S3Client::abortMultipartUpload(
  const std::string& key, const std::string& upload_id, const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Status::Failure(cancelledBeforeRequest("AbortMultipartUpload", key));
  }

  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  bindCancellation(request, cancel);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return Status::Failure(toStoreError(outcome, cancel));
  }
  return Status::Success();
}

Result<MultipartListingPage> S3Client::listMultipartUploads(
  const std::string& prefix, const std::string& key_marker, const std::string& upload_id_marker,
  const CancellationToken& cancel
) {
  if (cancel.isCancellationRequested()) {
    return Result<MultipartListingPage>::Failure(
      cancelledBeforeRequest("ListMultipartUploads", prefix)
    );
  }

  Aws::S3::Model::ListMultipartUploadsRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetPrefix(prefix);
  if (!key_marker.empty()) {
    request.SetKeyMarker(key_marker);
  }
  if (!upload_id_marker.empty()) {
    request.SetUploadIdMarker(upload_id_marker);
  }
  bindCancellation(request, cancel);

  auto outcome = impl_->client->ListMultipartUploads(request);
  if (!outcome.IsSuccess()) {
    return Result<MultipartListingPage>::Failure(toStoreError(outcome, cancel));
  }

  const auto& list_result = outcome.GetResult();
  MultipartListingPage page;
  for (const auto& upload : list_result.GetUploads()) {
    MultipartUploadSummary summary;
    summary.key = upload.GetKey();
    summary.upload_id = upload.GetUploadId();
    summary.initiated = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(upload.GetInitiated().Millis())
    );
    page.uploads.push_back(std::move(summary));
  }
  page.truncated = list_result.GetIsTruncated();
  if (page.truncated) {
    page.next_key_marker = list_result.GetNextKeyMarker();
    page.next_upload_id_marker = list_result.GetNextUploadIdMarker();
  }
  return Result<MultipartListingPage>::Success(std::move(page));
}

bool S3Client::isTransientError(const std::string& error_code) {
  static const std::set<std::string> transient = {// S3/HTTP errors
                                                  "RequestTimeout",
                                                  "ServiceUnavailable",
                                                  "InternalError",
                                                  "SlowDown",
                                                  "RequestTimeTooSkewed",
                                                  "OperationAborted",

                                                  // Network errors
                                                  "ConnectionReset",
                                                  "ConnectionTimeout",
                                                  "ConnectionRefused",
                                                  "NetworkingError",
                                                  "UnknownEndpoint",

                                                  // MinIO-specific
                                                  "XMinioServerNotInitialized",
                                                  "XAmzContentSHA256Mismatch",

                                                  // Generic
                                                  "Throttling",
                                                  "ThrottlingException",
                                                  "ProvisionedThroughputExceededException",
                                                  "TransientError"};
  return transient.count(error_code) > 0;
}

const std::string& S3Client::bucket() const {
  return impl_->config.bucket;
}

const std::string& S3Client::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace store
}  // namespace stratus
