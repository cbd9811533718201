// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_STORE_MOCKS_HPP
#define STRATUS_STORE_MOCKS_HPP

#include <gmock/gmock.h>

#include <map>
#include <string>
#include <vector>

#include "file_id_provider.hpp"
#include "object_backend.hpp"

namespace stratus {
namespace store {
namespace test {

using MetadataMap = std::map<std::string, std::string>;

/**
 * Mock implementation of IObjectBackend for testing
 */
class MockObjectBackend : public IObjectBackend {
public:
  MOCK_METHOD(
    Status, putObject,
    (const std::string& key, const std::string& body, const std::string& content_type,
     const MetadataMap& metadata, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Result<std::string>, getObject, (const std::string& key, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Result<std::string>, getObjectRange,
    (const std::string& key, uint64_t offset, uint64_t length, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Result<ObjectHead>, headObject, (const std::string& key, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Status, deleteObject, (const std::string& key, const CancellationToken& cancel), (override)
  );
  MOCK_METHOD(
    Result<ObjectListingPage>, listObjects,
    (const std::string& prefix, const std::string& continuation_token,
     const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Result<std::string>, createMultipartUpload,
    (const std::string& key, const MetadataMap& metadata, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Result<std::string>, uploadPart,
    (const std::string& key, const std::string& upload_id, int part_number,
     const std::string& data, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Status, completeMultipartUpload,
    (const std::string& key, const std::string& upload_id,
     const std::vector<CompletedPart>& parts, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Status, abortMultipartUpload,
    (const std::string& key, const std::string& upload_id, const CancellationToken& cancel),
    (override)
  );
  MOCK_METHOD(
    Result<MultipartListingPage>, listMultipartUploads,
    (const std::string& prefix, const std::string& key_marker,
     const std::string& upload_id_marker, const CancellationToken& cancel),
    (override)
  );
};

/**
 * Mock implementation of FileIdProvider for testing
 */
class MockFileIdProvider : public FileIdProvider {
public:
  MOCK_METHOD(std::string, createId, (const std::string& metadata), (override));
  MOCK_METHOD(bool, validateId, (const std::string& file_id), (const, override));
};

}  // namespace test
}  // namespace store
}  // namespace stratus

#endif  // STRATUS_STORE_MOCKS_HPP
