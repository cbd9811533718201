// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for MultipartUploadCoordinator
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "in_memory_object_backend.hpp"
#include "multipart_coordinator.hpp"
#include "store_mocks.hpp"
#include "test_helpers.hpp"
#include "upload_state_store.hpp"

using namespace stratus::store;
using namespace stratus::store::test;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::Return;

class MultipartCoordinatorTest : public ::testing::Test {
protected:
  /**
   * Open an upload and persist its record, as UploadStore::createUpload does
   */
  UploadRecord startUpload(
    const std::string& file_id, int64_t length, const std::string& metadata = ""
  ) {
    auto upload_id = coordinator_.initiate(file_id, metadata);
    EXPECT_TRUE(upload_id.ok());
    auto record = makeRecord(file_id, upload_id.value(), length);
    record.metadata = metadata;
    EXPECT_TRUE(state_.create(record).ok());
    return record;
  }

  InMemoryObjectBackend backend_;
  UploadStateStore state_{backend_, "upload-info/"};
  MultipartUploadCoordinator coordinator_{backend_, state_, "files"};
};

// =============================================================================
// Initiate
// =============================================================================

TEST_F(MultipartCoordinatorTest, FileKeyUsesNormalizedPrefix) {
  EXPECT_EQ(coordinator_.prefix(), "files/");
  EXPECT_EQ(coordinator_.fileKey("abc"), "files/abc");
}

TEST_F(MultipartCoordinatorTest, InitiateOpensUpload) {
  auto upload_id = coordinator_.initiate("f1", "");
  ASSERT_TRUE(upload_id.ok());
  EXPECT_TRUE(backend_.hasUpload(upload_id.value()));
}

TEST_F(MultipartCoordinatorTest, InitiateAttachesMetadata) {
  MockObjectBackend mock;
  UploadStateStore state(mock, "upload-info/");
  MultipartUploadCoordinator coordinator(mock, state, "files/");

  EXPECT_CALL(mock, createMultipartUpload("files/f1", MetadataMap{{"upload-metadata", "k=v"}}, _))
    .WillOnce(Return(Result<std::string>::Success("u1")));
  EXPECT_CALL(mock, createMultipartUpload("files/f2", MetadataMap(), _))
    .WillOnce(Return(Result<std::string>::Success("u2")));

  EXPECT_EQ(coordinator.initiate("f1", "k=v").value(), "u1");
  EXPECT_EQ(coordinator.initiate("f2", "").value(), "u2");
}

TEST_F(MultipartCoordinatorTest, InitiatePropagatesFailure) {
  backend_.failNext(
    "createMultipartUpload", StoreError(StoreErrorKind::BACKEND_UNAVAILABLE, "throttled")
  );
  EXPECT_TRUE(coordinator_.initiate("f1", "").is(StoreErrorKind::BACKEND_UNAVAILABLE));
}

// =============================================================================
// Upload parts
// =============================================================================

TEST_F(MultipartCoordinatorTest, UploadPartCommitsAndPersists) {
  auto record = startUpload("f1", 30);

  auto part = coordinator_.uploadPart(record, "0123456789");
  ASSERT_TRUE(part.ok()) << part.error();
  EXPECT_EQ(part.value().number, 1);
  EXPECT_EQ(part.value().size_in_bytes, 10);
  EXPECT_FALSE(part.value().etag.empty());

  EXPECT_EQ(record.upload_offset, 10);
  ASSERT_EQ(record.parts.size(), 1u);

  auto stored = state_.get("f1");
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(stored.value().upload_offset, 10);
  ASSERT_EQ(stored.value().parts.size(), 1u);
  EXPECT_EQ(stored.value().parts[0].etag, part.value().etag);
}

TEST_F(MultipartCoordinatorTest, PartNumbersAreSequential) {
  auto record = startUpload("f1", 30);
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());
  auto third = coordinator_.uploadPart(record, makePayload(10));
  ASSERT_TRUE(third.ok());
  EXPECT_EQ(third.value().number, 3);
  EXPECT_EQ(backend_.partCount(record.upload_id), 3u);
}

TEST_F(MultipartCoordinatorTest, UploadPartRejectsEmptyData) {
  auto record = startUpload("f1", 30);
  EXPECT_TRUE(coordinator_.uploadPart(record, "").is(StoreErrorKind::INVALID_ARGUMENT));
  EXPECT_EQ(backend_.callCount("uploadPart"), 0);
}

TEST_F(MultipartCoordinatorTest, UploadPartFailureLeavesRecordUntouched) {
  auto record = startUpload("f1", 30);
  backend_.failNext("uploadPart", StoreError(StoreErrorKind::BACKEND_UNAVAILABLE, "reset"));

  auto part = coordinator_.uploadPart(record, makePayload(10));
  EXPECT_TRUE(part.is(StoreErrorKind::BACKEND_UNAVAILABLE));
  EXPECT_EQ(record.upload_offset, 0);
  EXPECT_TRUE(record.parts.empty());
}

TEST_F(MultipartCoordinatorTest, RecordWriteFailureLeavesRecordUntouched) {
  auto record = startUpload("f1", 30);
  backend_.failNext("putObject", StoreError(StoreErrorKind::BACKEND_ERROR, "denied"));

  auto part = coordinator_.uploadPart(record, makePayload(10));
  EXPECT_TRUE(part.is(StoreErrorKind::BACKEND_ERROR));
  EXPECT_EQ(record.upload_offset, 0);
  EXPECT_EQ(state_.get("f1").value().upload_offset, 0);

  // A retry reuses the part number and replaces the unreferenced part
  auto retried = coordinator_.uploadPart(record, makePayload(10));
  ASSERT_TRUE(retried.ok());
  EXPECT_EQ(retried.value().number, 1);
  EXPECT_EQ(backend_.partCount(record.upload_id), 1u);
}

TEST_F(MultipartCoordinatorTest, UploadPartOnVanishedUploadIsNotFound) {
  auto record = startUpload("f1", 30);
  ASSERT_TRUE(backend_.abortMultipartUpload("files/f1", record.upload_id, {}).ok());

  auto part = coordinator_.uploadPart(record, makePayload(10));
  ASSERT_TRUE(part.is(StoreErrorKind::NOT_FOUND));
  EXPECT_EQ(part.error().code, "NoSuchUpload");
}

// =============================================================================
// Finalize
// =============================================================================

TEST_F(MultipartCoordinatorTest, FinalizeAssemblesObject) {
  auto record = startUpload("f1", 25, "name=a");
  ASSERT_TRUE(coordinator_.uploadPart(record, "0123456789").ok());
  ASSERT_TRUE(coordinator_.uploadPart(record, "abcdefghij").ok());
  ASSERT_TRUE(coordinator_.uploadPart(record, "KLMNO").ok());

  ASSERT_TRUE(coordinator_.finalize(record).ok());
  auto object = backend_.object("files/f1");
  ASSERT_TRUE(object.has_value());
  EXPECT_EQ(object->body, "0123456789abcdefghijKLMNO");
  EXPECT_EQ(object->metadata.at(kUploadMetadataKey), "name=a");
  EXPECT_FALSE(backend_.hasUpload(record.upload_id));
}

TEST_F(MultipartCoordinatorTest, FinalizeSubmitsPartsInOrder) {
  MockObjectBackend mock;
  UploadStateStore state(mock, "upload-info/");
  MultipartUploadCoordinator coordinator(mock, state, "files/");

  auto record = makeRecord("f1", "u1", 30);
  record.parts = {{2, 10, "e2"}, {1, 10, "e1"}, {3, 10, "e3"}};
  record.upload_offset = 30;

  EXPECT_CALL(
    mock, completeMultipartUpload(
            "files/f1", "u1",
            ElementsAre(
              Field(&CompletedPart::number, 1), Field(&CompletedPart::number, 2),
              Field(&CompletedPart::number, 3)
            ),
            _
          )
  )
    .WillOnce(Return(Status::Success()));
  EXPECT_TRUE(coordinator.finalize(record).ok());
}

TEST_F(MultipartCoordinatorTest, FinalizeIncompleteIsInvalidState) {
  auto record = startUpload("f1", 30);
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());
  EXPECT_TRUE(coordinator_.finalize(record).is(StoreErrorKind::INVALID_STATE));

  auto deferred = startUpload("f2", kDeferredLength);
  EXPECT_TRUE(coordinator_.finalize(deferred).is(StoreErrorKind::INVALID_STATE));
}

TEST_F(MultipartCoordinatorTest, FinalizeIsIdempotent) {
  auto record = startUpload("f1", 10);
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());
  ASSERT_TRUE(coordinator_.finalize(record).ok());
  EXPECT_TRUE(coordinator_.finalize(record).ok());
  EXPECT_EQ(backend_.object("files/f1")->body, makePayload(10));
}

TEST_F(MultipartCoordinatorTest, FinalizeAbortedUploadIsNotFound) {
  auto record = startUpload("f1", 10);
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());
  ASSERT_TRUE(coordinator_.abort("f1", record.upload_id).ok());
  EXPECT_TRUE(coordinator_.finalize(record).is(StoreErrorKind::NOT_FOUND));
}

TEST_F(MultipartCoordinatorTest, FinalizeEmptyUploadWritesEmptyObject) {
  auto record = startUpload("f1", 0, "name=empty");
  ASSERT_TRUE(coordinator_.finalize(record).ok());

  auto object = backend_.object("files/f1");
  ASSERT_TRUE(object.has_value());
  EXPECT_TRUE(object->body.empty());
  EXPECT_EQ(object->metadata.at(kUploadMetadataKey), "name=empty");
  EXPECT_FALSE(backend_.hasUpload(record.upload_id));
  EXPECT_EQ(backend_.callCount("completeMultipartUpload"), 0);
}

TEST_F(MultipartCoordinatorTest, FinalizeEmptyToleratesAbortFailure) {
  auto record = startUpload("f1", 0);
  backend_.failNext("abortMultipartUpload", StoreError(StoreErrorKind::BACKEND_ERROR, "denied"));
  EXPECT_TRUE(coordinator_.finalize(record).ok());
  EXPECT_TRUE(backend_.hasObject("files/f1"));
}

TEST_F(MultipartCoordinatorTest, FinalizePropagatesBackendError) {
  auto record = startUpload("f1", 10);
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());
  backend_.failNext(
    "completeMultipartUpload", StoreError(StoreErrorKind::BACKEND_UNAVAILABLE, "internal")
  );
  EXPECT_TRUE(coordinator_.finalize(record).is(StoreErrorKind::BACKEND_UNAVAILABLE));
  EXPECT_TRUE(backend_.hasUpload(record.upload_id));
}

// =============================================================================
// Abort / terminate
// =============================================================================

TEST_F(MultipartCoordinatorTest, AbortUnknownUploadSucceeds) {
  EXPECT_TRUE(coordinator_.abort("f1", "no-such-upload").ok());
}

TEST_F(MultipartCoordinatorTest, TerminateRemovesEverything) {
  auto record = startUpload("f1", 20);
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());

  ASSERT_TRUE(coordinator_.terminate(record).ok());
  EXPECT_FALSE(backend_.hasUpload(record.upload_id));
  EXPECT_FALSE(state_.exists("f1").value());
}

TEST_F(MultipartCoordinatorTest, TerminateFinalizedUploadDeletesObject) {
  auto record = startUpload("f1", 10);
  ASSERT_TRUE(coordinator_.uploadPart(record, makePayload(10)).ok());
  ASSERT_TRUE(coordinator_.finalize(record).ok());

  ASSERT_TRUE(coordinator_.terminate(record).ok());
  EXPECT_FALSE(backend_.hasObject("files/f1"));
  EXPECT_FALSE(state_.exists("f1").value());
}

TEST_F(MultipartCoordinatorTest, TerminateContinuesAfterAbortFailure) {
  auto record = startUpload("f1", 20);
  backend_.failNext("abortMultipartUpload", StoreError(StoreErrorKind::BACKEND_ERROR, "denied"));

  ASSERT_TRUE(coordinator_.terminate(record).ok());
  EXPECT_FALSE(state_.exists("f1").value());
  // The handle is left for the orphan sweep
  EXPECT_TRUE(backend_.hasUpload(record.upload_id));
}

TEST_F(MultipartCoordinatorTest, TerminateKeepsRecordWhenObjectDeleteFails) {
  auto record = startUpload("f1", 20);
  backend_.failNext("deleteObject", StoreError(StoreErrorKind::BACKEND_UNAVAILABLE, "timeout"));

  EXPECT_TRUE(coordinator_.terminate(record).is(StoreErrorKind::BACKEND_UNAVAILABLE));
  EXPECT_TRUE(state_.exists("f1").value());
}

TEST_F(MultipartCoordinatorTest, TerminateStopsOnCancellation) {
  auto record = startUpload("f1", 20);
  CancellationSource source;
  source.cancel();

  EXPECT_TRUE(coordinator_.terminate(record, source.token()).is(StoreErrorKind::CANCELLED));
  EXPECT_TRUE(backend_.hasUpload(record.upload_id));
  EXPECT_TRUE(state_.exists("f1").value());
  EXPECT_EQ(backend_.callCount("deleteObject"), 0);
}

// =============================================================================
// Incomplete upload listing
// =============================================================================

TEST_F(MultipartCoordinatorTest, ListIncompleteUploadsAcrossPages) {
  backend_.setPageSize(2);
  auto now = std::chrono::system_clock::now();
  std::vector<std::string> expected;
  for (const char* id : {"a", "b", "c", "d", "e"}) {
    expected.push_back(backend_.createRawUpload(std::string("files/") + id, now));
  }
  backend_.createRawUpload("elsewhere/x", now);

  auto cursor = coordinator_.listIncompleteUploads();
  std::vector<std::string> seen;
  while (true) {
    auto next = cursor.next();
    ASSERT_TRUE(next.ok()) << next.error();
    if (!next.value()) {
      break;
    }
    seen.push_back(next.value()->upload_id);
  }
  EXPECT_EQ(seen, expected);
  EXPECT_EQ(backend_.callCount("listMultipartUploads"), 3);
}

TEST_F(MultipartCoordinatorTest, ListIncompleteUploadsHonoursCancellation) {
  backend_.createRawUpload("files/a", std::chrono::system_clock::now());
  CancellationSource source;
  source.cancel();

  auto cursor = coordinator_.listIncompleteUploads();
  EXPECT_TRUE(cursor.next(source.token()).is(StoreErrorKind::CANCELLED));
  EXPECT_EQ(backend_.callCount("listMultipartUploads"), 0);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
