#include "store/gcs_object_store_client.hpp"
#include "store/gcs_sdk_interface.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <utility>
#include <string>
#include <vector>

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using objfs::GCSObjectStoreClient;
using objfs::IGCSSDKClient;
using objfs::IObjectStoreClient;
using objfs::Status;
using objfs::StatusCode;
using objfs::StatusOr;

// Mock the raw GCS SDK interface
class MockGCSSDKClient : public IGCSSDKClient {
public:
    MOCK_METHOD(
        (StatusOr<gcs::ObjectMetadata>),
        InsertObject,
        (const std::string& bucket_name, const std::string& object_name, const std::string& contents),
        (const, override)
    );

    MOCK_METHOD(
        gcs::ObjectWriteStream,
        WriteObject,
        (const std::string& bucket_name, const std::string& object_name, std::uint64_t content_length),
        (const, override)
    );

    MOCK_METHOD(
        (StatusOr<gcs::ObjectMetadata>),
        GetObjectMetadata,
        (const std::string& bucket_name, const std::string& object_name),
        (const, override)
    );

    MOCK_METHOD(
        IGCSSDKClient::ReadRangeResult,
        ReadObjectRange,
        (const std::string& bucket_name, const std::string& object_name, std::int64_t begin, std::int64_t end),
        (const, override)
    );

    MOCK_METHOD(
        Status,
        DeleteObject,
        (const std::string& bucket_name, const std::string& object_name),
        (const, override)
    );

    MOCK_METHOD(
        Status,
        ListObjectsAndPrefixes,
        (const IGCSSDKClient::ListRequest& request, const IGCSSDKClient::ListConsumer& consumer),
        (const, override)
    );

    MOCK_METHOD(
        (StatusOr<gcs::ObjectMetadata>),
        RewriteObject,
        (const std::string& source_bucket, const std::string& source_object,
         const std::string& destination_bucket, const std::string& destination_object),
        (const, override)
    );

    MOCK_METHOD(
        (StatusOr<gcs::ObjectMetadata>),
        PatchObject,
        (const std::string& bucket_name, const std::string& object_name, const gcs::ObjectMetadataPatch& patch),
        (const, override)
    );

    MOCK_METHOD(
        (StatusOr<gcs::ObjectMetadata>),
        ComposeObject,
        (const std::string& bucket_name, const std::vector<std::string>& sources, const std::string& destination),
        (const, override)
    );
};

class GCSObjectStoreClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto mock = std::make_unique<NiceMock<MockGCSSDKClient>>();
        sdk = mock.get();
        client = std::make_unique<GCSObjectStoreClient>(std::move(mock));
    }

    static gcs::ObjectMetadata object(const std::string& name, std::uint64_t size = 0) {
        return gcs::ObjectMetadata{}.set_name(name).set_size(size);
    }

    // Feeds items to the consumer the way the SDK reader yields them
    static auto serve(std::vector<gcs::ObjectOrPrefix> items, Status final_status = Status()) {
        return [items, final_status](const IGCSSDKClient::ListRequest&,
                                     const IGCSSDKClient::ListConsumer& consumer) {
            for (const auto& item : items) {
                if (!consumer(item)) {
                    return Status();
                }
            }
            return final_status;
        };
    }

    static IGCSSDKClient::ListRequest listRequest(const std::string& prefix, const std::string& delimiter,
                                                  const std::string& start_offset, int max_results) {
        IGCSSDKClient::ListRequest request;
        request.bucket_name = "bucket";
        request.prefix = prefix;
        request.delimiter = delimiter;
        request.start_offset = start_offset;
        request.max_results = max_results;
        return request;
    }

    static IObjectStoreClient::ListObjectsRequest listObjects(const std::string& prefix, int max_results,
                                                              const std::string& token = "") {
        IObjectStoreClient::ListObjectsRequest request;
        request.bucket_name = "bucket";
        request.prefix = prefix;
        request.delimiter = "/";
        request.max_results = max_results;
        request.continuation_token = token;
        return request;
    }

    static IObjectStoreClient::CompleteMultipartUploadRequest completeRequest(const std::string& upload_id,
                                                                              int parts) {
        IObjectStoreClient::CompleteMultipartUploadRequest request;
        request.bucket_name = "bucket";
        request.object_name = "big.bin";
        request.upload_id = upload_id;
        for (int n = 1; n <= parts; ++n) {
            request.parts.push_back(IObjectStoreClient::CompletedPart{n, "etag"});
        }
        return request;
    }

    MockGCSSDKClient* sdk = nullptr;
    std::unique_ptr<GCSObjectStoreClient> client;
};

// ==================== Listing ====================

TEST_F(GCSObjectStoreClientTest, ListObjectsMapsObjectsAndPrefixes) {
    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(listRequest("dir/", "/", "", 10), _))
        .WillOnce(Invoke(serve({object("dir/a.txt", 3), std::string("dir/sub/")})));

    auto response = client->ListObjects(listObjects("dir/", 10));
    ASSERT_TRUE(response.ok());
    ASSERT_EQ(1u, response->objects.size());
    EXPECT_EQ("dir/a.txt", response->objects[0].key);
    EXPECT_EQ(3, response->objects[0].size);
    EXPECT_EQ((std::vector<std::string>{"dir/sub/"}), response->common_prefixes);
    EXPECT_FALSE(response->truncated);
}

TEST_F(GCSObjectStoreClientTest, TruncatedPageContinuesFromFirstUnreturnedName) {
    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(listRequest("dir/", "/", "", 2), _))
        .WillOnce(Invoke(serve({object("dir/a"), object("dir/b"), object("dir/c")})));
    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(listRequest("dir/", "/", "dir/c", 2), _))
        .WillOnce(Invoke(serve({object("dir/c")})));

    auto first = client->ListObjects(listObjects("dir/", 2));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(2u, first->objects.size());
    EXPECT_TRUE(first->truncated);
    EXPECT_EQ("dir/c", first->next_continuation_token);

    auto second = client->ListObjects(listObjects("dir/", 2, first->next_continuation_token));
    ASSERT_TRUE(second.ok());
    ASSERT_EQ(1u, second->objects.size());
    EXPECT_EQ("dir/c", second->objects[0].key);
    EXPECT_FALSE(second->truncated);
}

TEST_F(GCSObjectStoreClientTest, PrefixRepeatedAcrossServicePagesIsReportedOnce) {
    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(_, _))
        .WillOnce(Invoke(serve({std::string("dir/p/"), std::string("dir/p/"), object("dir/q")})));

    auto response = client->ListObjects(listObjects("dir/", 2));
    ASSERT_TRUE(response.ok());
    EXPECT_EQ((std::vector<std::string>{"dir/p/"}), response->common_prefixes);
    ASSERT_EQ(1u, response->objects.size());
    EXPECT_EQ("dir/q", response->objects[0].key);
    EXPECT_FALSE(response->truncated);
}

TEST_F(GCSObjectStoreClientTest, ListingErrorSurfaces) {
    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(_, _))
        .WillOnce(Invoke(serve({object("dir/a")}, Status(StatusCode::kUnavailable, "try again"))));

    auto response = client->ListObjects(listObjects("dir/", 10));
    EXPECT_EQ(StatusCode::kUnavailable, response.status().code());
}

// ==================== Delete ====================

TEST_F(GCSObjectStoreClientTest, DeleteObjectsOmitsMissingAndRejectedKeys) {
    EXPECT_CALL(*sdk, DeleteObject("bucket", "a")).WillOnce(Return(Status()));
    EXPECT_CALL(*sdk, DeleteObject("bucket", "b")).WillOnce(Return(Status(StatusCode::kNotFound, "gone")));
    EXPECT_CALL(*sdk, DeleteObject("bucket", "c"))
        .WillOnce(Return(Status(StatusCode::kPermissionDenied, "denied")));
    EXPECT_CALL(*sdk, DeleteObject("bucket", "d")).WillOnce(Return(Status()));

    auto deleted = client->DeleteObjects(IObjectStoreClient::DeleteObjectsRequest{"bucket", {"a", "b", "c", "d"}});
    ASSERT_TRUE(deleted.ok());
    EXPECT_EQ((std::vector<std::string>{"a", "d"}), *deleted);
}

TEST_F(GCSObjectStoreClientTest, DeleteObjectsStopsOnTransientFailure) {
    EXPECT_CALL(*sdk, DeleteObject("bucket", "a")).WillOnce(Return(Status()));
    EXPECT_CALL(*sdk, DeleteObject("bucket", "b"))
        .WillOnce(Return(Status(StatusCode::kUnavailable, "try again")));
    EXPECT_CALL(*sdk, DeleteObject("bucket", "c")).Times(0);

    auto deleted = client->DeleteObjects(IObjectStoreClient::DeleteObjectsRequest{"bucket", {"a", "b", "c"}});
    EXPECT_EQ(StatusCode::kUnavailable, deleted.status().code());
}

TEST_F(GCSObjectStoreClientTest, DeleteObjectsRejectsOversizedBatch) {
    EXPECT_CALL(*sdk, DeleteObject(_, _)).Times(0);
    std::vector<std::string> keys(client->MaxDeleteBatchSize() + 1, "k");
    auto deleted = client->DeleteObjects(IObjectStoreClient::DeleteObjectsRequest{"bucket", keys});
    EXPECT_EQ(StatusCode::kInvalidArgument, deleted.status().code());
}

TEST_F(GCSObjectStoreClientTest, DeleteOfMissingObjectSucceeds) {
    EXPECT_CALL(*sdk, DeleteObject("bucket", "gone")).WillOnce(Return(Status(StatusCode::kNotFound, "gone")));
    EXPECT_TRUE(client->DeleteObject(IObjectStoreClient::DeleteObjectRequest{"bucket", "gone"}).ok());
}

// ==================== Reads ====================

TEST_F(GCSObjectStoreClientTest, InterruptedReadReturnsReceivedBytes) {
    EXPECT_CALL(*sdk, ReadObjectRange("bucket", "file", 0, 10))
        .WillOnce(Return(IGCSSDKClient::ReadRangeResult{"abc", Status(StatusCode::kUnavailable, "reset")}));

    auto content = client->ReadObjectRange(IObjectStoreClient::ReadObjectRangeRequest{"bucket", "file", 0, 10});
    ASSERT_TRUE(content.ok());
    EXPECT_EQ("abc", *content);
}

TEST_F(GCSObjectStoreClientTest, ReadWithNoBytesReturnsError) {
    EXPECT_CALL(*sdk, ReadObjectRange("bucket", "file", 0, 10))
        .WillOnce(Return(IGCSSDKClient::ReadRangeResult{"", Status(StatusCode::kNotFound, "missing")}));

    auto content = client->ReadObjectRange(IObjectStoreClient::ReadObjectRangeRequest{"bucket", "file", 0, 10});
    EXPECT_EQ(StatusCode::kNotFound, content.status().code());
}

// ==================== Multipart ====================

TEST_F(GCSObjectStoreClientTest, StagingObjectsLiveUnderReservedPrefix) {
    EXPECT_EQ(".objfs-multipart/", client->ReservedPrefix());
    EXPECT_EQ(".objfs-multipart/u1/", GCSObjectStoreClient::stagingPrefix("u1"));
    EXPECT_EQ(".objfs-multipart/u1/part-00007", GCSObjectStoreClient::partObjectName("u1", 7));

    EXPECT_CALL(*sdk, InsertObject("bucket", ".objfs-multipart/u1/part-00007", "data"))
        .WillOnce(Return(object(".objfs-multipart/u1/part-00007", 4)));
    IObjectStoreClient::UploadPartRequest part;
    part.bucket_name = "bucket";
    part.object_name = "big.bin";
    part.upload_id = "u1";
    part.part_number = 7;
    part.data = "data";
    EXPECT_TRUE(client->UploadPart(part).ok());
}

TEST_F(GCSObjectStoreClientTest, CompleteComposesInRoundsAndRemovesStagedParts) {
    const std::string staging = GCSObjectStoreClient::stagingPrefix("u1");
    std::vector<std::string> first_group;
    for (int n = 1; n <= 32; ++n) {
        first_group.push_back(GCSObjectStoreClient::partObjectName("u1", n));
    }

    // 33 parts: one intermediate of 32, the last part carried to the final round
    EXPECT_CALL(*sdk, ComposeObject("bucket", first_group, staging + "compose-0-0"))
        .WillOnce(Return(object(staging + "compose-0-0")));
    EXPECT_CALL(*sdk, ComposeObject("bucket",
                                    std::vector<std::string>{staging + "compose-0-0",
                                                             GCSObjectStoreClient::partObjectName("u1", 33)},
                                    "big.bin"))
        .WillOnce(Return(object("big.bin")));

    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(listRequest(staging, "", "", 0), _))
        .WillOnce(Invoke(serve({object(staging + "compose-0-0"), object(staging + "part-00001")})));
    EXPECT_CALL(*sdk, DeleteObject("bucket", staging + "compose-0-0")).WillOnce(Return(Status()));
    EXPECT_CALL(*sdk, DeleteObject("bucket", staging + "part-00001"))
        .WillOnce(Return(Status(StatusCode::kNotFound, "gone")));

    EXPECT_TRUE(client->CompleteMultipartUpload(completeRequest("u1", 33)).ok());
}

TEST_F(GCSObjectStoreClientTest, FailedComposeKeepsStagedParts) {
    EXPECT_CALL(*sdk, ComposeObject(_, _, _))
        .WillOnce(Return(Status(StatusCode::kPermissionDenied, "denied")));
    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(_, _)).Times(0);
    EXPECT_CALL(*sdk, DeleteObject(_, _)).Times(0);

    auto status = client->CompleteMultipartUpload(completeRequest("u1", 3));
    EXPECT_EQ(StatusCode::kPermissionDenied, status.code());
}

TEST_F(GCSObjectStoreClientTest, CompleteRejectsPartsOutOfOrder) {
    EXPECT_CALL(*sdk, ComposeObject(_, _, _)).Times(0);
    auto request = completeRequest("u1", 2);
    std::swap(request.parts[0], request.parts[1]);
    EXPECT_EQ(StatusCode::kInvalidArgument, client->CompleteMultipartUpload(request).code());
}

TEST_F(GCSObjectStoreClientTest, AbortReportsFailedStagedDelete) {
    const std::string staging = GCSObjectStoreClient::stagingPrefix("u2");
    EXPECT_CALL(*sdk, ListObjectsAndPrefixes(listRequest(staging, "", "", 0), _))
        .WillOnce(Invoke(serve({object(staging + "part-00001"), object(staging + "part-00002")})));
    EXPECT_CALL(*sdk, DeleteObject("bucket", staging + "part-00001"))
        .WillOnce(Return(Status(StatusCode::kPermissionDenied, "denied")));
    EXPECT_CALL(*sdk, DeleteObject("bucket", staging + "part-00002")).WillOnce(Return(Status()));

    IObjectStoreClient::AbortMultipartUploadRequest request{"bucket", "big.bin", "u2"};
    EXPECT_EQ(StatusCode::kPermissionDenied, client->AbortMultipartUpload(request).code());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
