#pragma once

#include <gmock/gmock.h>
#include "store/object_store_client.hpp"

namespace objfs {

// gmock double of the raw store; delegateTo() forwards every call to a real
// store so tests only script the calls they care about
class MockObjectStoreClient : public IObjectStoreClient {
public:
    MOCK_METHOD(std::string, Scheme, (), (const, override));
    MOCK_METHOD(std::size_t, MaxDeleteBatchSize, (), (const, override));
    MOCK_METHOD(std::string, ReservedPrefix, (), (const, override));
    MOCK_METHOD(std::optional<ObjectPermissions>, Permissions, (), (const, override));
    MOCK_METHOD(Status, PutObject, (const PutObjectRequest& request), (const, override));
    MOCK_METHOD(StatusOr<ObjectStatus>, GetObjectMetadata,
                (const GetObjectMetadataRequest& request), (const, override));
    MOCK_METHOD(StatusOr<std::string>, ReadObjectRange,
                (const ReadObjectRangeRequest& request), (const, override));
    MOCK_METHOD(Status, DeleteObject, (const DeleteObjectRequest& request), (const, override));
    MOCK_METHOD(StatusOr<std::vector<std::string>>, DeleteObjects,
                (const DeleteObjectsRequest& request), (const, override));
    MOCK_METHOD(StatusOr<ListObjectsResponse>, ListObjects,
                (const ListObjectsRequest& request), (const, override));
    MOCK_METHOD(Status, CopyObject, (const CopyObjectRequest& request), (const, override));
    MOCK_METHOD(StatusOr<std::vector<ObjectTag>>, GetObjectTags,
                (const GetObjectTagsRequest& request), (const, override));
    MOCK_METHOD(Status, SetObjectTags, (const SetObjectTagsRequest& request), (const, override));
    MOCK_METHOD(StatusOr<std::string>, InitiateMultipartUpload,
                (const InitiateMultipartUploadRequest& request), (const, override));
    MOCK_METHOD(StatusOr<std::string>, UploadPart, (const UploadPartRequest& request), (const, override));
    MOCK_METHOD(Status, CompleteMultipartUpload,
                (const CompleteMultipartUploadRequest& request), (const, override));
    MOCK_METHOD(Status, AbortMultipartUpload,
                (const AbortMultipartUploadRequest& request), (const, override));

    void delegateTo(const IObjectStoreClient& real) {
        using ::testing::_;
        using ::testing::Invoke;
        const IObjectStoreClient* target = &real;
        ON_CALL(*this, Scheme()).WillByDefault(Invoke([target] { return target->Scheme(); }));
        ON_CALL(*this, MaxDeleteBatchSize()).WillByDefault(Invoke([target] {
            return target->MaxDeleteBatchSize();
        }));
        ON_CALL(*this, ReservedPrefix()).WillByDefault(Invoke([target] { return target->ReservedPrefix(); }));
        ON_CALL(*this, Permissions()).WillByDefault(Invoke([target] { return target->Permissions(); }));
        ON_CALL(*this, PutObject(_)).WillByDefault(Invoke(target, &IObjectStoreClient::PutObject));
        ON_CALL(*this, GetObjectMetadata(_))
            .WillByDefault(Invoke(target, &IObjectStoreClient::GetObjectMetadata));
        ON_CALL(*this, ReadObjectRange(_))
            .WillByDefault(Invoke(target, &IObjectStoreClient::ReadObjectRange));
        ON_CALL(*this, DeleteObject(_)).WillByDefault(Invoke(target, &IObjectStoreClient::DeleteObject));
        ON_CALL(*this, DeleteObjects(_)).WillByDefault(Invoke(target, &IObjectStoreClient::DeleteObjects));
        ON_CALL(*this, ListObjects(_)).WillByDefault(Invoke(target, &IObjectStoreClient::ListObjects));
        ON_CALL(*this, CopyObject(_)).WillByDefault(Invoke(target, &IObjectStoreClient::CopyObject));
        ON_CALL(*this, GetObjectTags(_)).WillByDefault(Invoke(target, &IObjectStoreClient::GetObjectTags));
        ON_CALL(*this, SetObjectTags(_)).WillByDefault(Invoke(target, &IObjectStoreClient::SetObjectTags));
        ON_CALL(*this, InitiateMultipartUpload(_))
            .WillByDefault(Invoke(target, &IObjectStoreClient::InitiateMultipartUpload));
        ON_CALL(*this, UploadPart(_)).WillByDefault(Invoke(target, &IObjectStoreClient::UploadPart));
        ON_CALL(*this, CompleteMultipartUpload(_))
            .WillByDefault(Invoke(target, &IObjectStoreClient::CompleteMultipartUpload));
        ON_CALL(*this, AbortMultipartUpload(_))
            .WillByDefault(Invoke(target, &IObjectStoreClient::AbortMultipartUpload));
    }
};

} // namespace objfs
