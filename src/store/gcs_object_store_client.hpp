#pragma once

#include <memory>
#include <string>
#include <vector>
#include "store/gcs_sdk_interface.hpp"
#include "store/object_store_client.hpp"
#include "config.hpp"

namespace objfs {

/**
 * GCSObjectStoreClient - Object store primitives over Google Cloud Storage
 *
 * Thin mapping onto google::cloud::storage::Client. GCS has no tags, no
 * multi-object delete and no multipart upload, so:
 * - tags are the object's custom metadata
 * - DeleteObjects issues one delete per key
 * - multipart parts are staged as objects under ".objfs-multipart/<id>/" and
 *   stitched together with ComposeObject on completion; that prefix is
 *   reported as reserved so the filesystem never shows staged parts
 */
class GCSObjectStoreClient : public IObjectStoreClient {
public:
    explicit GCSObjectStoreClient(const ObjfsConfig& config);
    // Dependency injection constructor - tests pass a mock SDK client here
    explicit GCSObjectStoreClient(std::unique_ptr<IGCSSDKClient> sdk);

    /**
     * Build client options (pool size, stall timeouts, SDK retry policy)
     * from the mount configuration
     */
    static google::cloud::Options clientOptions(const ObjfsConfig& config);

    std::string Scheme() const override { return "gs"; }

    // Matches the JSON API batch limit
    std::size_t MaxDeleteBatchSize() const override { return 100; }

    std::string ReservedPrefix() const override;

    Status PutObject(const PutObjectRequest& request) const override;

    StatusOr<ObjectStatus> GetObjectMetadata(const GetObjectMetadataRequest& request) const override;

    StatusOr<std::string> ReadObjectRange(const ReadObjectRangeRequest& request) const override;

    Status DeleteObject(const DeleteObjectRequest& request) const override;

    StatusOr<std::vector<std::string>> DeleteObjects(const DeleteObjectsRequest& request) const override;

    StatusOr<ListObjectsResponse> ListObjects(const ListObjectsRequest& request) const override;

    Status CopyObject(const CopyObjectRequest& request) const override;

    StatusOr<std::vector<ObjectTag>> GetObjectTags(const GetObjectTagsRequest& request) const override;

    Status SetObjectTags(const SetObjectTagsRequest& request) const override;

    StatusOr<std::string> InitiateMultipartUpload(const InitiateMultipartUploadRequest& request) const override;

    StatusOr<std::string> UploadPart(const UploadPartRequest& request) const override;

    Status CompleteMultipartUpload(const CompleteMultipartUploadRequest& request) const override;

    Status AbortMultipartUpload(const AbortMultipartUploadRequest& request) const override;

    static std::string stagingPrefix(const std::string& upload_id);
    static std::string partObjectName(const std::string& upload_id, int part_number);

private:
    Status deleteStagedObjects(const std::string& bucket_name, const std::string& upload_id) const;

    std::unique_ptr<IGCSSDKClient> sdk_;
};

} // namespace objfs
