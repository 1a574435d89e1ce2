#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "store/object_store_client.hpp"

namespace objfs {

/**
 * InMemoryObjectStoreClient - Object store kept in process memory
 *
 * Follows S3 semantics: listing by prefix/delimiter with a continuation
 * marker, native multipart sessions, per-object tag lists. Used for local
 * trials of the mount (--in-memory) and as the backing store in tests.
 * Thread-safe.
 */
class InMemoryObjectStoreClient : public IObjectStoreClient {
public:
    InMemoryObjectStoreClient() = default;

    std::string Scheme() const override { return "mem"; }

    std::size_t MaxDeleteBatchSize() const override { return max_delete_batch_size_; }

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

    // Lowers the batch limit so tests can exercise chunked deletes
    void setMaxDeleteBatchSize(std::size_t size) { max_delete_batch_size_ = size; }

    // Number of multipart sessions neither completed nor aborted
    std::size_t pendingUploadCount() const;

    // All keys of a bucket in lexicographic order
    std::vector<std::string> keys(const std::string& bucket_name) const;

private:
    struct StoredObject {
        std::string data;
        std::string etag;
        std::int64_t last_modified_ms = 0;
        std::vector<ObjectTag> tags;
    };

    struct StoredPart {
        std::string data;
        std::string etag;
    };

    struct Upload {
        std::string bucket_name;
        std::string object_name;
        std::map<int, StoredPart> parts;
    };

    using Bucket = std::map<std::string, StoredObject>;

    static std::string computeETag(const std::string& data);
    static std::int64_t nowMillis();
    static ObjectStatus toObjectStatus(const std::string& key, const StoredObject& object);

    mutable std::mutex mutex_;
    mutable std::map<std::string, Bucket> buckets_;
    mutable std::map<std::string, Upload> uploads_;
    mutable std::uint64_t next_upload_id_ = 1;
    std::size_t max_delete_batch_size_ = 1000;
};

} // namespace objfs
