#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"

namespace objfs {

using google::cloud::Status;
using google::cloud::StatusCode;
using google::cloud::StatusOr;

/**
 * ObjectStatus - Snapshot of one object's metadata at listing/stat time
 */
struct ObjectStatus {
    std::string key;
    std::optional<std::string> etag;
    std::int64_t size = 0;
    std::optional<std::int64_t> last_modified_ms;

    bool operator==(const ObjectStatus& other) const {
        return key == other.key && etag == other.etag && size == other.size &&
               last_modified_ms == other.last_modified_ms;
    }
};

// One name/value tag as the store transfers it
struct ObjectTag {
    std::string name;
    std::string value;

    bool operator==(const ObjectTag& other) const {
        return name == other.name && value == other.value;
    }
};

using TagSet = std::map<std::string, std::string>;

struct ObjectPermissions {
    std::string owner;
    std::string group;
    unsigned int mode = 0777;
};

/**
 * Raw interface over an object store - one call per store primitive, no
 * directory logic. Concrete stores (GCS, in-memory) implement it; the
 * filesystem layer composes it and tests mock it.
 */
class IObjectStoreClient {
public:
    virtual ~IObjectStoreClient() = default;

    struct PutObjectRequest {
        std::string bucket_name;
        std::string object_name;
        // Body must yield exactly content_length bytes
        std::istream* body = nullptr;
        std::int64_t content_length = 0;
    };

    struct GetObjectMetadataRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const GetObjectMetadataRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    // Range is [begin, end) (inclusive, exclusive)
    struct ReadObjectRangeRequest {
        std::string bucket_name;
        std::string object_name;
        std::int64_t begin = 0;
        std::int64_t end = 0;

        bool operator==(const ReadObjectRangeRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name &&
                   begin == other.begin && end == other.end;
        }
    };

    struct DeleteObjectRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const DeleteObjectRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    struct DeleteObjectsRequest {
        std::string bucket_name;
        std::vector<std::string> object_names;

        bool operator==(const DeleteObjectsRequest& other) const {
            return bucket_name == other.bucket_name && object_names == other.object_names;
        }
    };

    struct ListObjectsRequest {
        std::string bucket_name;
        std::string prefix;
        // Empty delimiter lists recursively
        std::string delimiter;
        int max_results = 0;
        std::string continuation_token;

        bool operator==(const ListObjectsRequest& other) const {
            return bucket_name == other.bucket_name &&
                   prefix == other.prefix &&
                   delimiter == other.delimiter &&
                   max_results == other.max_results &&
                   continuation_token == other.continuation_token;
        }
    };

    struct ListObjectsResponse {
        std::vector<ObjectStatus> objects;
        std::vector<std::string> common_prefixes;
        bool truncated = false;
        std::string next_continuation_token;
    };

    struct CopyObjectRequest {
        std::string source_bucket;
        std::string source_object;
        std::string destination_bucket;
        std::string destination_object;

        bool operator==(const CopyObjectRequest& other) const {
            return source_bucket == other.source_bucket && source_object == other.source_object &&
                   destination_bucket == other.destination_bucket &&
                   destination_object == other.destination_object;
        }
    };

    struct GetObjectTagsRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const GetObjectTagsRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    struct SetObjectTagsRequest {
        std::string bucket_name;
        std::string object_name;
        std::vector<ObjectTag> tags;

        bool operator==(const SetObjectTagsRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name &&
                   tags == other.tags;
        }
    };

    struct InitiateMultipartUploadRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const InitiateMultipartUploadRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    struct UploadPartRequest {
        std::string bucket_name;
        std::string object_name;
        std::string upload_id;
        int part_number = 0;
        std::string data;
    };

    struct CompletedPart {
        int part_number = 0;
        std::string etag;

        bool operator==(const CompletedPart& other) const {
            return part_number == other.part_number && etag == other.etag;
        }
    };

    struct CompleteMultipartUploadRequest {
        std::string bucket_name;
        std::string object_name;
        std::string upload_id;
        // Ascending part number order
        std::vector<CompletedPart> parts;

        bool operator==(const CompleteMultipartUploadRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name &&
                   upload_id == other.upload_id && parts == other.parts;
        }
    };

    struct AbortMultipartUploadRequest {
        std::string bucket_name;
        std::string object_name;
        std::string upload_id;

        bool operator==(const AbortMultipartUploadRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name &&
                   upload_id == other.upload_id;
        }
    };

    // URI scheme of the store, e.g. "gs"
    virtual std::string Scheme() const = 0;

    // Largest number of keys one DeleteObjects call accepts
    virtual std::size_t MaxDeleteBatchSize() const { return 1000; }

    // Keys under this prefix belong to the store itself (e.g. staged
    // multipart parts) and are never shown as files. Empty means none.
    virtual std::string ReservedPrefix() const { return std::string(); }

    // Stores without an ACL model return nullopt
    virtual std::optional<ObjectPermissions> Permissions() const { return std::nullopt; }

    virtual Status PutObject(const PutObjectRequest& request) const = 0;

    virtual StatusOr<ObjectStatus> GetObjectMetadata(const GetObjectMetadataRequest& request) const = 0;

    // May return fewer bytes than requested (short read)
    virtual StatusOr<std::string> ReadObjectRange(const ReadObjectRangeRequest& request) const = 0;

    // Deleting an absent object succeeds
    virtual Status DeleteObject(const DeleteObjectRequest& request) const = 0;

    // Returns the keys the store confirmed deleted; absent keys are omitted
    virtual StatusOr<std::vector<std::string>> DeleteObjects(const DeleteObjectsRequest& request) const = 0;

    virtual StatusOr<ListObjectsResponse> ListObjects(const ListObjectsRequest& request) const = 0;

    virtual Status CopyObject(const CopyObjectRequest& request) const = 0;

    virtual StatusOr<std::vector<ObjectTag>> GetObjectTags(const GetObjectTagsRequest& request) const = 0;

    virtual Status SetObjectTags(const SetObjectTagsRequest& request) const = 0;

    // Returns the upload id
    virtual StatusOr<std::string> InitiateMultipartUpload(const InitiateMultipartUploadRequest& request) const = 0;

    // Returns the part's entity tag
    virtual StatusOr<std::string> UploadPart(const UploadPartRequest& request) const = 0;

    virtual Status CompleteMultipartUpload(const CompleteMultipartUploadRequest& request) const = 0;

    virtual Status AbortMultipartUpload(const AbortMultipartUploadRequest& request) const = 0;
};

} // namespace objfs
