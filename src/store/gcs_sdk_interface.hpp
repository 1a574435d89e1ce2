#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "google/cloud/storage/client.h"
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"

namespace gcs = ::google::cloud::storage;

namespace objfs {

using google::cloud::Status;
using google::cloud::StatusOr;

/**
 * Raw interface wrapper for the GCS SDK - no store semantics, just the SDK
 * calls GCSObjectStoreClient makes. Streams that cannot be built in a test
 * (ranged reads, listing readers) are drained here and handed over as plain
 * values, so GCSObjectStoreClient can be tested against a mock.
 */
class IGCSSDKClient {
public:
    virtual ~IGCSSDKClient() = default;

    // Bytes received before the stream ended, and how it ended
    struct ReadRangeResult {
        std::string content;
        Status status;
    };

    struct ListRequest {
        std::string bucket_name;
        std::string prefix;
        std::string delimiter;
        std::string start_offset;
        int max_results = 0;

        bool operator==(const ListRequest& other) const {
            return bucket_name == other.bucket_name &&
                   prefix == other.prefix &&
                   delimiter == other.delimiter &&
                   start_offset == other.start_offset &&
                   max_results == other.max_results;
        }
    };

    // Return false to stop the listing early
    using ListConsumer = std::function<bool(const gcs::ObjectOrPrefix&)>;

    virtual StatusOr<gcs::ObjectMetadata> InsertObject(const std::string& bucket_name,
                                                       const std::string& object_name,
                                                       const std::string& contents) const = 0;

    virtual gcs::ObjectWriteStream WriteObject(const std::string& bucket_name,
                                               const std::string& object_name,
                                               std::uint64_t content_length) const = 0;

    virtual StatusOr<gcs::ObjectMetadata> GetObjectMetadata(const std::string& bucket_name,
                                                            const std::string& object_name) const = 0;

    // Range is [begin, end) (inclusive, exclusive)
    virtual ReadRangeResult ReadObjectRange(const std::string& bucket_name,
                                            const std::string& object_name,
                                            std::int64_t begin,
                                            std::int64_t end) const = 0;

    virtual Status DeleteObject(const std::string& bucket_name, const std::string& object_name) const = 0;

    // Feeds objects and prefixes in name order; returns the status the listing ended with
    virtual Status ListObjectsAndPrefixes(const ListRequest& request, const ListConsumer& consumer) const = 0;

    virtual StatusOr<gcs::ObjectMetadata> RewriteObject(const std::string& source_bucket,
                                                        const std::string& source_object,
                                                        const std::string& destination_bucket,
                                                        const std::string& destination_object) const = 0;

    virtual StatusOr<gcs::ObjectMetadata> PatchObject(const std::string& bucket_name,
                                                      const std::string& object_name,
                                                      const gcs::ObjectMetadataPatch& patch) const = 0;

    virtual StatusOr<gcs::ObjectMetadata> ComposeObject(const std::string& bucket_name,
                                                        const std::vector<std::string>& sources,
                                                        const std::string& destination) const = 0;
};

/**
 * Real implementation - thin wrapper over google::cloud::storage::Client
 * Just forwards calls to the SDK with no business logic
 */
class GCSSDKClientImpl : public IGCSSDKClient {
public:
    GCSSDKClientImpl();
    explicit GCSSDKClientImpl(const gcs::Client& client);

    StatusOr<gcs::ObjectMetadata> InsertObject(const std::string& bucket_name,
                                               const std::string& object_name,
                                               const std::string& contents) const override;

    gcs::ObjectWriteStream WriteObject(const std::string& bucket_name,
                                       const std::string& object_name,
                                       std::uint64_t content_length) const override;

    StatusOr<gcs::ObjectMetadata> GetObjectMetadata(const std::string& bucket_name,
                                                    const std::string& object_name) const override;

    ReadRangeResult ReadObjectRange(const std::string& bucket_name,
                                    const std::string& object_name,
                                    std::int64_t begin,
                                    std::int64_t end) const override;

    Status DeleteObject(const std::string& bucket_name, const std::string& object_name) const override;

    Status ListObjectsAndPrefixes(const ListRequest& request, const ListConsumer& consumer) const override;

    StatusOr<gcs::ObjectMetadata> RewriteObject(const std::string& source_bucket,
                                                const std::string& source_object,
                                                const std::string& destination_bucket,
                                                const std::string& destination_object) const override;

    StatusOr<gcs::ObjectMetadata> PatchObject(const std::string& bucket_name,
                                              const std::string& object_name,
                                              const gcs::ObjectMetadataPatch& patch) const override;

    StatusOr<gcs::ObjectMetadata> ComposeObject(const std::string& bucket_name,
                                                const std::vector<std::string>& sources,
                                                const std::string& destination) const override;

private:
    mutable gcs::Client client_;  // mutable because GCS client methods are non-const
};

} // namespace objfs
