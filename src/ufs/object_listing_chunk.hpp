#pragma once

#include <memory>
#include <string>
#include <vector>
#include "store/object_store_client.hpp"

namespace objfs {

/**
 * ObjectListingChunk - One page of a prefix listing
 *
 * Forward-only: nextChunk() issues the follow-up request with the store's
 * continuation token and is not retried. A chain ends when hasNextChunk() is
 * false, at which point nextChunk() yields nullptr.
 */
class ObjectListingChunk {
public:
    using ListObjectsRequest = IObjectStoreClient::ListObjectsRequest;
    using ListObjectsResponse = IObjectStoreClient::ListObjectsResponse;

    ObjectListingChunk(std::shared_ptr<const IObjectStoreClient> client,
                       ListObjectsRequest request,
                       ListObjectsResponse response);

    // Issue the first request of a listing
    static StatusOr<std::unique_ptr<ObjectListingChunk>> list(
        std::shared_ptr<const IObjectStoreClient> client,
        const ListObjectsRequest& request);

    const std::vector<ObjectStatus>& objectStatuses() const { return response_.objects; }

    const std::vector<std::string>& commonPrefixes() const { return response_.common_prefixes; }

    bool hasNextChunk() const { return response_.truncated; }

    bool empty() const { return response_.objects.empty() && response_.common_prefixes.empty(); }

    StatusOr<std::unique_ptr<ObjectListingChunk>> nextChunk() const;

    const ListObjectsRequest& request() const { return request_; }

private:
    std::shared_ptr<const IObjectStoreClient> client_;
    ListObjectsRequest request_;
    ListObjectsResponse response_;
};

} // namespace objfs
