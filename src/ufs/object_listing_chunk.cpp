#include "object_listing_chunk.hpp"
#include "log.hpp"

namespace objfs {

ObjectListingChunk::ObjectListingChunk(std::shared_ptr<const IObjectStoreClient> client,
                                       ListObjectsRequest request,
                                       ListObjectsResponse response)
    : client_(std::move(client)),
      request_(std::move(request)),
      response_(std::move(response)) {}

StatusOr<std::unique_ptr<ObjectListingChunk>> ObjectListingChunk::list(
    std::shared_ptr<const IObjectStoreClient> client,
    const ListObjectsRequest& request)
{
    auto response = client->ListObjects(request);
    if (!response) {
        return response.status();
    }
    return std::make_unique<ObjectListingChunk>(std::move(client), request, *std::move(response));
}

StatusOr<std::unique_ptr<ObjectListingChunk>> ObjectListingChunk::nextChunk() const {
    if (!response_.truncated) {
        return std::unique_ptr<ObjectListingChunk>();
    }
    if (response_.next_continuation_token.empty()) {
        // Store claimed more results but gave no way to fetch them
        log::warn("Listing of ", request_.prefix, " is truncated without a continuation token");
        return std::unique_ptr<ObjectListingChunk>();
    }

    ListObjectsRequest next = request_;
    next.continuation_token = response_.next_continuation_token;
    auto response = client_->ListObjects(next);
    if (!response) {
        log::warn("Failed to fetch next listing page of ", request_.prefix, ": ", response.status().message());
        return response.status();
    }
    return std::make_unique<ObjectListingChunk>(client_, std::move(next), *std::move(response));
}

} // namespace objfs
