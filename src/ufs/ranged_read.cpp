#include "ranged_read.hpp"

#include <algorithm>
#include "log.hpp"

namespace objfs {

StatusOr<std::string> readRange(const IObjectStoreClient& client,
                                const RetryStrategy& retry,
                                const std::string& bucket_name,
                                const std::string& key,
                                std::int64_t begin,
                                std::int64_t end,
                                std::int64_t chunk_size)
{
    std::string result;
    if (end <= begin) {
        return result;
    }
    result.reserve(static_cast<std::size_t>(end - begin));

    std::int64_t next = begin;
    while (next < end) {
        IObjectStoreClient::ReadObjectRangeRequest request;
        request.bucket_name = bucket_name;
        request.object_name = key;
        request.begin = next;
        request.end = std::min(end, next + std::max<std::int64_t>(chunk_size, 1));

        auto data = retry.run("ReadObjectRange", [&] { return client.ReadObjectRange(request); });
        if (!data) {
            return data.status();
        }
        if (data->empty()) {
            return Status(StatusCode::kDataLoss,
                          key + " ended at byte " + std::to_string(next) +
                          ", expected " + std::to_string(end));
        }

        auto wanted = static_cast<std::size_t>(request.end - next);
        if (data->size() < wanted) {
            log::debug("Short read of ", key, " at ", next, ": got ", data->size(), " of ", wanted, " bytes");
        }
        std::size_t take = std::min(wanted, data->size());
        result.append(*data, 0, take);
        next += static_cast<std::int64_t>(take);
    }
    return result;
}

} // namespace objfs
