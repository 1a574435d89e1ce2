#pragma once

#include <cstdint>
#include <string>
#include "store/object_store_client.hpp"
#include "store/retry.hpp"

namespace objfs {

/**
 * Fetch bytes [begin, end) of one object
 *
 * Each ranged GET covers at most chunk_size bytes and is retried on its own.
 * A short response is continued by a fresh request starting at the first
 * missing byte. An empty response before `end` means the object shrank and
 * is reported as kDataLoss.
 */
StatusOr<std::string> readRange(const IObjectStoreClient& client,
                                const RetryStrategy& retry,
                                const std::string& bucket_name,
                                const std::string& key,
                                std::int64_t begin,
                                std::int64_t end,
                                std::int64_t chunk_size);

} // namespace objfs
