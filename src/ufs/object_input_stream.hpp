#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include "store/object_store_client.hpp"
#include "store/retry.hpp"

namespace objfs {

/**
 * ObjectInputStream - Seekable, retrying byte stream over one object
 *
 * Bytes are fetched a chunk at a time with ranged GETs; reads and seeks that
 * stay within the current chunk are served from memory. Not thread-safe.
 */
class ObjectInputStream {
public:
    /**
     * Stat the object and position the stream
     *
     * @return kNotFound (not retried) when the object is missing,
     *         kOutOfRange when position is past the end
     */
    static StatusOr<std::unique_ptr<ObjectInputStream>> open(
        std::shared_ptr<const IObjectStoreClient> client,
        const std::string& bucket_name,
        const std::string& key,
        std::int64_t position,
        RetryStrategy retry,
        std::int64_t chunk_size);

    ObjectInputStream(std::shared_ptr<const IObjectStoreClient> client,
                      std::string bucket_name,
                      std::string key,
                      std::int64_t length,
                      RetryStrategy retry,
                      std::int64_t chunk_size);

    /**
     * Read up to len bytes at the current position
     * @return Bytes copied, 0 at end of object
     */
    StatusOr<std::size_t> read(char* buf, std::size_t len);

    // Read everything from the current position to the end
    StatusOr<std::string> readAll();

    Status seek(std::int64_t position);

    // Advance by at most n bytes; returns how far it moved
    std::int64_t skip(std::int64_t n);

    std::int64_t position() const { return position_; }
    std::int64_t length() const { return length_; }
    const std::string& key() const { return key_; }

private:
    bool buffered(std::int64_t position) const {
        return position >= buffer_start_ &&
               position < buffer_start_ + static_cast<std::int64_t>(buffer_.size());
    }

    Status fill();

    std::shared_ptr<const IObjectStoreClient> client_;
    std::string bucket_name_;
    std::string key_;
    std::int64_t length_;
    RetryStrategy retry_;
    std::int64_t chunk_size_;

    std::int64_t position_ = 0;
    std::string buffer_;
    std::int64_t buffer_start_ = 0;
};

/**
 * ObjectPositionReader - Stateless positional reads of one object
 *
 * Safe for concurrent use; every read() issues its own ranged GETs.
 */
class ObjectPositionReader {
public:
    ObjectPositionReader(std::shared_ptr<const IObjectStoreClient> client,
                         std::string bucket_name,
                         std::string key,
                         std::int64_t length,
                         RetryStrategy retry,
                         std::int64_t chunk_size);

    // Returns bytes copied into buf, 0 at or past the end
    StatusOr<std::size_t> read(std::int64_t position, char* buf, std::size_t len) const;

    std::int64_t length() const { return length_; }

private:
    std::shared_ptr<const IObjectStoreClient> client_;
    std::string bucket_name_;
    std::string key_;
    std::int64_t length_;
    RetryStrategy retry_;
    std::int64_t chunk_size_;
};

} // namespace objfs
