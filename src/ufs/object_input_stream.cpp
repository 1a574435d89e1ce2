#include "object_input_stream.hpp"

#include <algorithm>
#include <cstring>
#include "ufs/ranged_read.hpp"
#include "log.hpp"

namespace objfs {

StatusOr<std::unique_ptr<ObjectInputStream>> ObjectInputStream::open(
    std::shared_ptr<const IObjectStoreClient> client,
    const std::string& bucket_name,
    const std::string& key,
    std::int64_t position,
    RetryStrategy retry,
    std::int64_t chunk_size)
{
    IObjectStoreClient::GetObjectMetadataRequest request;
    request.bucket_name = bucket_name;
    request.object_name = key;
    auto metadata = retry.run("GetObjectMetadata", [&] { return client->GetObjectMetadata(request); });
    if (!metadata) {
        return metadata.status();
    }

    auto stream = std::make_unique<ObjectInputStream>(
        std::move(client), bucket_name, key, metadata->size, std::move(retry), chunk_size);
    auto status = stream->seek(position);
    if (!status.ok()) {
        return status;
    }
    return stream;
}

ObjectInputStream::ObjectInputStream(std::shared_ptr<const IObjectStoreClient> client,
                                     std::string bucket_name,
                                     std::string key,
                                     std::int64_t length,
                                     RetryStrategy retry,
                                     std::int64_t chunk_size)
    : client_(std::move(client)),
      bucket_name_(std::move(bucket_name)),
      key_(std::move(key)),
      length_(length),
      retry_(std::move(retry)),
      chunk_size_(std::max<std::int64_t>(chunk_size, 1)) {}

Status ObjectInputStream::fill() {
    std::int64_t end = std::min(length_, position_ + chunk_size_);
    auto data = readRange(*client_, retry_, bucket_name_, key_, position_, end, chunk_size_);
    if (!data) {
        log::warn("Failed to read ", key_, " at ", position_, ": ", data.status().message());
        return data.status();
    }
    buffer_ = *std::move(data);
    buffer_start_ = position_;
    return Status();
}

StatusOr<std::size_t> ObjectInputStream::read(char* buf, std::size_t len) {
    std::size_t copied = 0;
    while (copied < len && position_ < length_) {
        if (!buffered(position_)) {
            auto status = fill();
            if (!status.ok()) {
                return status;
            }
        }
        auto offset = static_cast<std::size_t>(position_ - buffer_start_);
        std::size_t n = std::min(len - copied, buffer_.size() - offset);
        std::memcpy(buf + copied, buffer_.data() + offset, n);
        copied += n;
        position_ += static_cast<std::int64_t>(n);
    }
    return copied;
}

StatusOr<std::string> ObjectInputStream::readAll() {
    std::string result(static_cast<std::size_t>(length_ - position_), '\0');
    auto n = read(&result[0], result.size());
    if (!n) {
        return n.status();
    }
    result.resize(*n);
    return result;
}

Status ObjectInputStream::seek(std::int64_t position) {
    if (position < 0 || position > length_) {
        return Status(StatusCode::kOutOfRange,
                      "Cannot seek " + key_ + " to " + std::to_string(position) +
                      " (length " + std::to_string(length_) + ")");
    }
    position_ = position;
    return Status();
}

std::int64_t ObjectInputStream::skip(std::int64_t n) {
    if (n <= 0) {
        return 0;
    }
    std::int64_t moved = std::min(n, length_ - position_);
    position_ += moved;
    return moved;
}

ObjectPositionReader::ObjectPositionReader(std::shared_ptr<const IObjectStoreClient> client,
                                           std::string bucket_name,
                                           std::string key,
                                           std::int64_t length,
                                           RetryStrategy retry,
                                           std::int64_t chunk_size)
    : client_(std::move(client)),
      bucket_name_(std::move(bucket_name)),
      key_(std::move(key)),
      length_(length),
      retry_(std::move(retry)),
      chunk_size_(std::max<std::int64_t>(chunk_size, 1)) {}

StatusOr<std::size_t> ObjectPositionReader::read(std::int64_t position, char* buf, std::size_t len) const {
    if (position < 0) {
        return Status(StatusCode::kInvalidArgument, "Negative read position on " + key_);
    }
    if (position >= length_ || len == 0) {
        return std::size_t{0};
    }
    std::int64_t end = std::min(length_, position + static_cast<std::int64_t>(len));
    auto data = readRange(*client_, retry_, bucket_name_, key_, position, end, chunk_size_);
    if (!data) {
        return data.status();
    }
    std::memcpy(buf, data->data(), data->size());
    return data->size();
}

} // namespace objfs
