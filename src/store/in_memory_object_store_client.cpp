#include "in_memory_object_store_client.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <functional>

namespace objfs {

namespace {
    // Continuation tokens remember whether the last entry was a common prefix,
    // since an object key may also end with the delimiter (folder markers)
    const char kObjectMarker = 'O';
    const char kPrefixMarker = 'P';

    bool startsWith(const std::string& value, const std::string& prefix) {
        return value.compare(0, prefix.size(), prefix) == 0;
    }
}  // End anonymous namespace

std::string InMemoryObjectStoreClient::computeETag(const std::string& data) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%016zx", std::hash<std::string>{}(data));
    return std::string("\"") + buf + "\"";
}

std::int64_t InMemoryObjectStoreClient::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

ObjectStatus InMemoryObjectStoreClient::toObjectStatus(const std::string& key, const StoredObject& object) {
    ObjectStatus status;
    status.key = key;
    status.etag = object.etag;
    status.size = static_cast<std::int64_t>(object.data.size());
    status.last_modified_ms = object.last_modified_ms;
    return status;
}

Status InMemoryObjectStoreClient::PutObject(const PutObjectRequest& request) const {
    if (request.content_length < 0) {
        return Status(StatusCode::kInvalidArgument, "Negative content length");
    }

    StoredObject object;
    if (request.content_length > 0) {
        if (request.body == nullptr) {
            return Status(StatusCode::kInvalidArgument, "Missing body for " + request.object_name);
        }
        object.data.resize(static_cast<std::size_t>(request.content_length));
        request.body->read(&object.data[0], request.content_length);
        if (request.body->gcount() != request.content_length) {
            return Status(StatusCode::kInvalidArgument,
                          "Body of " + request.object_name + " is shorter than its content length");
        }
    }
    object.etag = computeETag(object.data);
    object.last_modified_ms = nowMillis();

    std::lock_guard<std::mutex> lock(mutex_);
    buckets_[request.bucket_name][request.object_name] = std::move(object);
    return Status();
}

StatusOr<ObjectStatus> InMemoryObjectStoreClient::GetObjectMetadata(const GetObjectMetadataRequest& request) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[request.bucket_name];
    auto it = bucket.find(request.object_name);
    if (it == bucket.end()) {
        return Status(StatusCode::kNotFound, "No such object: " + request.object_name);
    }
    return toObjectStatus(it->first, it->second);
}

StatusOr<std::string> InMemoryObjectStoreClient::ReadObjectRange(const ReadObjectRangeRequest& request) const {
    if (request.begin < 0 || request.end < request.begin) {
        return Status(StatusCode::kInvalidArgument, "Invalid range for " + request.object_name);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[request.bucket_name];
    auto it = bucket.find(request.object_name);
    if (it == bucket.end()) {
        return Status(StatusCode::kNotFound, "No such object: " + request.object_name);
    }

    const std::string& data = it->second.data;
    auto size = static_cast<std::int64_t>(data.size());
    if (request.begin > size) {
        return Status(StatusCode::kOutOfRange, "Range starts past the end of " + request.object_name);
    }
    auto end = std::min(request.end, size);
    return data.substr(static_cast<std::size_t>(request.begin), static_cast<std::size_t>(end - request.begin));
}

Status InMemoryObjectStoreClient::DeleteObject(const DeleteObjectRequest& request) const {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_[request.bucket_name].erase(request.object_name);
    return Status();
}

StatusOr<std::vector<std::string>> InMemoryObjectStoreClient::DeleteObjects(const DeleteObjectsRequest& request) const {
    if (request.object_names.size() > max_delete_batch_size_) {
        return Status(StatusCode::kInvalidArgument, "Too many keys in one delete request");
    }

    std::vector<std::string> deleted;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[request.bucket_name];
    for (const auto& name : request.object_names) {
        if (bucket.erase(name) > 0) {
            deleted.push_back(name);
        }
    }
    return deleted;
}

StatusOr<IObjectStoreClient::ListObjectsResponse> InMemoryObjectStoreClient::ListObjects(
    const ListObjectsRequest& request) const
{
    const int max_results = request.max_results > 0 ? request.max_results : 1000;
    const std::string& prefix = request.prefix;
    const std::string& delimiter = request.delimiter;

    std::string marker;
    bool marker_is_prefix = false;
    if (!request.continuation_token.empty()) {
        char kind = request.continuation_token[0];
        if (kind != kObjectMarker && kind != kPrefixMarker) {
            return Status(StatusCode::kInvalidArgument, "Malformed continuation token");
        }
        marker_is_prefix = kind == kPrefixMarker;
        marker = request.continuation_token.substr(1);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto& bucket = buckets_[request.bucket_name];

    ListObjectsResponse response;
    auto it = marker.empty() ? bucket.lower_bound(prefix) : bucket.upper_bound(marker);
    int count = 0;
    std::string last_entry;
    char last_kind = kObjectMarker;

    for (; it != bucket.end(); ++it) {
        const std::string& key = it->first;
        if (!startsWith(key, prefix)) {
            break;
        }
        if (marker_is_prefix && startsWith(key, marker)) {
            continue;
        }

        if (!delimiter.empty()) {
            auto pos = key.find(delimiter, prefix.size());
            if (pos != std::string::npos) {
                std::string common_prefix = key.substr(0, pos + delimiter.size());
                if (!response.common_prefixes.empty() && response.common_prefixes.back() == common_prefix) {
                    continue;
                }
                if (count == max_results) {
                    response.truncated = true;
                    break;
                }
                response.common_prefixes.push_back(common_prefix);
                last_entry = common_prefix;
                last_kind = kPrefixMarker;
                ++count;
                continue;
            }
        }

        if (count == max_results) {
            response.truncated = true;
            break;
        }
        response.objects.push_back(toObjectStatus(key, it->second));
        last_entry = key;
        last_kind = kObjectMarker;
        ++count;
    }

    if (response.truncated) {
        response.next_continuation_token = last_kind + last_entry;
    }
    return response;
}

Status InMemoryObjectStoreClient::CopyObject(const CopyObjectRequest& request) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& source_bucket = buckets_[request.source_bucket];
    auto it = source_bucket.find(request.source_object);
    if (it == source_bucket.end()) {
        return Status(StatusCode::kNotFound, "No such object: " + request.source_object);
    }
    StoredObject copy = it->second;
    copy.last_modified_ms = nowMillis();
    buckets_[request.destination_bucket][request.destination_object] = std::move(copy);
    return Status();
}

StatusOr<std::vector<ObjectTag>> InMemoryObjectStoreClient::GetObjectTags(const GetObjectTagsRequest& request) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[request.bucket_name];
    auto it = bucket.find(request.object_name);
    if (it == bucket.end()) {
        return Status(StatusCode::kNotFound, "No such object: " + request.object_name);
    }
    return it->second.tags;
}

Status InMemoryObjectStoreClient::SetObjectTags(const SetObjectTagsRequest& request) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[request.bucket_name];
    auto it = bucket.find(request.object_name);
    if (it == bucket.end()) {
        return Status(StatusCode::kNotFound, "No such object: " + request.object_name);
    }
    it->second.tags = request.tags;
    return Status();
}

StatusOr<std::string> InMemoryObjectStoreClient::InitiateMultipartUpload(
    const InitiateMultipartUploadRequest& request) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string upload_id = "upload-" + std::to_string(next_upload_id_++);
    Upload upload;
    upload.bucket_name = request.bucket_name;
    upload.object_name = request.object_name;
    uploads_.emplace(upload_id, std::move(upload));
    return upload_id;
}

StatusOr<std::string> InMemoryObjectStoreClient::UploadPart(const UploadPartRequest& request) const {
    if (request.part_number < 1 || request.part_number > 10000) {
        return Status(StatusCode::kInvalidArgument,
                      "Part number out of range: " + std::to_string(request.part_number));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(request.upload_id);
    if (it == uploads_.end() || it->second.object_name != request.object_name) {
        return Status(StatusCode::kNotFound, "No such upload: " + request.upload_id);
    }
    StoredPart part;
    part.data = request.data;
    part.etag = computeETag(request.data);
    std::string etag = part.etag;
    it->second.parts[request.part_number] = std::move(part);
    return etag;
}

Status InMemoryObjectStoreClient::CompleteMultipartUpload(const CompleteMultipartUploadRequest& request) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(request.upload_id);
    if (it == uploads_.end() || it->second.object_name != request.object_name) {
        return Status(StatusCode::kNotFound, "No such upload: " + request.upload_id);
    }
    if (request.parts.empty()) {
        return Status(StatusCode::kInvalidArgument, "Multipart upload lists no parts");
    }

    StoredObject object;
    int previous_part = 0;
    for (const auto& completed : request.parts) {
        if (completed.part_number <= previous_part) {
            return Status(StatusCode::kInvalidArgument, "Parts are not in ascending order");
        }
        previous_part = completed.part_number;

        auto part = it->second.parts.find(completed.part_number);
        if (part == it->second.parts.end() || part->second.etag != completed.etag) {
            return Status(StatusCode::kInvalidArgument,
                          "Invalid part " + std::to_string(completed.part_number));
        }
        object.data += part->second.data;
    }
    object.etag = computeETag(object.data);
    object.last_modified_ms = nowMillis();

    buckets_[request.bucket_name][request.object_name] = std::move(object);
    uploads_.erase(it);
    return Status();
}

Status InMemoryObjectStoreClient::AbortMultipartUpload(const AbortMultipartUploadRequest& request) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (uploads_.erase(request.upload_id) == 0) {
        return Status(StatusCode::kNotFound, "No such upload: " + request.upload_id);
    }
    return Status();
}

std::size_t InMemoryObjectStoreClient::pendingUploadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}

std::vector<std::string> InMemoryObjectStoreClient::keys(const std::string& bucket_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : buckets_[bucket_name]) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace objfs
