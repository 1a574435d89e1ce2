#include "gcs_object_store_client.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include "store/retry.hpp"
#include "log.hpp"

namespace objfs {

namespace {
    // ComposeObject accepts at most this many sources per call
    const std::size_t kMaxComposeSources = 32;
    const std::size_t kCopyBufferSize = 1024 * 1024;
    const char kStagingRoot[] = ".objfs-multipart/";

    ObjectStatus toObjectStatus(const gcs::ObjectMetadata& metadata) {
        ObjectStatus status;
        status.key = metadata.name();
        status.etag = metadata.etag();
        status.size = static_cast<std::int64_t>(metadata.size());
        status.last_modified_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            metadata.updated().time_since_epoch()).count();
        return status;
    }

    std::string randomUploadId() {
        static thread_local std::mt19937_64 generator{std::random_device{}()};
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx",
                      static_cast<unsigned long long>(generator()));
        return buf;
    }
}  // End anonymous namespace

GCSObjectStoreClient::GCSObjectStoreClient(const ObjfsConfig& config)
    : sdk_(std::make_unique<GCSSDKClientImpl>(gcs::Client(clientOptions(config)))) {}

GCSObjectStoreClient::GCSObjectStoreClient(std::unique_ptr<IGCSSDKClient> sdk) : sdk_(std::move(sdk)) {}

google::cloud::Options GCSObjectStoreClient::clientOptions(const ObjfsConfig& config) {
    auto base_sleep = std::chrono::milliseconds(config.retry_base_sleep_ms);
    auto max_sleep = std::chrono::milliseconds(std::max(config.retry_base_sleep_ms, config.retry_max_sleep_ms));
    return google::cloud::Options{}
        .set<gcs::ConnectionPoolSizeOption>(static_cast<std::size_t>(config.max_connections))
        .set<gcs::TransferStallTimeoutOption>(std::chrono::seconds(config.connection_timeout))
        .set<gcs::DownloadStallTimeoutOption>(std::chrono::seconds(config.socket_timeout))
        .set<gcs::RetryPolicyOption>(
            gcs::LimitedErrorCountRetryPolicy(std::max(config.retry_max_attempts - 1, 0)).clone())
        .set<gcs::BackoffPolicyOption>(
            gcs::ExponentialBackoffPolicy(base_sleep, max_sleep, 2.0).clone());
}

std::string GCSObjectStoreClient::ReservedPrefix() const {
    return kStagingRoot;
}

std::string GCSObjectStoreClient::stagingPrefix(const std::string& upload_id) {
    return std::string(kStagingRoot) + upload_id + "/";
}

std::string GCSObjectStoreClient::partObjectName(const std::string& upload_id, int part_number) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "part-%05d", part_number);
    return stagingPrefix(upload_id) + buf;
}

Status GCSObjectStoreClient::PutObject(const PutObjectRequest& request) const {
    if (request.content_length == 0) {
        auto metadata = sdk_->InsertObject(request.bucket_name, request.object_name, std::string());
        return metadata.status();
    }
    if (request.body == nullptr) {
        return Status(StatusCode::kInvalidArgument, "Missing body for " + request.object_name);
    }

    auto writer = sdk_->WriteObject(request.bucket_name, request.object_name,
                                    static_cast<std::uint64_t>(request.content_length));

    std::vector<char> buffer(kCopyBufferSize);
    std::int64_t remaining = request.content_length;
    while (remaining > 0 && writer) {
        auto want = static_cast<std::streamsize>(std::min<std::int64_t>(remaining, buffer.size()));
        request.body->read(buffer.data(), want);
        auto got = request.body->gcount();
        if (got <= 0) {
            break;
        }
        writer.write(buffer.data(), got);
        remaining -= got;
    }

    if (remaining > 0) {
        // Do not finalize a truncated object
        std::move(writer).Suspend();
        return Status(StatusCode::kInvalidArgument,
                      "Body of " + request.object_name + " is shorter than its content length");
    }

    writer.Close();
    auto metadata = writer.metadata();
    if (!metadata) {
        return metadata.status();
    }
    if (static_cast<std::int64_t>(metadata->size()) != request.content_length) {
        return Status(StatusCode::kDataLoss,
                      "Uploaded size of " + request.object_name + " does not match content length");
    }
    return Status();
}

StatusOr<ObjectStatus> GCSObjectStoreClient::GetObjectMetadata(const GetObjectMetadataRequest& request) const {
    auto metadata = sdk_->GetObjectMetadata(request.bucket_name, request.object_name);
    if (!metadata) {
        return metadata.status();
    }
    return toObjectStatus(*metadata);
}

StatusOr<std::string> GCSObjectStoreClient::ReadObjectRange(const ReadObjectRangeRequest& request) const {
    auto result = sdk_->ReadObjectRange(request.bucket_name, request.object_name, request.begin, request.end);
    if (!result.status.ok()) {
        if (result.content.empty()) {
            return result.status;
        }
        // Hand back what arrived; the caller continues from the last byte
        log::debug("Short read of ", request.object_name, ": ", result.content.size(), " of ",
                   request.end - request.begin, " bytes (", result.status.message(), ")");
    }
    return std::move(result.content);
}

Status GCSObjectStoreClient::DeleteObject(const DeleteObjectRequest& request) const {
    auto status = sdk_->DeleteObject(request.bucket_name, request.object_name);
    if (status.code() == StatusCode::kNotFound) {
        return Status();
    }
    return status;
}

StatusOr<std::vector<std::string>> GCSObjectStoreClient::DeleteObjects(const DeleteObjectsRequest& request) const {
    if (request.object_names.size() > MaxDeleteBatchSize()) {
        return Status(StatusCode::kInvalidArgument, "Too many keys in one delete request");
    }

    std::vector<std::string> deleted;
    for (const auto& name : request.object_names) {
        auto status = sdk_->DeleteObject(request.bucket_name, name);
        if (status.ok()) {
            deleted.push_back(name);
            continue;
        }
        if (status.code() == StatusCode::kNotFound) {
            continue;
        }
        if (isTransient(status)) {
            return status;
        }
        log::warn("Failed to delete ", name, ": ", status.message());
    }
    return deleted;
}

StatusOr<IObjectStoreClient::ListObjectsResponse> GCSObjectStoreClient::ListObjects(
    const ListObjectsRequest& request) const
{
    const int max_results = request.max_results > 0 ? request.max_results : 1000;

    IGCSSDKClient::ListRequest list_request;
    list_request.bucket_name = request.bucket_name;
    list_request.prefix = request.prefix;
    list_request.delimiter = request.delimiter;
    // The token is the first name not yet returned; StartOffset is inclusive
    list_request.start_offset = request.continuation_token;
    list_request.max_results = max_results;

    ListObjectsResponse response;
    int count = 0;
    std::string last_name;
    auto status = sdk_->ListObjectsAndPrefixes(list_request, [&](const gcs::ObjectOrPrefix& item) {
        const bool is_object = absl::holds_alternative<gcs::ObjectMetadata>(item);
        std::string name = is_object ? absl::get<gcs::ObjectMetadata>(item).name()
                                     : absl::get<std::string>(item);
        // A prefix spanning two service pages is reported by both
        if (count > 0 && name == last_name) {
            return true;
        }
        if (count == max_results) {
            response.truncated = true;
            response.next_continuation_token = name;
            return false;
        }

        if (is_object) {
            response.objects.push_back(toObjectStatus(absl::get<gcs::ObjectMetadata>(item)));
        } else {
            response.common_prefixes.push_back(name);
        }
        last_name = std::move(name);
        ++count;
        return true;
    });
    if (!status.ok()) {
        return status;
    }
    return response;
}

Status GCSObjectStoreClient::CopyObject(const CopyObjectRequest& request) const {
    auto metadata = sdk_->RewriteObject(
        request.source_bucket, request.source_object,
        request.destination_bucket, request.destination_object);
    return metadata.status();
}

StatusOr<std::vector<ObjectTag>> GCSObjectStoreClient::GetObjectTags(const GetObjectTagsRequest& request) const {
    auto metadata = sdk_->GetObjectMetadata(request.bucket_name, request.object_name);
    if (!metadata) {
        return metadata.status();
    }

    std::vector<ObjectTag> tags;
    for (const auto& entry : metadata->metadata()) {
        tags.push_back(ObjectTag{entry.first, entry.second});
    }
    return tags;
}

Status GCSObjectStoreClient::SetObjectTags(const SetObjectTagsRequest& request) const {
    auto metadata = sdk_->GetObjectMetadata(request.bucket_name, request.object_name);
    if (!metadata) {
        return metadata.status();
    }

    // The tag list replaces the custom metadata wholesale
    gcs::ObjectMetadataPatch patch;
    for (const auto& entry : metadata->metadata()) {
        auto it = std::find_if(request.tags.begin(), request.tags.end(),
                               [&](const ObjectTag& tag) { return tag.name == entry.first; });
        if (it == request.tags.end()) {
            patch.ResetMetadata(entry.first);
        }
    }
    for (const auto& tag : request.tags) {
        patch.SetMetadata(tag.name, tag.value);
    }

    auto updated = sdk_->PatchObject(request.bucket_name, request.object_name, patch);
    return updated.status();
}

StatusOr<std::string> GCSObjectStoreClient::InitiateMultipartUpload(
    const InitiateMultipartUploadRequest& request) const
{
    std::string upload_id = randomUploadId();
    log::debug("Staging multipart upload of ", request.object_name, " under ", stagingPrefix(upload_id));
    return upload_id;
}

StatusOr<std::string> GCSObjectStoreClient::UploadPart(const UploadPartRequest& request) const {
    auto metadata = sdk_->InsertObject(request.bucket_name,
                                       partObjectName(request.upload_id, request.part_number),
                                       request.data);
    if (!metadata) {
        return metadata.status();
    }
    return metadata->etag();
}

Status GCSObjectStoreClient::CompleteMultipartUpload(const CompleteMultipartUploadRequest& request) const {
    if (request.parts.empty()) {
        return Status(StatusCode::kInvalidArgument, "Multipart upload lists no parts");
    }

    std::vector<std::string> sources;
    int previous_part = 0;
    for (const auto& part : request.parts) {
        if (part.part_number <= previous_part) {
            return Status(StatusCode::kInvalidArgument, "Parts are not in ascending order");
        }
        previous_part = part.part_number;
        sources.push_back(partObjectName(request.upload_id, part.part_number));
    }

    // Compose in rounds of at most 32 sources until one call can finish it
    int round = 0;
    while (sources.size() > kMaxComposeSources) {
        std::vector<std::string> next_round;
        for (std::size_t i = 0; i < sources.size(); i += kMaxComposeSources) {
            auto last = std::min(sources.size(), i + kMaxComposeSources);
            std::vector<std::string> group(sources.begin() + i, sources.begin() + last);
            if (group.size() == 1) {
                next_round.push_back(group.front());
                continue;
            }
            std::string intermediate = stagingPrefix(request.upload_id) + "compose-" +
                                       std::to_string(round) + "-" + std::to_string(i / kMaxComposeSources);
            auto composed = sdk_->ComposeObject(request.bucket_name, group, intermediate);
            if (!composed) {
                return composed.status();
            }
            next_round.push_back(intermediate);
        }
        sources = std::move(next_round);
        ++round;
    }

    auto composed = sdk_->ComposeObject(request.bucket_name, sources, request.object_name);
    if (!composed) {
        return composed.status();
    }

    auto cleanup = deleteStagedObjects(request.bucket_name, request.upload_id);
    if (!cleanup.ok()) {
        log::warn("Failed to remove staged parts of ", request.object_name, ": ", cleanup.message());
    }
    return Status();
}

Status GCSObjectStoreClient::AbortMultipartUpload(const AbortMultipartUploadRequest& request) const {
    return deleteStagedObjects(request.bucket_name, request.upload_id);
}

Status GCSObjectStoreClient::deleteStagedObjects(const std::string& bucket_name, const std::string& upload_id) const {
    IGCSSDKClient::ListRequest list_request;
    list_request.bucket_name = bucket_name;
    list_request.prefix = stagingPrefix(upload_id);

    std::vector<std::string> staged;
    auto listed = sdk_->ListObjectsAndPrefixes(list_request, [&](const gcs::ObjectOrPrefix& item) {
        if (absl::holds_alternative<gcs::ObjectMetadata>(item)) {
            staged.push_back(absl::get<gcs::ObjectMetadata>(item).name());
        }
        return true;
    });
    if (!listed.ok()) {
        return listed;
    }

    Status result;
    for (const auto& name : staged) {
        auto status = sdk_->DeleteObject(bucket_name, name);
        if (!status.ok() && status.code() != StatusCode::kNotFound) {
            log::warn("Failed to delete staged object ", name, ": ", status.message());
            result = status;
        }
    }
    return result;
}

} // namespace objfs
