#include "gcs_sdk_interface.hpp"

#include <iterator>

namespace objfs {

GCSSDKClientImpl::GCSSDKClientImpl() : client_(gcs::Client()) {}

GCSSDKClientImpl::GCSSDKClientImpl(const gcs::Client& client) : client_(client) {}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::InsertObject(const std::string& bucket_name,
                                                             const std::string& object_name,
                                                             const std::string& contents) const
{
    return client_.InsertObject(bucket_name, object_name, contents);
}

gcs::ObjectWriteStream GCSSDKClientImpl::WriteObject(const std::string& bucket_name,
                                                     const std::string& object_name,
                                                     std::uint64_t content_length) const
{
    return client_.WriteObject(bucket_name, object_name, gcs::UploadContentLength(content_length));
}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::GetObjectMetadata(const std::string& bucket_name,
                                                                  const std::string& object_name) const
{
    return client_.GetObjectMetadata(bucket_name, object_name);
}

IGCSSDKClient::ReadRangeResult GCSSDKClientImpl::ReadObjectRange(const std::string& bucket_name,
                                                                 const std::string& object_name,
                                                                 std::int64_t begin,
                                                                 std::int64_t end) const
{
    ReadRangeResult result;
    auto reader = client_.ReadObject(bucket_name, object_name, gcs::ReadRange(begin, end));
    if (!reader.status().ok()) {
        result.status = reader.status();
        return result;
    }
    result.content.assign(std::istreambuf_iterator<char>{reader}, {});
    result.status = reader.status();
    return result;
}

Status GCSSDKClientImpl::DeleteObject(const std::string& bucket_name, const std::string& object_name) const {
    return client_.DeleteObject(bucket_name, object_name);
}

Status GCSSDKClientImpl::ListObjectsAndPrefixes(const ListRequest& request, const ListConsumer& consumer) const {
    gcs::Delimiter delimiter;
    if (!request.delimiter.empty()) {
        delimiter = gcs::Delimiter(request.delimiter);
    }
    gcs::StartOffset start_offset;
    if (!request.start_offset.empty()) {
        start_offset = gcs::StartOffset(request.start_offset);
    }
    gcs::MaxResults max_results;
    if (request.max_results > 0) {
        max_results = gcs::MaxResults(request.max_results);
    }

    auto reader = client_.ListObjectsAndPrefixes(
        request.bucket_name, gcs::Prefix(request.prefix), delimiter, start_offset, max_results);
    for (auto&& item : reader) {
        if (!item) {
            return std::move(item).status();
        }
        if (!consumer(*item)) {
            break;
        }
    }
    return Status();
}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::RewriteObject(const std::string& source_bucket,
                                                              const std::string& source_object,
                                                              const std::string& destination_bucket,
                                                              const std::string& destination_object) const
{
    return client_.RewriteObjectBlocking(source_bucket, source_object, destination_bucket, destination_object);
}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::PatchObject(const std::string& bucket_name,
                                                            const std::string& object_name,
                                                            const gcs::ObjectMetadataPatch& patch) const
{
    return client_.PatchObject(bucket_name, object_name, patch);
}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::ComposeObject(const std::string& bucket_name,
                                                              const std::vector<std::string>& sources,
                                                              const std::string& destination) const
{
    std::vector<gcs::ComposeSourceObject> source_objects;
    source_objects.reserve(sources.size());
    for (const auto& name : sources) {
        gcs::ComposeSourceObject source;
        source.object_name = name;
        source_objects.push_back(std::move(source));
    }
    return client_.ComposeObject(bucket_name, std::move(source_objects), destination);
}

} // namespace objfs
