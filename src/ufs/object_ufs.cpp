#include "object_ufs.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include "ufs/multipart_upload_output_stream.hpp"
#include "log.hpp"

namespace objfs {

ObjectUnderFileSystem::ObjectUnderFileSystem(std::shared_ptr<const IObjectStoreClient> client,
                                             const std::string& bucket_name,
                                             const ObjfsConfig& config)
    : client_(std::move(client)),
      bucket_name_(bucket_name),
      config_(config),
      key_mapper_(client_->Scheme(), bucket_name_),
      retry_(RetryStrategy::limited(config.retry_max_attempts,
                                    std::chrono::milliseconds(config.retry_base_sleep_ms),
                                    std::chrono::milliseconds(config.retry_max_sleep_ms))),
      reserved_prefix_(client_->ReservedPrefix()) {}

ObjectUnderFileSystem::~ObjectUnderFileSystem() = default;

ThreadPool& ObjectUnderFileSystem::multipartPool() {
    std::call_once(pool_once_, [this] {
        auto threads = static_cast<std::size_t>(std::max(config_.multipart_upload_threads, 1));
        // Queue bound keeps at most ~2x threads parts in memory
        multipart_pool_ = std::make_unique<ThreadPool>(threads, threads);
        log::debug("Started multipart upload pool with ", threads, " workers");
    });
    return *multipart_pool_;
}

bool ObjectUnderFileSystem::isReservedKey(const std::string& key) const {
    return !reserved_prefix_.empty() && key.compare(0, reserved_prefix_.size(), reserved_prefix_) == 0;
}

bool ObjectUnderFileSystem::isReservedPath(const std::string& path) const {
    return isReservedKey(key_mapper_.toFolderKey(path));
}

UfsStatus ObjectUnderFileSystem::fileStatus(const std::string& name, const ObjectStatus& object) const {
    UfsStatus status;
    status.name = name;
    status.is_directory = false;
    status.size = object.size;
    status.last_modified_ms = object.last_modified_ms;
    status.etag = object.etag;
    status.permissions = getPermissions();
    return status;
}

UfsStatus ObjectUnderFileSystem::directoryStatus(const std::string& name,
                                                 std::optional<std::int64_t> last_modified_ms) const {
    UfsStatus status;
    status.name = name;
    status.is_directory = true;
    status.last_modified_ms = last_modified_ms;
    status.permissions = getPermissions();
    return status;
}

// ==================== Files ====================

StatusOr<std::unique_ptr<ObjectOutputStream>> ObjectUnderFileSystem::create(const std::string& path,
                                                                            const CreateOptions& options) {
    std::string key = key_mapper_.toKey(path);
    if (key.empty()) {
        return Status(StatusCode::kInvalidArgument, "Cannot create a file at the root");
    }
    if (isReservedPath(path)) {
        return Status(StatusCode::kPermissionDenied, "Cannot create " + key + " under the reserved prefix");
    }
    if (options.create_parent) {
        std::string parent = KeyMapper::parentPath(KeyMapper::toPath(key));
        auto created = mkdirs(parent, MkdirsOptions{true});
        if (!created) {
            return created.status();
        }
        if (!*created) {
            return Status(StatusCode::kFailedPrecondition, "Cannot create parent directory " + parent);
        }
    }

    log::debug("Creating ", key, config_.multipart_upload_enabled ? " (multipart)" : "");
    if (config_.multipart_upload_enabled) {
        return std::unique_ptr<ObjectOutputStream>(std::make_unique<MultipartUploadOutputStream>(
            client_, bucket_name_, key, retry_, multipartPool(),
            static_cast<std::size_t>(config_.multipart_partition_size)));
    }
    return std::unique_ptr<ObjectOutputStream>(std::make_unique<BufferedObjectOutputStream>(
        client_, bucket_name_, key, retry_, config_.tmp_dirs));
}

StatusOr<std::unique_ptr<ObjectInputStream>> ObjectUnderFileSystem::open(const std::string& path,
                                                                         const OpenOptions& options) {
    return ObjectInputStream::open(client_, bucket_name_, key_mapper_.toKey(path), options.offset,
                                   retry_, config_.read_chunk_size);
}

std::unique_ptr<ObjectPositionReader> ObjectUnderFileSystem::openPositionRead(const std::string& path,
                                                                              std::int64_t file_length) const {
    return std::make_unique<ObjectPositionReader>(client_, bucket_name_, key_mapper_.toKey(path),
                                                  file_length, retry_, config_.read_chunk_size);
}

bool ObjectUnderFileSystem::deleteFile(const std::string& path) {
    std::string key = key_mapper_.toKey(path);
    if (key.empty()) {
        log::error("Cannot delete the root as a file");
        return false;
    }
    if (isReservedPath(path)) {
        log::error("Cannot delete ", key, " under the reserved prefix");
        return false;
    }
    return deleteObject(key);
}

StatusOr<bool> ObjectUnderFileSystem::renameFile(const std::string& src, const std::string& dst) {
    auto src_is_file = isFile(src);
    if (!src_is_file) {
        return src_is_file.status();
    }
    if (!*src_is_file) {
        log::error("Unable to rename ", src, " to ", dst, " because source does not exist or is a directory");
        return false;
    }
    if (isReservedPath(dst)) {
        log::error("Unable to rename ", src, " to ", dst, " because destination is reserved");
        return false;
    }
    auto dst_exists = exists(dst);
    if (!dst_exists) {
        return dst_exists.status();
    }
    if (*dst_exists) {
        log::error("Unable to rename ", src, " to ", dst, " because destination already exists");
        return false;
    }

    std::string src_key = key_mapper_.toKey(src);
    return copyObject(src_key, key_mapper_.toKey(dst)) && deleteObject(src_key);
}

// ==================== Queries ====================

StatusOr<std::optional<ObjectStatus>> ObjectUnderFileSystem::getObjectStatus(const std::string& key) const {
    if (key.empty()) {
        return std::optional<ObjectStatus>();
    }
    IObjectStoreClient::GetObjectMetadataRequest request;
    request.bucket_name = bucket_name_;
    request.object_name = key;
    auto metadata = retry_.run("GetObjectMetadata", [&] { return client_->GetObjectMetadata(request); });
    if (!metadata) {
        if (metadata.status().code() == StatusCode::kNotFound) {
            return std::optional<ObjectStatus>();
        }
        return metadata.status();
    }
    return std::optional<ObjectStatus>(*std::move(metadata));
}

StatusOr<std::optional<UfsStatus>> ObjectUnderFileSystem::getStatus(const std::string& path) const {
    std::string key = key_mapper_.toKey(path);
    std::string name = KeyMapper::toPath(key);
    if (key.empty()) {
        return std::optional<UfsStatus>(directoryStatus(name, std::nullopt));
    }
    if (isReservedPath(path)) {
        return std::optional<UfsStatus>();
    }

    auto object = getObjectStatus(key);
    if (!object) {
        return object.status();
    }
    if (*object) {
        return std::optional<UfsStatus>(fileStatus(name, **object));
    }

    auto marker = getObjectStatus(key_mapper_.toFolderKey(path));
    if (!marker) {
        return marker.status();
    }
    if (*marker) {
        return std::optional<UfsStatus>(directoryStatus(name, (*marker)->last_modified_ms));
    }

    auto chunk = listChunkForPath(path, true);
    if (!chunk) {
        return chunk.status();
    }
    if (*chunk) {
        return std::optional<UfsStatus>(directoryStatus(name, std::nullopt));
    }
    return std::optional<UfsStatus>();
}

StatusOr<bool> ObjectUnderFileSystem::exists(const std::string& path) const {
    auto file = isFile(path);
    if (!file || *file) {
        return file;
    }
    return isDirectory(path);
}

StatusOr<bool> ObjectUnderFileSystem::isFile(const std::string& path) const {
    if (isReservedPath(path)) {
        return false;
    }
    auto object = getObjectStatus(key_mapper_.toKey(path));
    if (!object) {
        return object.status();
    }
    return object->has_value();
}

StatusOr<bool> ObjectUnderFileSystem::isDirectory(const std::string& path) const {
    // Root is always a folder
    if (key_mapper_.isRoot(path)) {
        return true;
    }
    if (isReservedPath(path)) {
        return false;
    }
    auto marker = getObjectStatus(key_mapper_.toFolderKey(path));
    if (!marker) {
        return marker.status();
    }
    if (*marker) {
        return true;
    }
    auto chunk = listChunkForPath(path, true);
    if (!chunk) {
        return chunk.status();
    }
    return *chunk != nullptr;
}

// ==================== Directories ====================

StatusOr<std::optional<std::vector<UfsStatus>>> ObjectUnderFileSystem::listStatus(
    const std::string& path, const ListOptions& options) const
{
    using Listing = std::optional<std::vector<UfsStatus>>;
    if (isReservedPath(path)) {
        return Listing();
    }

    auto first = listChunkForPath(path, options.recursive);
    if (!first) {
        return first.status();
    }
    std::unique_ptr<ObjectListingChunk> chunk = *std::move(first);
    if (!chunk) {
        // Nothing below the path: an empty marked directory, or not a directory
        auto is_directory = isDirectory(path);
        if (!is_directory) {
            return is_directory.status();
        }
        return *is_directory ? Listing(std::vector<UfsStatus>()) : Listing();
    }

    const std::string prefix = key_mapper_.toFolderKey(path);
    std::map<std::string, UfsStatus> children;
    while (chunk) {
        for (const auto& object : chunk->objectStatuses()) {
            // The directory's own marker
            if (object.key.size() <= prefix.size() || isReservedKey(object.key)) {
                continue;
            }
            std::string child = object.key.substr(prefix.size());

            if (options.recursive) {
                // Report every intermediate directory once
                auto pos = child.find(KeyMapper::kSeparator);
                while (pos != std::string::npos && pos + 1 < child.size()) {
                    std::string parent = child.substr(0, pos);
                    children.emplace(parent, directoryStatus(parent, std::nullopt));
                    pos = child.find(KeyMapper::kSeparator, pos + 1);
                }
            }

            if (KeyMapper::isFolderKey(child)) {
                std::string name = KeyMapper::stripFolderSuffix(child);
                children[name] = directoryStatus(name, object.last_modified_ms);
            } else {
                children.emplace(child, fileStatus(child, object));
            }
        }

        for (const auto& common_prefix : chunk->commonPrefixes()) {
            if (common_prefix.size() <= prefix.size() || isReservedKey(common_prefix)) {
                continue;
            }
            std::string name = KeyMapper::stripFolderSuffix(common_prefix.substr(prefix.size()));
            children.emplace(name, directoryStatus(name, std::nullopt));
        }

        auto next = chunk->nextChunk();
        if (!next) {
            return next.status();
        }
        chunk = *std::move(next);
    }

    std::vector<UfsStatus> result;
    result.reserve(children.size());
    for (auto& entry : children) {
        result.push_back(std::move(entry.second));
    }
    return Listing(std::move(result));
}

StatusOr<bool> ObjectUnderFileSystem::mkdirs(const std::string& path, const MkdirsOptions& options) {
    if (isReservedPath(path)) {
        log::error("Cannot create directory ", path, " under the reserved prefix");
        return false;
    }
    auto is_directory = isDirectory(path);
    if (!is_directory) {
        return is_directory.status();
    }
    if (*is_directory) {
        return true;
    }
    auto is_file = isFile(path);
    if (!is_file) {
        return is_file.status();
    }
    if (*is_file) {
        log::error("Cannot create directory ", path, " because it is already a file");
        return false;
    }

    std::string parent = KeyMapper::parentPath(KeyMapper::toPath(key_mapper_.toKey(path)));
    auto parent_exists = isDirectory(parent);
    if (!parent_exists) {
        return parent_exists.status();
    }
    if (!*parent_exists) {
        if (!options.create_parent) {
            log::error("Cannot create directory ", path, " because parent ", parent, " does not exist");
            return false;
        }
        auto created = mkdirs(parent, options);
        if (!created || !*created) {
            return created;
        }
    }
    return createEmptyObject(key_mapper_.toFolderKey(path));
}

StatusOr<bool> ObjectUnderFileSystem::deleteDirectory(const std::string& path, const DeleteOptions& options) {
    if (key_mapper_.isRoot(path)) {
        log::error("Refusing to delete the root directory");
        return false;
    }
    const std::string folder_key = key_mapper_.toFolderKey(path);

    if (!options.recursive) {
        auto children = listStatus(path);
        if (!children) {
            return children.status();
        }
        if (!*children) {
            log::error("Unable to delete ", path, " because it is not a directory");
            return false;
        }
        if (!(*children)->empty()) {
            log::error("Unable to delete ", path, " because it is a non empty directory. "
                       "Specify recursive as true in order to delete non empty directories.");
            return false;
        }
        return deleteObject(folder_key);
    }

    auto is_directory = isDirectory(path);
    if (!is_directory) {
        return is_directory.status();
    }
    if (!*is_directory) {
        log::error("Unable to delete ", path, " because it is not a directory");
        return false;
    }

    std::vector<std::string> keys;
    auto first = getObjectListingChunk(folder_key, true);
    if (!first) {
        return first.status();
    }
    std::unique_ptr<ObjectListingChunk> chunk = *std::move(first);
    while (chunk) {
        for (const auto& object : chunk->objectStatuses()) {
            if (!isReservedKey(object.key)) {
                keys.push_back(object.key);
            }
        }
        auto next = chunk->nextChunk();
        if (!next) {
            return next.status();
        }
        chunk = *std::move(next);
    }

    auto deleted = deleteObjects(keys);
    if (!deleted) {
        return deleted.status();
    }
    if (deleted->size() != keys.size()) {
        log::error("Deleted only ", deleted->size(), " of ", keys.size(), " objects under ", path);
        return false;
    }
    // Usually already listed; absent markers delete successfully
    return deleteObject(folder_key);
}

StatusOr<bool> ObjectUnderFileSystem::renameDirectory(const std::string& src, const std::string& dst) {
    const std::string src_folder = key_mapper_.toFolderKey(src);
    const std::string dst_folder = key_mapper_.toFolderKey(dst);
    if (src_folder.empty() || dst_folder.empty() || dst_folder.compare(0, src_folder.size(), src_folder) == 0) {
        log::error("Unable to rename ", src, " to ", dst, ": cannot move the root or into itself");
        return false;
    }
    if (isReservedPath(dst)) {
        log::error("Unable to rename ", src, " to ", dst, " because destination is reserved");
        return false;
    }

    auto children = listStatus(src);
    if (!children) {
        return children.status();
    }
    if (!*children) {
        log::error("Unable to rename ", src, " to ", dst, " because source does not exist or is a file");
        return false;
    }
    auto dst_exists = exists(dst);
    if (!dst_exists) {
        return dst_exists.status();
    }
    if (*dst_exists) {
        log::error("Unable to rename ", src, " to ", dst, " because destination already exists");
        return false;
    }

    // Rename the source folder marker first, if it has one
    auto marker = getObjectStatus(src_folder);
    if (!marker) {
        return marker.status();
    }
    if (*marker && !copyObject(src_folder, dst_folder)) {
        return false;
    }

    // Rename each child in the src folder to destination/child
    for (const auto& child : **children) {
        std::string child_src = KeyMapper::join(src, child.name);
        std::string child_dst = KeyMapper::join(dst, child.name);
        auto renamed = child.is_directory ? renameDirectory(child_src, child_dst)
                                          : renameFile(child_src, child_dst);
        if (!renamed) {
            return renamed.status();
        }
        if (!*renamed) {
            log::error("Failed to rename path ", child_src, " to ", child_dst);
            return false;
        }
    }

    // An unmarked source disappears with its last child
    auto remaining = isDirectory(src);
    if (!remaining) {
        return remaining.status();
    }
    if (!*remaining) {
        return true;
    }
    // Delete src and everything under src
    return deleteDirectory(src, DeleteOptions{true});
}

// ==================== Object primitives ====================

StatusOr<std::unique_ptr<ObjectListingChunk>> ObjectUnderFileSystem::getObjectListingChunk(
    const std::string& key, bool recursive) const
{
    IObjectStoreClient::ListObjectsRequest request;
    request.bucket_name = bucket_name_;
    // Root lists with the empty prefix, never a bare separator
    request.prefix = KeyMapper::isFolderKey(key) || key.empty() ? key : key + KeyMapper::kFolderSuffix;
    request.delimiter = recursive ? "" : KeyMapper::kFolderSuffix;
    request.max_results = config_.listing_chunk_length;

    auto chunk = retry_.run("ListObjects", [&] { return ObjectListingChunk::list(client_, request); });
    if (!chunk) {
        log::error("Failed to list path ", request.prefix, ": ", chunk.status().message());
    }
    return chunk;
}

StatusOr<std::unique_ptr<ObjectListingChunk>> ObjectUnderFileSystem::listChunkForPath(
    const std::string& path, bool recursive) const
{
    auto chunk = getObjectListingChunk(key_mapper_.toFolderKey(path), recursive);
    if (!chunk) {
        return chunk.status();
    }
    if ((*chunk)->empty() && !(*chunk)->hasNextChunk()) {
        return std::unique_ptr<ObjectListingChunk>();
    }
    return chunk;
}

bool ObjectUnderFileSystem::createEmptyObject(const std::string& key) {
    auto status = retry_.run("PutObject", [&] {
        std::istringstream empty;
        IObjectStoreClient::PutObjectRequest request;
        request.bucket_name = bucket_name_;
        request.object_name = key;
        request.body = &empty;
        request.content_length = 0;
        return client_->PutObject(request);
    });
    if (!status.ok()) {
        log::error("Failed to create object ", key, ": ", status.message());
        return false;
    }
    return true;
}

bool ObjectUnderFileSystem::deleteObject(const std::string& key) {
    IObjectStoreClient::DeleteObjectRequest request;
    request.bucket_name = bucket_name_;
    request.object_name = key;
    auto status = retry_.run("DeleteObject", [&] { return client_->DeleteObject(request); });
    if (!status.ok()) {
        log::error("Failed to delete ", key, ": ", status.message());
        return false;
    }
    return true;
}

StatusOr<std::vector<std::string>> ObjectUnderFileSystem::deleteObjects(const std::vector<std::string>& keys) {
    std::vector<std::string> deleted;
    const std::size_t batch_size = std::max<std::size_t>(client_->MaxDeleteBatchSize(), 1);

    for (std::size_t begin = 0; begin < keys.size(); begin += batch_size) {
        std::size_t end = std::min(keys.size(), begin + batch_size);
        IObjectStoreClient::DeleteObjectsRequest request;
        request.bucket_name = bucket_name_;
        request.object_names.assign(keys.begin() + static_cast<std::ptrdiff_t>(begin),
                                    keys.begin() + static_cast<std::ptrdiff_t>(end));

        auto result = retry_.run("DeleteObjects", [&] { return client_->DeleteObjects(request); });
        if (!result) {
            log::warn("Failed to delete objects: ", result.status().message());
            return result.status();
        }
        deleted.insert(deleted.end(), result->begin(), result->end());
    }
    return deleted;
}

bool ObjectUnderFileSystem::copyObject(const std::string& src, const std::string& dst) {
    log::debug("Copying ", src, " to ", dst);
    IObjectStoreClient::CopyObjectRequest request;
    request.source_bucket = bucket_name_;
    request.source_object = src;
    request.destination_bucket = bucket_name_;
    request.destination_object = dst;
    auto status = retry_.run("CopyObject", [&] { return client_->CopyObject(request); });
    if (!status.ok()) {
        log::error("Failed to copy ", src, " to ", dst, ": ", status.message());
        return false;
    }
    return true;
}

// ==================== Tags and permissions ====================

Status ObjectUnderFileSystem::setObjectTag(const std::string& path, const std::string& name,
                                           const std::string& value) {
    std::string key = key_mapper_.toKey(path);

    IObjectStoreClient::GetObjectTagsRequest get_request;
    get_request.bucket_name = bucket_name_;
    get_request.object_name = key;
    auto tags = retry_.run("GetObjectTags", [&] { return client_->GetObjectTags(get_request); });
    if (!tags) {
        return tags.status();
    }

    // Read-modify-write; the last writer wins on conflict
    bool match_found = false;
    for (auto& tag : *tags) {
        if (tag.name == name) {
            tag.value = value;
            match_found = true;
        }
    }
    if (!match_found) {
        tags->push_back(ObjectTag{name, value});
    }

    IObjectStoreClient::SetObjectTagsRequest set_request;
    set_request.bucket_name = bucket_name_;
    set_request.object_name = key;
    set_request.tags = *std::move(tags);
    return retry_.run("SetObjectTags", [&] { return client_->SetObjectTags(set_request); });
}

StatusOr<std::optional<TagSet>> ObjectUnderFileSystem::getObjectTags(const std::string& path) const {
    IObjectStoreClient::GetObjectTagsRequest request;
    request.bucket_name = bucket_name_;
    request.object_name = key_mapper_.toKey(path);
    auto tags = retry_.run("GetObjectTags", [&] { return client_->GetObjectTags(request); });
    if (!tags) {
        if (tags.status().code() == StatusCode::kNotFound) {
            return std::optional<TagSet>();
        }
        return tags.status();
    }
    TagSet result;
    for (const auto& tag : *tags) {
        result[tag.name] = tag.value;
    }
    return std::optional<TagSet>(std::move(result));
}

void ObjectUnderFileSystem::setOwner(const std::string&, const std::string&, const std::string&) {}

void ObjectUnderFileSystem::setMode(const std::string&, unsigned int) {}

ObjectPermissions ObjectUnderFileSystem::getPermissions() const {
    return client_->Permissions().value_or(ObjectPermissions());
}

} // namespace objfs
