#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "store/object_store_client.hpp"
#include "store/retry.hpp"
#include "ufs/key_mapper.hpp"
#include "ufs/object_input_stream.hpp"
#include "ufs/object_listing_chunk.hpp"
#include "ufs/object_output_stream.hpp"
#include "util/thread_pool.hpp"

namespace objfs {

/**
 * UfsStatus - File or directory as the filesystem layer reports it
 *
 * name is relative to the listed directory for listStatus() and the full
 * path for getStatus().
 */
struct UfsStatus {
    std::string name;
    bool is_directory = false;
    std::int64_t size = 0;
    std::optional<std::int64_t> last_modified_ms;
    std::optional<std::string> etag;
    ObjectPermissions permissions;
};

struct CreateOptions {
    bool create_parent = false;
};

struct OpenOptions {
    std::int64_t offset = 0;
};

struct ListOptions {
    bool recursive = false;
};

struct MkdirsOptions {
    bool create_parent = true;
};

struct DeleteOptions {
    bool recursive = false;
};

/**
 * ObjectUnderFileSystem - Hierarchical filesystem over a flat object store
 *
 * Directories exist either explicitly, as a zero-length folder marker
 * ("dir/"), or implicitly, when some key lives under "dir/". Renames are
 * copy + delete of every member key and are not atomic.
 *
 * Keys under the store's reserved prefix are invisible: they are never
 * listed or stat'ed, and cannot be created, deleted or renamed onto.
 *
 * Calls run on the caller's thread. The only internal parallelism is the
 * multipart upload pool, created on first multipart write and shared by all
 * streams of this instance. Output streams must be closed or destroyed before
 * the instance that created them.
 */
class ObjectUnderFileSystem {
public:
    ObjectUnderFileSystem(std::shared_ptr<const IObjectStoreClient> client,
                          const std::string& bucket_name,
                          const ObjfsConfig& config);
    ~ObjectUnderFileSystem();

    ObjectUnderFileSystem(const ObjectUnderFileSystem&) = delete;
    ObjectUnderFileSystem& operator=(const ObjectUnderFileSystem&) = delete;

    // ==================== Files ====================

    StatusOr<std::unique_ptr<ObjectOutputStream>> create(const std::string& path,
                                                         const CreateOptions& options = {});

    StatusOr<std::unique_ptr<ObjectInputStream>> open(const std::string& path,
                                                      const OpenOptions& options = {});

    std::unique_ptr<ObjectPositionReader> openPositionRead(const std::string& path,
                                                           std::int64_t file_length) const;

    bool deleteFile(const std::string& path);

    StatusOr<bool> renameFile(const std::string& src, const std::string& dst);

    // ==================== Queries ====================

    StatusOr<std::optional<UfsStatus>> getStatus(const std::string& path) const;

    // Stat of one raw key; nullopt when absent
    StatusOr<std::optional<ObjectStatus>> getObjectStatus(const std::string& key) const;

    StatusOr<bool> exists(const std::string& path) const;

    StatusOr<bool> isFile(const std::string& path) const;

    /**
     * True for the root, for a path with a folder marker, or for a path with
     * at least one key below it
     */
    StatusOr<bool> isDirectory(const std::string& path) const;

    // ==================== Directories ====================

    /**
     * List the children of a directory, sorted by name
     *
     * @return nullopt when path is not a directory
     */
    StatusOr<std::optional<std::vector<UfsStatus>>> listStatus(const std::string& path,
                                                               const ListOptions& options = {}) const;

    StatusOr<bool> mkdirs(const std::string& path, const MkdirsOptions& options = {});

    StatusOr<bool> deleteDirectory(const std::string& path, const DeleteOptions& options = {});

    StatusOr<bool> renameDirectory(const std::string& src, const std::string& dst);

    // ==================== Object primitives ====================

    StatusOr<std::unique_ptr<ObjectListingChunk>> getObjectListingChunk(const std::string& key,
                                                                        bool recursive) const;

    // First chunk under the path's folder key, nullptr when nothing is there
    StatusOr<std::unique_ptr<ObjectListingChunk>> listChunkForPath(const std::string& path,
                                                                   bool recursive) const;

    bool createEmptyObject(const std::string& key);

    bool deleteObject(const std::string& key);

    /**
     * Delete keys in batches of the store's limit
     * @return The keys the store confirmed; a failed batch fails the call
     */
    StatusOr<std::vector<std::string>> deleteObjects(const std::vector<std::string>& keys);

    bool copyObject(const std::string& src, const std::string& dst);

    // ==================== Tags and permissions ====================

    /**
     * Set one tag, keeping the others
     *
     * Read-modify-write without compare-and-swap: concurrent writers to the
     * same object can lose updates.
     */
    Status setObjectTag(const std::string& path, const std::string& name, const std::string& value);

    // nullopt when the object does not exist
    StatusOr<std::optional<TagSet>> getObjectTags(const std::string& path) const;

    // No ACL integration, no-ops
    void setOwner(const std::string& path, const std::string& user, const std::string& group);
    void setMode(const std::string& path, unsigned int mode);

    ObjectPermissions getPermissions() const;

    const KeyMapper& keyMapper() const { return key_mapper_; }
    const std::string& bucketName() const { return bucket_name_; }
    const RetryStrategy& retryStrategy() const { return retry_; }

private:
    ThreadPool& multipartPool();

    bool isReservedKey(const std::string& key) const;
    // Also true for the reserved directory itself
    bool isReservedPath(const std::string& path) const;

    UfsStatus fileStatus(const std::string& name, const ObjectStatus& object) const;
    UfsStatus directoryStatus(const std::string& name, std::optional<std::int64_t> last_modified_ms) const;

    std::shared_ptr<const IObjectStoreClient> client_;
    std::string bucket_name_;
    ObjfsConfig config_;
    KeyMapper key_mapper_;
    RetryStrategy retry_;
    std::string reserved_prefix_;

    std::once_flag pool_once_;
    std::unique_ptr<ThreadPool> multipart_pool_;
};

} // namespace objfs
