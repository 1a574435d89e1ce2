// objfs FUSE filesystem class implementation

#include "objfs.hpp"
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fuse_log.h>
#include <sys/stat.h>
#include <unistd.h>
#include "log.hpp"

#ifndef RENAME_NOREPLACE
#define RENAME_NOREPLACE (1 << 0)
#endif


using objfs::Status;
using objfs::StatusCode;

namespace {
    const std::string kXattrPrefix = "user.";

    int toErrno(const Status& status) {
        switch (status.code()) {
            case StatusCode::kOk:                 return 0;
            case StatusCode::kNotFound:           return ENOENT;
            case StatusCode::kAlreadyExists:      return EEXIST;
            case StatusCode::kPermissionDenied:
            case StatusCode::kUnauthenticated:    return EACCES;
            case StatusCode::kInvalidArgument:
            case StatusCode::kOutOfRange:         return EINVAL;
            case StatusCode::kUnimplemented:      return ENOTSUP;
            case StatusCode::kCancelled:          return ECANCELED;
            case StatusCode::kResourceExhausted:  return EAGAIN;
            case StatusCode::kDeadlineExceeded:   return ETIMEDOUT;
            default:                              return EIO;
        }
    }

    // Log a failed store call and turn it into a negative errno
    int fail(const char* op, const char* path, const Status& status) {
        int err = toErrno(status);
        if (err == ENOENT) {
            objfs::log::debug(op, " ", path, ": ", status.message());
        } else {
            objfs::log::error(op, " ", path, " failed: ", status.message());
        }
        return -err;
    }

    void fuseLog(enum fuse_log_level level, const char *fmt, va_list ap) {
        const char* level_str = "UNKNOWN";
        switch (level) {
            case FUSE_LOG_EMERG:   level_str = "EMERG"; break;
            case FUSE_LOG_ALERT:   level_str = "ALERT"; break;
            case FUSE_LOG_CRIT:    level_str = "CRIT"; break;
            case FUSE_LOG_ERR:     level_str = "ERR"; break;
            case FUSE_LOG_WARNING: level_str = "WARNING"; break;
            case FUSE_LOG_NOTICE:  level_str = "NOTICE"; break;
            case FUSE_LOG_INFO:    level_str = "INFO"; break;
            case FUSE_LOG_DEBUG:   level_str = "DEBUG"; break;
        }
        char message[1024];
        std::vsnprintf(message, sizeof(message), fmt, ap);
        std::string text(message);
        while (!text.empty() && text.back() == '\n') {
            text.pop_back();
        }
        if (level <= FUSE_LOG_ERR) {
            objfs::log::error("[FUSE-", level_str, "] ", text);
        } else {
            objfs::log::debug("[FUSE-", level_str, "] ", text);
        }
    }
}  // End anonymous namespace

ObjFS::ObjFS(std::unique_ptr<objfs::ObjectUnderFileSystem> ufs, const ObjfsConfig& config)
    : ufs_(std::move(ufs)),
      config_(config)
{
    if (config_.debug_mode || config_.verbose_logging) {
        fuse_set_log_func(fuseLog);
    }

    objfs::log::info("Initializing objfs for bucket: ", ufs_->bucketName());
    objfs::log::debug("Store root: ", ufs_->keyMapper().rootKey());
    objfs::log::debug("Multipart upload: ", config_.multipart_upload_enabled ? "enabled" : "disabled");
    if (config_.multipart_upload_enabled) {
        objfs::log::debug("Multipart threads: ", config_.multipart_upload_threads,
                   ", partition size: ", config_.multipart_partition_size, " bytes");
    }
    objfs::log::debug("Read chunk size: ", config_.read_chunk_size, " bytes");
}

ObjFS* ObjFS::this_()
{
    return static_cast<ObjFS*>(fuse_get_context()->private_data);
}

const struct fuse_operations& ObjFS::operations()
{
    static const struct fuse_operations ops = [] {
        struct fuse_operations o;
        std::memset(&o, 0, sizeof(o));
        o.init = init;
        o.getattr = getattr;
        o.readdir = readdir;
        o.mkdir = mkdir;
        o.rmdir = rmdir;
        o.unlink = unlink;
        o.rename = rename;
        o.chmod = chmod;
        o.chown = chown;
        o.utimens = utimens;
        o.create = create;
        o.open = open;
        o.read = read;
        o.write = write;
        o.truncate = truncate;
        o.flush = flush;
        o.release = release;
        o.setxattr = setxattr;
        o.getxattr = getxattr;
        o.listxattr = listxattr;
        return o;
    }();
    return ops;
}

int ObjFS::run(int argc, char **argv)
{
    return fuse_main(argc, argv, &operations(), this);
}

void* ObjFS::init(struct fuse_conn_info *conn, struct fuse_config *cfg)
{
    const auto ptr = this_();

    // Object sizes change behind the kernel's back
    cfg->kernel_cache = 0;
    cfg->hard_remove = 1;

    objfs::log::debug("FUSE connection: max_write=", conn->max_write, ", max_readahead=", conn->max_readahead);
    return ptr;
}

// ==================== Handle table ====================

std::uint64_t ObjFS::registerFile(std::shared_ptr<OpenFile> file)
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    std::uint64_t handle = next_handle_++;
    if (file->writer) {
        pending_writes_[file->path] = file;
    }
    open_files_.emplace(handle, std::move(file));
    return handle;
}

std::shared_ptr<ObjFS::OpenFile> ObjFS::lookupFile(std::uint64_t handle) const
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    auto it = open_files_.find(handle);
    return it == open_files_.end() ? nullptr : it->second;
}

std::shared_ptr<ObjFS::OpenFile> ObjFS::removeFile(std::uint64_t handle)
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    auto it = open_files_.find(handle);
    if (it == open_files_.end()) {
        return nullptr;
    }
    auto file = it->second;
    open_files_.erase(it);
    auto pending = pending_writes_.find(file->path);
    if (pending != pending_writes_.end() && pending->second == file) {
        pending_writes_.erase(pending);
    }
    return file;
}

std::shared_ptr<ObjFS::OpenFile> ObjFS::pendingWrite(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    auto it = pending_writes_.find(path);
    return it == pending_writes_.end() ? nullptr : it->second;
}

void ObjFS::fillStat(const objfs::UfsStatus& status, struct stat *stbuf) const
{
    std::memset(stbuf, 0, sizeof(struct stat));
    const unsigned int mode = status.permissions.mode;
    if (status.is_directory) {
        stbuf->st_mode = S_IFDIR | (mode & 0777);
        stbuf->st_nlink = 2;
    } else {
        stbuf->st_mode = S_IFREG | (mode & 0666);
        stbuf->st_nlink = 1;
        stbuf->st_size = static_cast<off_t>(status.size);
    }
    stbuf->st_uid = getuid();
    stbuf->st_gid = getgid();
    if (status.last_modified_ms) {
        stbuf->st_mtime = static_cast<time_t>(*status.last_modified_ms / 1000);
        stbuf->st_ctime = stbuf->st_mtime;
    }
}

// ==================== Metadata Operations ====================

int ObjFS::getattr(const char *path, struct stat *stbuf, struct fuse_file_info *)
{
    const auto ptr = this_();

    // 1. Files still being written exist only locally
    if (auto pending = ptr->pendingWrite(objfs::KeyMapper::normalizePath(path))) {
        std::memset(stbuf, 0, sizeof(struct stat));
        stbuf->st_mode = S_IFREG | 0644;
        stbuf->st_nlink = 1;
        stbuf->st_uid = getuid();
        stbuf->st_gid = getgid();
        std::lock_guard<std::mutex> lock(pending->mutex);
        stbuf->st_size = pending->writer ? static_cast<off_t>(pending->writer->bytesWritten()) : 0;
        stbuf->st_mtime = time(nullptr);
        return 0;
    }

    // 2. Committed objects and directories
    auto status = ptr->ufs_->getStatus(path);
    if (!status) {
        return fail("getattr", path, status.status());
    }
    if (!status->has_value()) {
        return -ENOENT;
    }
    ptr->fillStat(**status, stbuf);
    return 0;
}

int ObjFS::readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                   off_t, struct fuse_file_info *, enum fuse_readdir_flags)
{
    const auto ptr = this_();
    objfs::log::debug("Listing directory: ", path);

    auto listing = ptr->ufs_->listStatus(path);
    if (!listing) {
        return fail("readdir", path, listing.status());
    }
    if (!listing->has_value()) {
        return -ENOENT;
    }

    filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    for (const auto& child : **listing) {
        struct stat st;
        ptr->fillStat(child, &st);
        if (filler(buf, child.name.c_str(), &st, 0, FUSE_FILL_DIR_PLUS) != 0) {
            break;
        }
    }
    return 0;
}

int ObjFS::mkdir(const char *path, mode_t)
{
    const auto ptr = this_();

    auto exists = ptr->ufs_->exists(path);
    if (!exists) {
        return fail("mkdir", path, exists.status());
    }
    if (*exists) {
        return -EEXIST;
    }

    auto created = ptr->ufs_->mkdirs(path, objfs::MkdirsOptions{false});
    if (!created) {
        return fail("mkdir", path, created.status());
    }
    return *created ? 0 : -EIO;
}

int ObjFS::rmdir(const char *path)
{
    const auto ptr = this_();

    if (ptr->ufs_->keyMapper().isRoot(path)) {
        return -EBUSY;
    }
    auto children = ptr->ufs_->listStatus(path);
    if (!children) {
        return fail("rmdir", path, children.status());
    }
    if (!children->has_value()) {
        auto is_file = ptr->ufs_->isFile(path);
        return is_file.ok() && *is_file ? -ENOTDIR : -ENOENT;
    }
    if (!(*children)->empty()) {
        return -ENOTEMPTY;
    }

    auto deleted = ptr->ufs_->deleteDirectory(path);
    if (!deleted) {
        return fail("rmdir", path, deleted.status());
    }
    return *deleted ? 0 : -EIO;
}

int ObjFS::unlink(const char *path)
{
    const auto ptr = this_();

    auto is_file = ptr->ufs_->isFile(path);
    if (!is_file) {
        return fail("unlink", path, is_file.status());
    }
    if (!*is_file) {
        return -ENOENT;
    }
    return ptr->ufs_->deleteFile(path) ? 0 : -EIO;
}

int ObjFS::rename(const char *from, const char *to, unsigned int flags)
{
    const auto ptr = this_();
    auto& ufs = *ptr->ufs_;

    if (flags & ~static_cast<unsigned int>(RENAME_NOREPLACE)) {
        return -EINVAL;
    }
    objfs::log::debug("Renaming ", from, " to ", to);

    auto src = ufs.getStatus(from);
    if (!src) {
        return fail("rename", from, src.status());
    }
    if (!src->has_value()) {
        return -ENOENT;
    }
    auto dst = ufs.getStatus(to);
    if (!dst) {
        return fail("rename", to, dst.status());
    }

    // Replace an existing destination the way POSIX rename does
    if (dst->has_value()) {
        if (flags & RENAME_NOREPLACE) {
            return -EEXIST;
        }
        const bool src_is_dir = (*src)->is_directory;
        const bool dst_is_dir = (*dst)->is_directory;
        if (src_is_dir && !dst_is_dir) {
            return -ENOTDIR;
        }
        if (!src_is_dir && dst_is_dir) {
            return -EISDIR;
        }
        if (dst_is_dir) {
            auto removed = ufs.deleteDirectory(to);
            if (!removed) {
                return fail("rename", to, removed.status());
            }
            if (!*removed) {
                return -ENOTEMPTY;
            }
        } else if (!ufs.deleteFile(to)) {
            return -EIO;
        }
    }

    auto renamed = (*src)->is_directory ? ufs.renameDirectory(from, to) : ufs.renameFile(from, to);
    if (!renamed) {
        return fail("rename", from, renamed.status());
    }
    return *renamed ? 0 : -EIO;
}

int ObjFS::chmod(const char *path, mode_t mode, struct fuse_file_info *)
{
    this_()->ufs_->setMode(path, mode);
    return 0;
}

int ObjFS::chown(const char *path, uid_t uid, gid_t gid, struct fuse_file_info *)
{
    this_()->ufs_->setOwner(path, std::to_string(uid), std::to_string(gid));
    return 0;
}

int ObjFS::utimens(const char *, const struct timespec *, struct fuse_file_info *)
{
    // Modification time is owned by the store
    return 0;
}

// ==================== Data Operations ====================

int ObjFS::openWriter(const char *path, struct fuse_file_info *fi)
{
    auto stream = ufs_->create(path);
    if (!stream) {
        return fail("create", path, stream.status());
    }
    auto file = std::make_shared<OpenFile>();
    file->path = objfs::KeyMapper::normalizePath(path);
    file->writer = *std::move(stream);
    fi->fh = registerFile(std::move(file));
    fi->direct_io = 1;
    return 0;
}

int ObjFS::create(const char *path, mode_t, struct fuse_file_info *fi)
{
    objfs::log::debug("Creating file: ", path);
    return this_()->openWriter(path, fi);
}

int ObjFS::open(const char *path, struct fuse_file_info *fi)
{
    const auto ptr = this_();

    auto status = ptr->ufs_->getStatus(path);
    if (!status) {
        return fail("open", path, status.status());
    }
    if (!status->has_value()) {
        return -ENOENT;
    }
    if ((*status)->is_directory) {
        return -EISDIR;
    }

    int access = fi->flags & O_ACCMODE;
    if (access == O_WRONLY || access == O_RDWR) {
        // Objects are immutable: only whole rewrites are possible
        if (!(fi->flags & O_TRUNC) && (*status)->size != 0) {
            objfs::log::warn("Cannot open ", path, " for in-place modification");
            return -ENOTSUP;
        }
        if (fi->flags & O_APPEND) {
            return -ENOTSUP;
        }
        return ptr->openWriter(path, fi);
    }

    auto file = std::make_shared<OpenFile>();
    file->path = objfs::KeyMapper::normalizePath(path);
    file->reader = ptr->ufs_->openPositionRead(path, (*status)->size);
    fi->fh = ptr->registerFile(std::move(file));
    return 0;
}

int ObjFS::read(const char *path, char *buf, size_t size, off_t offset,
                struct fuse_file_info *fi)
{
    const auto ptr = this_();

    auto file = ptr->lookupFile(fi->fh);
    if (!file || !file->reader) {
        return -EBADF;
    }
    auto n = file->reader->read(offset, buf, size);
    if (!n) {
        return fail("read", path, n.status());
    }
    return static_cast<int>(*n);
}

int ObjFS::write(const char *path, const char *buf, size_t size, off_t offset,
                 struct fuse_file_info *fi)
{
    const auto ptr = this_();

    auto file = ptr->lookupFile(fi->fh);
    if (!file || !file->writer) {
        return -EBADF;
    }
    std::lock_guard<std::mutex> lock(file->mutex);
    if (offset != file->writer->bytesWritten()) {
        objfs::log::warn("Non-sequential write to ", path, " at offset ", offset,
                  " (expected ", file->writer->bytesWritten(), ")");
        return -ENOTSUP;
    }
    auto status = file->writer->write(buf, size);
    if (!status.ok()) {
        return fail("write", path, status);
    }
    return static_cast<int>(size);
}

int ObjFS::recreateEmpty(const std::string& path)
{
    auto stream = ufs_->create(path);
    if (!stream) {
        return fail("truncate", path.c_str(), stream.status());
    }
    auto status = (*stream)->close();
    if (!status.ok()) {
        return fail("truncate", path.c_str(), status);
    }
    return 0;
}

int ObjFS::truncate(const char *path, off_t size, struct fuse_file_info *fi)
{
    const auto ptr = this_();

    std::shared_ptr<OpenFile> file = fi != nullptr ? ptr->lookupFile(fi->fh) : nullptr;
    if (!file || !file->writer) {
        file = ptr->pendingWrite(objfs::KeyMapper::normalizePath(path));
    }
    if (file && file->writer) {
        std::lock_guard<std::mutex> lock(file->mutex);
        return size == file->writer->bytesWritten() ? 0 : -ENOTSUP;
    }

    auto status = ptr->ufs_->getStatus(path);
    if (!status) {
        return fail("truncate", path, status.status());
    }
    if (!status->has_value()) {
        return -ENOENT;
    }
    if ((*status)->is_directory) {
        return -EISDIR;
    }
    if ((*status)->size == size) {
        return 0;
    }
    if (size != 0) {
        return -ENOTSUP;
    }
    return ptr->recreateEmpty(path);
}

int ObjFS::flush(const char *path, struct fuse_file_info *fi)
{
    const auto ptr = this_();

    auto file = ptr->lookupFile(fi->fh);
    if (!file || !file->writer) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(file->mutex);
    auto status = file->writer->flush();
    return status.ok() ? 0 : fail("flush", path, status);
}

int ObjFS::release(const char *path, struct fuse_file_info *fi)
{
    const auto ptr = this_();

    auto file = ptr->removeFile(fi->fh);
    if (!file || !file->writer) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(file->mutex);
    objfs::log::debug("Committing ", path, " (", file->writer->bytesWritten(), " bytes)");
    auto status = file->writer->close();
    if (!status.ok()) {
        return fail("release", path, status);
    }
    return 0;
}

// ==================== Extended Attributes ====================

int ObjFS::setxattr(const char *path, const char *name, const char *value, size_t size, int)
{
    const auto ptr = this_();

    std::string attr = name;
    if (attr.compare(0, kXattrPrefix.size(), kXattrPrefix) != 0 || attr.size() == kXattrPrefix.size()) {
        return -ENOTSUP;
    }
    auto status = ptr->ufs_->setObjectTag(path, attr.substr(kXattrPrefix.size()), std::string(value, size));
    return status.ok() ? 0 : fail("setxattr", path, status);
}

int ObjFS::getxattr(const char *path, const char *name, char *value, size_t size)
{
    const auto ptr = this_();

    std::string attr = name;
    if (attr.compare(0, kXattrPrefix.size(), kXattrPrefix) != 0) {
        return -ENODATA;
    }
    auto tags = ptr->ufs_->getObjectTags(path);
    if (!tags) {
        return fail("getxattr", path, tags.status());
    }
    if (!tags->has_value()) {
        return -ENODATA;
    }
    auto it = (*tags)->find(attr.substr(kXattrPrefix.size()));
    if (it == (*tags)->end()) {
        return -ENODATA;
    }

    const std::string& data = it->second;
    if (size == 0) {
        return static_cast<int>(data.size());
    }
    if (size < data.size()) {
        return -ERANGE;
    }
    std::memcpy(value, data.data(), data.size());
    return static_cast<int>(data.size());
}

int ObjFS::listxattr(const char *path, char *list, size_t size)
{
    const auto ptr = this_();

    auto tags = ptr->ufs_->getObjectTags(path);
    if (!tags) {
        return fail("listxattr", path, tags.status());
    }

    std::string names;
    if (tags->has_value()) {
        for (const auto& tag : **tags) {
            names += kXattrPrefix + tag.first;
            names.push_back('\0');
        }
    }
    if (size == 0) {
        return static_cast<int>(names.size());
    }
    if (size < names.size()) {
        return -ERANGE;
    }
    std::memcpy(list, names.data(), names.size());
    return static_cast<int>(names.size());
}
