// objfs FUSE filesystem class definition

#pragma once

#ifndef FUSE_USE_VERSION
#define FUSE_USE_VERSION 35
#endif

#include <fuse.h>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "config.hpp"
#include "ufs/object_ufs.hpp"

/**
 * ObjFS - A FUSE filesystem over an object store bucket
 *
 * Directories follow the folder-marker model of ObjectUnderFileSystem.
 * Reads are positional ranged GETs. Writes are sequential only: a file is
 * written from offset 0 to the end and becomes visible when its handle is
 * released. Object tags are exposed as "user.*" extended attributes.
 */
class ObjFS
{
public:
    ObjFS(std::unique_ptr<objfs::ObjectUnderFileSystem> ufs, const ObjfsConfig& config);
    ~ObjFS() = default;

    ObjFS(const ObjFS&) = delete;
    ObjFS& operator=(const ObjFS&) = delete;

    int run(int argc, char **argv);

    static void* init(struct fuse_conn_info *conn, struct fuse_config *cfg);

    // FUSE operations - metadata
    static int getattr(const char *path, struct stat *stbuf, struct fuse_file_info *fi);
    static int readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                       off_t offset, struct fuse_file_info *fi,
                       enum fuse_readdir_flags);
    static int mkdir(const char *path, mode_t mode);
    static int rmdir(const char *path);
    static int unlink(const char *path);
    static int rename(const char *from, const char *to, unsigned int flags);
    static int chmod(const char *path, mode_t mode, struct fuse_file_info *fi);
    static int chown(const char *path, uid_t uid, gid_t gid, struct fuse_file_info *fi);
    static int utimens(const char *path, const struct timespec tv[2], struct fuse_file_info *fi);

    // FUSE operations - data
    static int create(const char *path, mode_t mode, struct fuse_file_info *fi);
    static int open(const char *path, struct fuse_file_info *fi);
    static int read(const char *path, char *buf, size_t size, off_t offset,
                    struct fuse_file_info *fi);
    static int write(const char *path, const char *buf, size_t size, off_t offset,
                     struct fuse_file_info *fi);
    static int truncate(const char *path, off_t size, struct fuse_file_info *fi);
    static int flush(const char *path, struct fuse_file_info *fi);
    static int release(const char *path, struct fuse_file_info *fi);

    // FUSE operations - tags as extended attributes
    static int setxattr(const char *path, const char *name, const char *value,
                        size_t size, int flags);
    static int getxattr(const char *path, const char *name, char *value, size_t size);
    static int listxattr(const char *path, char *list, size_t size);

    objfs::ObjectUnderFileSystem& ufs() { return *ufs_; }

private:
    // One open handle: a reader or a sequential writer
    struct OpenFile {
        std::string path;
        std::unique_ptr<objfs::ObjectPositionReader> reader;
        std::unique_ptr<objfs::ObjectOutputStream> writer;
        std::mutex mutex;
    };

    static ObjFS* this_();
    static const struct fuse_operations& operations();

    std::uint64_t registerFile(std::shared_ptr<OpenFile> file);
    std::shared_ptr<OpenFile> lookupFile(std::uint64_t handle) const;
    std::shared_ptr<OpenFile> removeFile(std::uint64_t handle);
    std::shared_ptr<OpenFile> pendingWrite(const std::string& path) const;

    int openWriter(const char *path, struct fuse_file_info *fi);
    int recreateEmpty(const std::string& path);
    void fillStat(const objfs::UfsStatus& status, struct stat *stbuf) const;

    std::unique_ptr<objfs::ObjectUnderFileSystem> ufs_;
    ObjfsConfig config_;

    mutable std::mutex files_mutex_;
    std::map<std::uint64_t, std::shared_ptr<OpenFile>> open_files_;
    // Files being written, visible to getattr before they are committed
    std::map<std::string, std::shared_ptr<OpenFile>> pending_writes_;
    std::uint64_t next_handle_ = 1;
};
