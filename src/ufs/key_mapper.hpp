#pragma once

#include <string>

namespace objfs {

/**
 * KeyMapper - Converts filesystem paths to object keys and back
 *
 * Paths are either absolute ("/a/b") or full URIs ("gs://bucket/a/b"). Keys
 * never start with the separator; the filesystem root maps to the empty key,
 * which doubles as the listing prefix for the whole bucket. Directories are
 * materialized as folder keys, i.e. the key plus a trailing separator.
 *
 * Pure string manipulation, no I/O.
 */
class KeyMapper {
public:
    static constexpr char kSeparator = '/';
    static constexpr const char* kFolderSuffix = "/";

    KeyMapper(const std::string& scheme, const std::string& bucket_name);

    // "<scheme>://<bucket>", stripped from paths given as URIs
    const std::string& rootKey() const { return root_key_; }

    std::string toKey(const std::string& path) const;

    // Key with the folder suffix; the root stays ""
    std::string toFolderKey(const std::string& path) const;

    // Inverse of toKey for keys this mapper produces (folder suffix dropped)
    static std::string toPath(const std::string& key);

    bool isRoot(const std::string& path) const { return toKey(path).empty(); }

    /**
     * Collapse repeated separators and drop a trailing one
     * @return Absolute path, "/" for the root
     */
    static std::string normalizePath(const std::string& path);

    // Parent of a normalized path; the root is its own parent
    static std::string parentPath(const std::string& path);

    static std::string join(const std::string& parent, const std::string& child);

    static bool isFolderKey(const std::string& key);

    static std::string stripFolderSuffix(const std::string& key);

private:
    std::string root_key_;
};

} // namespace objfs
