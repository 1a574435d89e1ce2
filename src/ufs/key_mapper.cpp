#include "key_mapper.hpp"

namespace objfs {

KeyMapper::KeyMapper(const std::string& scheme, const std::string& bucket_name)
    : root_key_(scheme + "://" + bucket_name) {}

std::string KeyMapper::normalizePath(const std::string& path) {
    std::string result(1, kSeparator);
    for (char c : path) {
        if (c == kSeparator && result.back() == kSeparator) {
            continue;
        }
        result.push_back(c);
    }
    if (result.size() > 1 && result.back() == kSeparator) {
        result.pop_back();
    }
    return result;
}

std::string KeyMapper::toKey(const std::string& path) const {
    std::string stripped = path;
    if (stripped.compare(0, root_key_.size(), root_key_) == 0
        && (stripped.size() == root_key_.size() || stripped[root_key_.size()] == kSeparator)) {
        stripped = stripped.substr(root_key_.size());
    }
    // normalizePath always yields a leading separator
    return normalizePath(stripped).substr(1);
}

std::string KeyMapper::toFolderKey(const std::string& path) const {
    std::string key = toKey(path);
    if (key.empty()) {
        return key;
    }
    return key + kFolderSuffix;
}

std::string KeyMapper::toPath(const std::string& key) {
    return normalizePath(stripFolderSuffix(key));
}

std::string KeyMapper::parentPath(const std::string& path) {
    std::string normalized = normalizePath(path);
    auto pos = normalized.rfind(kSeparator);
    if (pos == 0) {
        return std::string(1, kSeparator);
    }
    return normalized.substr(0, pos);
}

std::string KeyMapper::join(const std::string& parent, const std::string& child) {
    return normalizePath(parent + kSeparator + child);
}

bool KeyMapper::isFolderKey(const std::string& key) {
    return !key.empty() && key.back() == kSeparator;
}

std::string KeyMapper::stripFolderSuffix(const std::string& key) {
    if (isFolderKey(key)) {
        return key.substr(0, key.size() - 1);
    }
    return key;
}

} // namespace objfs
