#include "object_output_stream.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>
#include <sstream>
#include <unistd.h>
#include "log.hpp"

namespace objfs {

BufferedObjectOutputStream::BufferedObjectOutputStream(std::shared_ptr<const IObjectStoreClient> client,
                                                       std::string bucket_name,
                                                       std::string key,
                                                       RetryStrategy retry,
                                                       const std::vector<std::string>& tmp_dirs)
    : ObjectOutputStream(std::move(key)),
      client_(std::move(client)),
      bucket_name_(std::move(bucket_name)),
      retry_(std::move(retry))
{
    if (!tmp_dirs.empty()) {
        open_status_ = openSpillFile(tmp_dirs);
    }
}

BufferedObjectOutputStream::~BufferedObjectOutputStream() {
    if (!close_status_) {
        cancel();
    }
}

Status BufferedObjectOutputStream::openSpillFile(const std::vector<std::string>& tmp_dirs) {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, tmp_dirs.size() - 1);
    std::string pattern = tmp_dirs[pick(generator)] + "/objfs-upload-XXXXXX";

    std::vector<char> path(pattern.begin(), pattern.end());
    path.push_back('\0');
    int fd = mkstemp(path.data());
    if (fd < 0) {
        return Status(StatusCode::kInternal,
                      "Cannot create spill file " + pattern + ": " + std::strerror(errno));
    }
    ::close(fd);

    spill_path_ = path.data();
    spill_.open(spill_path_, std::ios::binary | std::ios::trunc);
    if (!spill_.is_open()) {
        removeSpillFile();
        return Status(StatusCode::kInternal, "Cannot open spill file " + std::string(path.data()));
    }
    log::debug("Buffering ", key_, " in ", spill_path_);
    return Status();
}

Status BufferedObjectOutputStream::write(const char* data, std::size_t len) {
    if (close_status_) {
        return Status(StatusCode::kFailedPrecondition, "Stream for " + key_ + " is closed");
    }
    if (!open_status_.ok()) {
        return open_status_;
    }
    if (spill_path_.empty()) {
        buffer_.append(data, len);
    } else {
        spill_.write(data, static_cast<std::streamsize>(len));
        if (!spill_) {
            return Status(StatusCode::kInternal, "Write to spill file " + spill_path_ + " failed");
        }
    }
    bytes_written_ += static_cast<std::int64_t>(len);
    return Status();
}

std::unique_ptr<std::istream> BufferedObjectOutputStream::openBody() const {
    if (spill_path_.empty()) {
        return std::make_unique<std::istringstream>(buffer_);
    }
    return std::make_unique<std::ifstream>(spill_path_, std::ios::binary);
}

Status BufferedObjectOutputStream::close() {
    if (close_status_) {
        return *close_status_;
    }
    if (!open_status_.ok()) {
        close_status_ = open_status_;
        return open_status_;
    }

    Status status;
    if (!spill_path_.empty()) {
        spill_.close();
        if (spill_.fail()) {
            status = Status(StatusCode::kInternal, "Flushing spill file " + spill_path_ + " failed");
        }
    }

    if (status.ok()) {
        status = retry_.run("PutObject", [&] {
            // Every attempt needs the body from its first byte
            auto body = openBody();
            IObjectStoreClient::PutObjectRequest request;
            request.bucket_name = bucket_name_;
            request.object_name = key_;
            request.body = body.get();
            request.content_length = bytes_written_;
            return client_->PutObject(request);
        });
    }

    if (status.ok()) {
        log::debug("Uploaded ", bytes_written_, " bytes to ", key_);
    } else {
        log::error("Failed to upload ", key_, ": ", status.message());
    }
    removeSpillFile();
    buffer_.clear();
    close_status_ = status;
    return status;
}

void BufferedObjectOutputStream::cancel() {
    if (close_status_) {
        return;
    }
    if (spill_.is_open()) {
        spill_.close();
    }
    removeSpillFile();
    buffer_.clear();
    close_status_ = Status(StatusCode::kCancelled, "Upload of " + key_ + " was cancelled");
}

void BufferedObjectOutputStream::removeSpillFile() {
    if (spill_path_.empty()) {
        return;
    }
    if (std::remove(spill_path_.c_str()) != 0 && errno != ENOENT) {
        log::warn("Failed to remove spill file ", spill_path_, ": ", std::strerror(errno));
    }
}

} // namespace objfs
