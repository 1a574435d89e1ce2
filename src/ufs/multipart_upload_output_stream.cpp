#include "multipart_upload_output_stream.hpp"

#include <algorithm>
#include <sstream>
#include "log.hpp"

namespace objfs {

MultipartUploadOutputStream::MultipartUploadOutputStream(std::shared_ptr<const IObjectStoreClient> client,
                                                         std::string bucket_name,
                                                         std::string key,
                                                         RetryStrategy retry,
                                                         ThreadPool& pool,
                                                         std::size_t partition_size)
    : ObjectOutputStream(std::move(key)),
      client_(std::move(client)),
      bucket_name_(std::move(bucket_name)),
      retry_(std::move(retry)),
      pool_(pool),
      partition_size_(std::max<std::size_t>(partition_size, 1)) {}

MultipartUploadOutputStream::~MultipartUploadOutputStream() {
    if (!close_status_) {
        cancel();
    }
}

Status MultipartUploadOutputStream::write(const char* data, std::size_t len) {
    if (close_status_) {
        return Status(StatusCode::kFailedPrecondition, "Stream for " + key_ + " is closed");
    }
    if (!failure_.ok()) {
        return failure_;
    }
    while (len > 0) {
        std::size_t n = std::min(len, partition_size_ - current_part_.size());
        current_part_.append(data, n);
        data += n;
        len -= n;
        bytes_written_ += static_cast<std::int64_t>(n);

        if (current_part_.size() == partition_size_) {
            std::string part;
            part.swap(current_part_);
            auto status = uploadPart(std::move(part));
            if (!status.ok()) {
                failure_ = status;
                return status;
            }
        }
    }
    return Status();
}

Status MultipartUploadOutputStream::initiate() {
    IObjectStoreClient::InitiateMultipartUploadRequest request;
    request.bucket_name = bucket_name_;
    request.object_name = key_;
    auto upload_id = retry_.run("InitiateMultipartUpload", [&] {
        return client_->InitiateMultipartUpload(request);
    });
    if (!upload_id) {
        log::error("Failed to initiate multipart upload of ", key_, ": ", upload_id.status().message());
        return upload_id.status();
    }
    upload_id_ = *std::move(upload_id);
    log::debug("Initiated multipart upload ", upload_id_, " for ", key_);
    return Status();
}

Status MultipartUploadOutputStream::uploadPart(std::string data) {
    if (upload_id_.empty()) {
        auto status = initiate();
        if (!status.ok()) {
            return status;
        }
    }

    IObjectStoreClient::UploadPartRequest request;
    request.bucket_name = bucket_name_;
    request.object_name = key_;
    request.upload_id = upload_id_;
    request.part_number = next_part_number_++;
    request.data = std::move(data);

    // The task owns everything it touches, so it may outlive this stream
    auto client = client_;
    auto retry = retry_;
    pending_parts_.push_back(pool_.submit(
        [client, retry, request = std::move(request)]() -> StatusOr<CompletedPart> {
            auto etag = retry.run("UploadPart", [&] { return client->UploadPart(request); });
            if (!etag) {
                log::warn("Part ", request.part_number, " of ", request.object_name,
                          " failed: ", etag.status().message());
                return etag.status();
            }
            CompletedPart part;
            part.part_number = request.part_number;
            part.etag = *std::move(etag);
            return part;
        }));
    return Status();
}

StatusOr<std::vector<MultipartUploadOutputStream::CompletedPart>> MultipartUploadOutputStream::waitForParts() {
    std::vector<CompletedPart> parts;
    Status first_failure;
    for (auto& future : pending_parts_) {
        auto part = future.get();
        if (!part) {
            if (first_failure.ok()) {
                first_failure = part.status();
            }
            continue;
        }
        parts.push_back(*std::move(part));
    }
    pending_parts_.clear();
    if (!first_failure.ok()) {
        return first_failure;
    }
    std::sort(parts.begin(), parts.end(), [](const CompletedPart& a, const CompletedPart& b) {
        return a.part_number < b.part_number;
    });
    return parts;
}

Status MultipartUploadOutputStream::putWhole() {
    return retry_.run("PutObject", [&] {
        std::istringstream body(current_part_);
        IObjectStoreClient::PutObjectRequest request;
        request.bucket_name = bucket_name_;
        request.object_name = key_;
        request.body = &body;
        request.content_length = static_cast<std::int64_t>(current_part_.size());
        return client_->PutObject(request);
    });
}

Status MultipartUploadOutputStream::close() {
    if (close_status_) {
        return *close_status_;
    }

    Status status;
    if (!failure_.ok()) {
        // Bytes were dropped: never commit what is left
        status = failure_;
        if (!upload_id_.empty()) {
            auto parts = waitForParts();
            if (!parts) {
                log::debug("Discarding failed parts of ", key_, ": ", parts.status().message());
            }
            abort();
        }
    } else if (upload_id_.empty()) {
        status = putWhole();
    } else {
        if (!current_part_.empty()) {
            std::string part;
            part.swap(current_part_);
            status = uploadPart(std::move(part));
        }
        auto parts = waitForParts();
        if (status.ok() && !parts) {
            status = parts.status();
        }
        if (status.ok()) {
            IObjectStoreClient::CompleteMultipartUploadRequest request;
            request.bucket_name = bucket_name_;
            request.object_name = key_;
            request.upload_id = upload_id_;
            request.parts = *std::move(parts);
            status = retry_.run("CompleteMultipartUpload", [&] {
                return client_->CompleteMultipartUpload(request);
            });
        }
        if (!status.ok()) {
            abort();
        }
    }

    if (status.ok()) {
        log::debug("Uploaded ", bytes_written_, " bytes to ", key_,
                   upload_id_.empty() ? "" : " in parts");
    } else {
        log::error("Failed to upload ", key_, ": ", status.message());
    }
    current_part_.clear();
    close_status_ = status;
    return status;
}

void MultipartUploadOutputStream::cancel() {
    if (close_status_) {
        return;
    }
    if (!upload_id_.empty()) {
        // In-flight parts must land before the abort or they would outlive it
        auto parts = waitForParts();
        if (!parts) {
            log::debug("Discarding failed parts of ", key_, ": ", parts.status().message());
        }
        abort();
    }
    current_part_.clear();
    close_status_ = Status(StatusCode::kCancelled, "Upload of " + key_ + " was cancelled");
}

void MultipartUploadOutputStream::abort() {
    IObjectStoreClient::AbortMultipartUploadRequest request;
    request.bucket_name = bucket_name_;
    request.object_name = key_;
    request.upload_id = upload_id_;
    auto status = retry_.run("AbortMultipartUpload", [&] {
        return client_->AbortMultipartUpload(request);
    });
    if (!status.ok()) {
        log::error("Failed to abort multipart upload ", upload_id_, " of ", key_, ": ", status.message());
    } else {
        log::info("Aborted multipart upload ", upload_id_, " of ", key_);
    }
}

} // namespace objfs
