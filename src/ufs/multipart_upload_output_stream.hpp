#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ufs/object_output_stream.hpp"
#include "util/thread_pool.hpp"

namespace objfs {

/**
 * MultipartUploadOutputStream - Uploads an object as a sequence of parts
 *
 * Every full partition_size bytes become one part, numbered in write order and
 * uploaded on the shared pool. The upload session is initiated with the first
 * part. close() uploads the remainder, waits for every part, and completes
 * the session with the parts in ascending order. Any failure aborts the
 * session. A stream that never filled a part is committed with a single PUT.
 */
class MultipartUploadOutputStream : public ObjectOutputStream {
public:
    MultipartUploadOutputStream(std::shared_ptr<const IObjectStoreClient> client,
                                std::string bucket_name,
                                std::string key,
                                RetryStrategy retry,
                                ThreadPool& pool,
                                std::size_t partition_size);
    ~MultipartUploadOutputStream() override;

    Status write(const char* data, std::size_t len) override;
    Status close() override;
    void cancel() override;
    std::int64_t bytesWritten() const override { return bytes_written_; }

    // Set once the session has been initiated
    const std::string& uploadId() const { return upload_id_; }

private:
    using CompletedPart = IObjectStoreClient::CompletedPart;

    Status initiate();
    Status uploadPart(std::string data);
    StatusOr<std::vector<CompletedPart>> waitForParts();
    Status putWhole();
    void abort();

    std::shared_ptr<const IObjectStoreClient> client_;
    std::string bucket_name_;
    RetryStrategy retry_;
    ThreadPool& pool_;
    std::size_t partition_size_;

    std::string current_part_;
    std::string upload_id_;
    int next_part_number_ = 1;
    std::vector<std::future<StatusOr<CompletedPart>>> pending_parts_;

    std::int64_t bytes_written_ = 0;
    // First failed initiate or part submission; the stream can no longer commit
    Status failure_;
    std::optional<Status> close_status_;
};

} // namespace objfs
