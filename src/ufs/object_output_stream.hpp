#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "store/object_store_client.hpp"
#include "store/retry.hpp"

namespace objfs {

/**
 * ObjectOutputStream - Sequential writer that becomes one object on close()
 *
 * Nothing is addressable in the store until close() succeeds. close() is
 * idempotent and returns the status of the first attempt. A stream destroyed
 * without close() is cancelled.
 */
class ObjectOutputStream {
public:
    virtual ~ObjectOutputStream() = default;

    virtual Status write(const char* data, std::size_t len) = 0;

    // Buffered streams have nothing to push before close
    virtual Status flush() { return Status(); }

    virtual Status close() = 0;

    // Drop everything written so far without committing
    virtual void cancel() = 0;

    virtual std::int64_t bytesWritten() const = 0;

    const std::string& key() const { return key_; }

protected:
    explicit ObjectOutputStream(std::string key) : key_(std::move(key)) {}

    std::string key_;
};

/**
 * BufferedObjectOutputStream - Single-shot upload
 *
 * Bytes accumulate in memory, or in a spill file under one of tmp_dirs when
 * any are given, and go out as one PUT with a known content length on close.
 */
class BufferedObjectOutputStream : public ObjectOutputStream {
public:
    BufferedObjectOutputStream(std::shared_ptr<const IObjectStoreClient> client,
                               std::string bucket_name,
                               std::string key,
                               RetryStrategy retry,
                               const std::vector<std::string>& tmp_dirs = {});
    ~BufferedObjectOutputStream() override;

    Status write(const char* data, std::size_t len) override;
    Status close() override;
    void cancel() override;
    std::int64_t bytesWritten() const override { return bytes_written_; }

    // Empty when buffering in memory
    const std::string& spillPath() const { return spill_path_; }

private:
    Status openSpillFile(const std::vector<std::string>& tmp_dirs);
    std::unique_ptr<std::istream> openBody() const;
    void removeSpillFile();

    std::shared_ptr<const IObjectStoreClient> client_;
    std::string bucket_name_;
    RetryStrategy retry_;

    std::string buffer_;
    std::string spill_path_;
    std::ofstream spill_;
    Status open_status_;

    std::int64_t bytes_written_ = 0;
    std::optional<Status> close_status_;
};

} // namespace objfs
