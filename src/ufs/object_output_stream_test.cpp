#include "ufs/object_output_stream.hpp"
#include "ufs/multipart_upload_output_stream.hpp"
#include "store/in_memory_object_store_client.hpp"
#include "store/mock_object_store_client.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <thread>
#include <dirent.h>
#include <unistd.h>

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using objfs::BufferedObjectOutputStream;
using objfs::InMemoryObjectStoreClient;
using objfs::IObjectStoreClient;
using objfs::MockObjectStoreClient;
using objfs::MultipartUploadOutputStream;
using objfs::RetryStrategy;
using objfs::Status;
using objfs::StatusCode;
using objfs::ThreadPool;

namespace {

std::string pattern(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>('A' + (i * 7) % 26);
    }
    return data;
}

std::size_t countEntries(const std::string& dir) {
    std::size_t count = 0;
    DIR* d = opendir(dir.c_str());
    if (d == nullptr) {
        return 0;
    }
    while (dirent* entry = readdir(d)) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") {
            ++count;
        }
    }
    closedir(d);
    return count;
}

}  // namespace

class ObjectOutputStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<InMemoryObjectStoreClient>();
        mock = std::make_shared<NiceMock<MockObjectStoreClient>>();
        mock->delegateTo(*store);
    }

    void TearDown() override {
        if (!tmp_dir.empty()) {
            rmdir(tmp_dir.c_str());
        }
    }

    std::string makeTmpDir() {
        char path[] = "/tmp/objfs_output_test_XXXXXX";
        char* created = mkdtemp(path);
        EXPECT_NE(nullptr, created);
        tmp_dir = created ? created : "";
        return tmp_dir;
    }

    std::optional<std::string> readObject(const std::string& key) {
        IObjectStoreClient::ReadObjectRangeRequest req;
        req.bucket_name = bucket;
        req.object_name = key;
        req.begin = 0;
        req.end = std::int64_t{1} << 40;
        auto data = store->ReadObjectRange(req);
        if (!data) {
            return std::nullopt;
        }
        return *data;
    }

    static RetryStrategy retry() {
        return RetryStrategy::limited(3, std::chrono::milliseconds(1), std::chrono::milliseconds(2));
    }

    const std::string bucket = "test-bucket";
    std::shared_ptr<InMemoryObjectStoreClient> store;
    std::shared_ptr<NiceMock<MockObjectStoreClient>> mock;
    std::string tmp_dir;
};

TEST_F(ObjectOutputStreamTest, InMemoryBufferRoundTrip) {
    BufferedObjectOutputStream out(store, bucket, "a/file.txt", retry());
    ASSERT_TRUE(out.write("hello ", 6).ok());
    ASSERT_TRUE(out.write("world", 5).ok());
    EXPECT_FALSE(readObject("a/file.txt").has_value());

    ASSERT_TRUE(out.close().ok());
    EXPECT_EQ(11, out.bytesWritten());
    EXPECT_EQ("hello world", readObject("a/file.txt").value_or(""));
}

TEST_F(ObjectOutputStreamTest, SpillFileIsUsedAndRemoved) {
    std::string dir = makeTmpDir();
    std::string data = pattern(100000);
    {
        BufferedObjectOutputStream out(store, bucket, "spilled", retry(), {dir});
        ASSERT_FALSE(out.spillPath().empty());
        EXPECT_EQ(0u, out.spillPath().find(dir));
        ASSERT_TRUE(out.write(data.data(), data.size()).ok());
        EXPECT_EQ(1u, countEntries(dir));
        ASSERT_TRUE(out.close().ok());
        EXPECT_EQ(0u, countEntries(dir));
    }
    EXPECT_EQ(data, readObject("spilled").value_or(""));
}

TEST_F(ObjectOutputStreamTest, PutIsRetriedWithFullBody) {
    std::string dir = makeTmpDir();
    EXPECT_CALL(*mock, PutObject(_))
        .WillOnce(Invoke([](const IObjectStoreClient::PutObjectRequest& req) {
            // Consume part of the body before failing
            char buf[4];
            req.body->read(buf, sizeof(buf));
            return Status(StatusCode::kUnavailable, "reset");
        }))
        .WillOnce(Invoke(store.get(), &IObjectStoreClient::PutObject));

    BufferedObjectOutputStream out(mock, bucket, "retried", retry(), {dir});
    ASSERT_TRUE(out.write("0123456789", 10).ok());
    ASSERT_TRUE(out.close().ok());
    EXPECT_EQ("0123456789", readObject("retried").value_or(""));
}

TEST_F(ObjectOutputStreamTest, FailedCommitLeavesNothingAndCloseIsIdempotent) {
    EXPECT_CALL(*mock, PutObject(_))
        .Times(1)
        .WillOnce(Return(Status(StatusCode::kPermissionDenied, "denied")));

    BufferedObjectOutputStream out(mock, bucket, "denied", retry());
    ASSERT_TRUE(out.write("x", 1).ok());
    EXPECT_EQ(StatusCode::kPermissionDenied, out.close().code());
    EXPECT_EQ(StatusCode::kPermissionDenied, out.close().code());
    EXPECT_FALSE(readObject("denied").has_value());
    EXPECT_FALSE(out.write("y", 1).ok());
}

TEST_F(ObjectOutputStreamTest, DestroyedWithoutCloseCommitsNothing) {
    std::string dir = makeTmpDir();
    {
        BufferedObjectOutputStream out(store, bucket, "abandoned", retry(), {dir});
        ASSERT_TRUE(out.write("partial", 7).ok());
    }
    EXPECT_FALSE(readObject("abandoned").has_value());
    EXPECT_EQ(0u, countEntries(dir));
}

class MultipartUploadTest : public ObjectOutputStreamTest {
protected:
    ThreadPool pool{4, 8};
};

TEST_F(MultipartUploadTest, TwelveMegabytesInFiveMegabyteParts) {
    const std::size_t part_size = 5 * 1024 * 1024;
    std::string data = pattern(12 * 1024 * 1024);

    EXPECT_CALL(*mock, InitiateMultipartUpload(_)).Times(1);
    EXPECT_CALL(*mock, UploadPart(_)).Times(3);
    EXPECT_CALL(*mock, CompleteMultipartUpload(Field(
        &IObjectStoreClient::CompleteMultipartUploadRequest::parts,
        ElementsAre(Field(&IObjectStoreClient::CompletedPart::part_number, 1),
                    Field(&IObjectStoreClient::CompletedPart::part_number, 2),
                    Field(&IObjectStoreClient::CompletedPart::part_number, 3)))))
        .Times(1);
    EXPECT_CALL(*mock, PutObject(_)).Times(0);

    MultipartUploadOutputStream out(mock, bucket, "big.bin", retry(), pool, part_size);
    // Odd-sized writes straddle part boundaries
    const std::size_t step = 1000003;
    for (std::size_t offset = 0; offset < data.size(); offset += step) {
        std::size_t n = std::min(step, data.size() - offset);
        ASSERT_TRUE(out.write(data.data() + offset, n).ok());
    }
    ASSERT_TRUE(out.close().ok());

    EXPECT_EQ(data, readObject("big.bin").value_or(""));
    EXPECT_EQ(0u, store->pendingUploadCount());
}

TEST_F(MultipartUploadTest, PartsCompletingOutOfOrderAreListedAscending) {
    EXPECT_CALL(*mock, UploadPart(_))
        .WillRepeatedly(Invoke([this](const IObjectStoreClient::UploadPartRequest& req) {
            if (req.part_number == 1) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            return store->UploadPart(req);
        }));

    MultipartUploadOutputStream out(mock, bucket, "ordered", retry(), pool, 4);
    ASSERT_TRUE(out.write("aaaabbbbccccdd", 14).ok());
    ASSERT_TRUE(out.close().ok());
    EXPECT_EQ("aaaabbbbccccdd", readObject("ordered").value_or(""));
}

TEST_F(MultipartUploadTest, SmallStreamIsSinglePut) {
    EXPECT_CALL(*mock, InitiateMultipartUpload(_)).Times(0);
    EXPECT_CALL(*mock, PutObject(_)).Times(1);

    MultipartUploadOutputStream out(mock, bucket, "small", retry(), pool, 1024);
    ASSERT_TRUE(out.write("tiny", 4).ok());
    ASSERT_TRUE(out.close().ok());
    EXPECT_EQ("tiny", readObject("small").value_or(""));
}

TEST_F(MultipartUploadTest, FailedPartAbortsSession) {
    EXPECT_CALL(*mock, UploadPart(_))
        .WillRepeatedly(Invoke([this](const IObjectStoreClient::UploadPartRequest& req)
                                   -> objfs::StatusOr<std::string> {
            if (req.part_number == 2) {
                return Status(StatusCode::kPermissionDenied, "denied");
            }
            return store->UploadPart(req);
        }));
    EXPECT_CALL(*mock, CompleteMultipartUpload(_)).Times(0);
    EXPECT_CALL(*mock, AbortMultipartUpload(_)).Times(1);

    MultipartUploadOutputStream out(mock, bucket, "broken", retry(), pool, 4);
    ASSERT_TRUE(out.write("aaaabbbbcccc", 12).ok());
    EXPECT_EQ(StatusCode::kPermissionDenied, out.close().code());
    EXPECT_FALSE(readObject("broken").has_value());
    EXPECT_EQ(0u, store->pendingUploadCount());
}

TEST_F(MultipartUploadTest, TransientPartFailureIsRetried) {
    EXPECT_CALL(*mock, UploadPart(_)).Times(AnyNumber());
    EXPECT_CALL(*mock, UploadPart(Field(&IObjectStoreClient::UploadPartRequest::part_number, 1)))
        .WillOnce(Return(Status(StatusCode::kUnavailable, "busy")))
        .WillOnce(Invoke(store.get(), &IObjectStoreClient::UploadPart));

    MultipartUploadOutputStream out(mock, bucket, "retried", retry(), pool, 4);
    ASSERT_TRUE(out.write("abcdef", 6).ok());
    ASSERT_TRUE(out.close().ok());
    EXPECT_EQ("abcdef", readObject("retried").value_or(""));
}

TEST_F(MultipartUploadTest, DestroyedBeforeCloseAbortsSession) {
    EXPECT_CALL(*mock, AbortMultipartUpload(_)).Times(1);
    {
        MultipartUploadOutputStream out(mock, bucket, "dropped", retry(), pool, 4);
        ASSERT_TRUE(out.write("aaaabbbb", 8).ok());
        EXPECT_FALSE(out.uploadId().empty());
    }
    EXPECT_FALSE(readObject("dropped").has_value());
    EXPECT_EQ(0u, store->pendingUploadCount());
}

TEST_F(MultipartUploadTest, FailedInitiateFailsCloseWithoutCommitting) {
    EXPECT_CALL(*mock, InitiateMultipartUpload(_))
        .WillOnce(Return(Status(StatusCode::kPermissionDenied, "denied")));
    MultipartUploadOutputStream out(mock, bucket, "lost-part", retry(), pool, 4);

    EXPECT_EQ(StatusCode::kPermissionDenied, out.write("aaaabbbbcc", 10).code());
    EXPECT_CALL(*mock, PutObject(_)).Times(0);
    EXPECT_EQ(StatusCode::kPermissionDenied, out.close().code());
    EXPECT_FALSE(readObject("lost-part").has_value());
}

TEST_F(MultipartUploadTest, WritesAfterFailedPartAreRejected) {
    EXPECT_CALL(*mock, InitiateMultipartUpload(_))
        .WillOnce(Return(Status(StatusCode::kPermissionDenied, "denied")))
        .WillRepeatedly(Invoke(store.get(), &IObjectStoreClient::InitiateMultipartUpload));
    MultipartUploadOutputStream out(mock, bucket, "truncated", retry(), pool, 4);

    EXPECT_FALSE(out.write("aaaa", 4).ok());
    EXPECT_EQ(StatusCode::kPermissionDenied, out.write("bbbbcc", 6).code());
    EXPECT_FALSE(out.close().ok());
    EXPECT_FALSE(readObject("truncated").has_value());
    EXPECT_EQ(0u, store->pendingUploadCount());
}

TEST_F(MultipartUploadTest, CancelAbortsAndBlocksClose) {
    MultipartUploadOutputStream out(mock, bucket, "cancelled", retry(), pool, 4);
    ASSERT_TRUE(out.write("aaaab", 5).ok());
    out.cancel();
    EXPECT_EQ(StatusCode::kCancelled, out.close().code());
    EXPECT_EQ(0u, store->pendingUploadCount());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
