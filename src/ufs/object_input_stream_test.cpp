#include "ufs/object_input_stream.hpp"
#include "store/in_memory_object_store_client.hpp"
#include "store/mock_object_store_client.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>

using ::testing::_;
using ::testing::Field;
using ::testing::AllOf;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using objfs::InMemoryObjectStoreClient;
using objfs::IObjectStoreClient;
using objfs::MockObjectStoreClient;
using objfs::ObjectInputStream;
using objfs::ObjectPositionReader;
using objfs::RetryStrategy;
using objfs::Status;
using objfs::StatusCode;
using ReadRequest = IObjectStoreClient::ReadObjectRangeRequest;

class ObjectInputStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 100; ++i) {
            content.push_back(static_cast<char>('a' + i % 26));
        }
        put(key, content);
        mock = std::make_shared<NiceMock<MockObjectStoreClient>>();
        mock->delegateTo(store);
    }

    void put(const std::string& name, const std::string& data) {
        std::istringstream body(data);
        IObjectStoreClient::PutObjectRequest req;
        req.bucket_name = bucket;
        req.object_name = name;
        req.body = &body;
        req.content_length = static_cast<std::int64_t>(data.size());
        ASSERT_TRUE(store.PutObject(req).ok());
    }

    static RetryStrategy threeAttempts() {
        return RetryStrategy::limited(3, std::chrono::milliseconds(1), std::chrono::milliseconds(2));
    }

    auto readFromStore() {
        return Invoke([this](const ReadRequest& req) { return store.ReadObjectRange(req); });
    }

    std::unique_ptr<ObjectInputStream> openStream(std::int64_t position, std::int64_t chunk_size) {
        auto stream = ObjectInputStream::open(mock, bucket, key, position, threeAttempts(), chunk_size);
        EXPECT_TRUE(stream.ok()) << stream.status().message();
        return stream.ok() ? *std::move(stream) : nullptr;
    }

    const std::string bucket = "test-bucket";
    const std::string key = "dir/data.bin";
    std::string content;
    InMemoryObjectStoreClient store;
    std::shared_ptr<NiceMock<MockObjectStoreClient>> mock;
};

TEST_F(ObjectInputStreamTest, ReadsWholeObjectInChunks) {
    EXPECT_CALL(*mock, ReadObjectRange(_)).Times(4);

    auto stream = openStream(0, 30);
    ASSERT_NE(nullptr, stream);
    EXPECT_EQ(100, stream->length());

    auto all = stream->readAll();
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(content, *all);
    EXPECT_EQ(100, stream->position());
}

TEST_F(ObjectInputStreamTest, RangedRequestsNeverExceedChunkSize) {
    EXPECT_CALL(*mock, ReadObjectRange(_))
        .WillRepeatedly(Invoke([this](const ReadRequest& req) {
            EXPECT_LE(req.end - req.begin, 16);
            return store.ReadObjectRange(req);
        }));

    auto stream = openStream(0, 16);
    ASSERT_NE(nullptr, stream);
    ASSERT_TRUE(stream->readAll().ok());
}

TEST_F(ObjectInputStreamTest, StartsAtRequestedOffset) {
    auto stream = openStream(90, 64);
    ASSERT_NE(nullptr, stream);

    char buf[32];
    auto n = stream->read(buf, sizeof(buf));
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(10u, *n);
    EXPECT_EQ(content.substr(90), std::string(buf, *n));

    auto eof = stream->read(buf, sizeof(buf));
    ASSERT_TRUE(eof.ok());
    EXPECT_EQ(0u, *eof);
}

TEST_F(ObjectInputStreamTest, TwoTransientFailuresThenSuccess) {
    {
        InSequence seq;
        EXPECT_CALL(*mock, ReadObjectRange(Field(&ReadRequest::begin, 0)))
            .WillOnce(Return(Status(StatusCode::kUnavailable, "connection reset")))
            .WillOnce(Return(Status(StatusCode::kUnavailable, "connection reset")))
            .WillOnce(readFromStore());
    }

    auto stream = openStream(0, 100);
    ASSERT_NE(nullptr, stream);
    auto all = stream->readAll();
    ASSERT_TRUE(all.ok()) << all.status().message();
    EXPECT_EQ(content, *all);
}

TEST_F(ObjectInputStreamTest, ShortReadContinuesFromLastByte) {
    {
        InSequence seq;
        EXPECT_CALL(*mock, ReadObjectRange(AllOf(Field(&ReadRequest::begin, 0),
                                                 Field(&ReadRequest::end, 100))))
            .WillOnce(Return(content.substr(0, 40)));
        EXPECT_CALL(*mock, ReadObjectRange(AllOf(Field(&ReadRequest::begin, 40),
                                                 Field(&ReadRequest::end, 100))))
            .WillOnce(Return(Status(StatusCode::kUnavailable, "stall")))
            .WillOnce(readFromStore());
    }

    auto stream = openStream(0, 100);
    ASSERT_NE(nullptr, stream);
    auto all = stream->readAll();
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(content, *all);
}

TEST_F(ObjectInputStreamTest, RetriesExhaustedSurfaceLastFailure) {
    EXPECT_CALL(*mock, ReadObjectRange(_))
        .Times(3)
        .WillRepeatedly(Return(Status(StatusCode::kUnavailable, "down")));

    auto stream = openStream(0, 100);
    ASSERT_NE(nullptr, stream);
    char buf[10];
    auto n = stream->read(buf, sizeof(buf));
    ASSERT_FALSE(n.ok());
    EXPECT_EQ(StatusCode::kUnavailable, n.status().code());
}

TEST_F(ObjectInputStreamTest, MissingObjectIsNotRetried) {
    EXPECT_CALL(*mock, GetObjectMetadata(_)).Times(1);

    auto stream = ObjectInputStream::open(mock, bucket, "nope", 0, threeAttempts(), 100);
    ASSERT_FALSE(stream.ok());
    EXPECT_EQ(StatusCode::kNotFound, stream.status().code());
}

TEST_F(ObjectInputStreamTest, ObjectShrinkingMidReadIsDataLoss) {
    EXPECT_CALL(*mock, ReadObjectRange(_)).WillOnce(Return(std::string()));

    auto stream = openStream(0, 100);
    ASSERT_NE(nullptr, stream);
    char buf[10];
    auto n = stream->read(buf, sizeof(buf));
    ASSERT_FALSE(n.ok());
    EXPECT_EQ(StatusCode::kDataLoss, n.status().code());
}

TEST_F(ObjectInputStreamTest, SeekWithinChunkDoesNotRefetch) {
    EXPECT_CALL(*mock, ReadObjectRange(_)).Times(1);

    auto stream = openStream(0, 100);
    ASSERT_NE(nullptr, stream);
    char buf[10];
    ASSERT_TRUE(stream->read(buf, sizeof(buf)).ok());

    ASSERT_TRUE(stream->seek(50).ok());
    auto n = stream->read(buf, sizeof(buf));
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(content.substr(50, 10), std::string(buf, *n));

    ASSERT_TRUE(stream->seek(5).ok());
    EXPECT_EQ(3, stream->skip(3));
    n = stream->read(buf, 2);
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(content.substr(8, 2), std::string(buf, *n));
}

TEST_F(ObjectInputStreamTest, SeekPastEndFails) {
    auto stream = openStream(0, 100);
    ASSERT_NE(nullptr, stream);
    EXPECT_EQ(StatusCode::kOutOfRange, stream->seek(101).code());
    EXPECT_TRUE(stream->seek(100).ok());
    EXPECT_EQ(0, stream->skip(5));
}

TEST_F(ObjectInputStreamTest, PositionReaderServesIndependentRanges) {
    ObjectPositionReader reader(mock, bucket, key, 100, threeAttempts(), 16);

    char buf[40];
    auto n = reader.read(30, buf, sizeof(buf));
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(40u, *n);
    EXPECT_EQ(content.substr(30, 40), std::string(buf, *n));

    n = reader.read(95, buf, sizeof(buf));
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(5u, *n);
    EXPECT_EQ(content.substr(95), std::string(buf, *n));

    n = reader.read(100, buf, sizeof(buf));
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(0u, *n);
}

TEST_F(ObjectInputStreamTest, PositionReaderRetriesTransientFailure) {
    EXPECT_CALL(*mock, ReadObjectRange(_))
        .WillOnce(Return(Status(StatusCode::kDeadlineExceeded, "slow")))
        .WillRepeatedly(readFromStore());

    ObjectPositionReader reader(mock, bucket, key, 100, threeAttempts(), 100);
    char buf[10];
    auto n = reader.read(0, buf, sizeof(buf));
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(content.substr(0, 10), std::string(buf, *n));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
