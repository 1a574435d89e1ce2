#include "store/retry.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <utility>

using objfs::RetryStrategy;
using objfs::Status;
using objfs::StatusCode;
using objfs::StatusOr;

namespace {

RetryStrategy fastRetry(int attempts) {
    return RetryStrategy::limited(attempts, std::chrono::milliseconds(1), std::chrono::milliseconds(2));
}

}  // namespace

TEST(RetryStrategyTest, TransientFailuresAreRetried) {
    int calls = 0;
    auto result = fastRetry(3).run("Op", [&]() -> StatusOr<int> {
        if (++calls < 3) {
            return Status(StatusCode::kUnavailable, "busy");
        }
        return 42;
    });
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(42, *result);
    EXPECT_EQ(3, calls);
}

TEST(RetryStrategyTest, PermanentFailureReturnsOnFirstAttempt) {
    int calls = 0;
    auto status = fastRetry(5).run("Op", [&] {
        ++calls;
        return Status(StatusCode::kNotFound, "gone");
    });
    EXPECT_EQ(StatusCode::kNotFound, status.code());
    EXPECT_EQ("gone", status.message());
    EXPECT_EQ(1, calls);
}

TEST(RetryStrategyTest, ExhaustionNamesTheOperation) {
    int calls = 0;
    auto status = fastRetry(2).run("ListObjects", [&] {
        ++calls;
        return Status(StatusCode::kUnavailable, "down");
    });
    EXPECT_EQ(StatusCode::kUnavailable, status.code());
    EXPECT_EQ("ListObjects: retry policy exhausted: down", status.message());
    EXPECT_EQ(2, calls);
}

TEST(RetryStrategyTest, MovedFromStrategyStillRuns) {
    RetryStrategy original = fastRetry(2);
    RetryStrategy moved = std::move(original);

    int calls = 0;
    auto flaky = [&] {
        return ++calls % 2 == 1 ? Status(StatusCode::kUnavailable, "busy") : Status();
    };
    EXPECT_TRUE(moved.run("Op", flaky).ok());
    EXPECT_TRUE(original.run("Op", flaky).ok());

    RetryStrategy copy(original);
    EXPECT_TRUE(copy.run("Op", flaky).ok());
    EXPECT_EQ(6, calls);
}

TEST(RetryStrategyTest, TransientClassification) {
    EXPECT_TRUE(objfs::isTransient(Status(StatusCode::kUnavailable, "")));
    EXPECT_TRUE(objfs::isTransient(Status(StatusCode::kDeadlineExceeded, "")));
    EXPECT_FALSE(objfs::isTransient(Status(StatusCode::kNotFound, "")));
    EXPECT_FALSE(objfs::isTransient(Status(StatusCode::kPermissionDenied, "")));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
