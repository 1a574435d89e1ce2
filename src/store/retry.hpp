#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "google/cloud/storage/retry_policy.h"
#include "store/object_store_client.hpp"
#include "log.hpp"

namespace gcs = ::google::cloud::storage;

namespace objfs {

inline const Status& statusOf(const Status& status) { return status; }

template <typename T>
const Status& statusOf(const StatusOr<T>& status_or) { return status_or.status(); }

// True for codes the store reports on network trouble or overload
bool isTransient(const Status& status);

/**
 * RetryStrategy - Retry and backoff prototypes applied to one store call
 *
 * Each run() clones fresh policies, so one strategy can be shared by many
 * calls without one call eating another's attempt budget. Permanent failures
 * (as the retry policy classifies them) are returned unchanged on the first
 * attempt.
 */
class RetryStrategy {
public:
    RetryStrategy(std::unique_ptr<gcs::RetryPolicy> retry_policy,
                  std::unique_ptr<gcs::BackoffPolicy> backoff_policy);

    // Copies clone the policies. There are no move operations, so a
    // moved-from strategy keeps working policies
    RetryStrategy(const RetryStrategy& other);
    RetryStrategy& operator=(const RetryStrategy& other);

    /**
     * Attempt up to max_attempts times with exponential backoff between
     * base_sleep and max_sleep
     */
    static RetryStrategy limited(int max_attempts,
                                 std::chrono::milliseconds base_sleep,
                                 std::chrono::milliseconds max_sleep);

    template <typename Functor>
    auto run(const char* operation, Functor&& fn) const -> decltype(fn()) {
        using Result = decltype(fn());
        auto retry = retry_policy_->clone();
        auto backoff = backoff_policy_->clone();
        Status last_status;
        while (true) {
            Result result = fn();
            if (result.ok()) {
                return result;
            }
            last_status = statusOf(result);
            if (!retry->OnFailure(last_status)) {
                if (retry->IsPermanentFailure(last_status)) {
                    return result;
                }
                break;
            }
            auto delay = backoff->OnCompletion();
            log::debug(operation, " failed (", last_status.message(), "), retrying in ",
                       std::chrono::duration_cast<std::chrono::milliseconds>(delay).count(), "ms");
            std::this_thread::sleep_for(delay);
        }
        log::warn(operation, " failed after exhausting retries: ", last_status.message());
        return Result(Status(last_status.code(),
                             std::string(operation) + ": retry policy exhausted: " + last_status.message(),
                             last_status.error_info()));
    }

private:
    std::unique_ptr<gcs::RetryPolicy> retry_policy_;
    std::unique_ptr<gcs::BackoffPolicy> backoff_policy_;
};

} // namespace objfs
