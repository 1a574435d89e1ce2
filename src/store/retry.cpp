#include "retry.hpp"

#include <algorithm>

namespace objfs {

bool isTransient(const Status& status) {
    switch (status.code()) {
        case StatusCode::kDeadlineExceeded:
        case StatusCode::kInternal:
        case StatusCode::kResourceExhausted:
        case StatusCode::kUnavailable:
            return true;
        default:
            return false;
    }
}

RetryStrategy::RetryStrategy(std::unique_ptr<gcs::RetryPolicy> retry_policy,
                             std::unique_ptr<gcs::BackoffPolicy> backoff_policy)
    : retry_policy_(std::move(retry_policy)),
      backoff_policy_(std::move(backoff_policy)) {}

RetryStrategy::RetryStrategy(const RetryStrategy& other)
    : retry_policy_(other.retry_policy_->clone()),
      backoff_policy_(other.backoff_policy_->clone()) {}

RetryStrategy& RetryStrategy::operator=(const RetryStrategy& other) {
    if (this != &other) {
        retry_policy_ = other.retry_policy_->clone();
        backoff_policy_ = other.backoff_policy_->clone();
    }
    return *this;
}

RetryStrategy RetryStrategy::limited(int max_attempts,
                                     std::chrono::milliseconds base_sleep,
                                     std::chrono::milliseconds max_sleep) {
    // The policy counts tolerated failures, not attempts
    int tolerated_failures = max_attempts > 1 ? max_attempts - 1 : 0;
    return RetryStrategy(
        gcs::LimitedErrorCountRetryPolicy(tolerated_failures).clone(),
        gcs::ExponentialBackoffPolicy(base_sleep, std::max(base_sleep, max_sleep), 2.0).clone());
}

} // namespace objfs
