/*
 * convey/src/downloader/backoff.cpp
 */

#include <convey/downloader/backoff.hpp>

#include <algorithm>
#include <cmath>

namespace convey::downloader {

BackoffSchedule::BackoffSchedule(RetryPolicy policy) : policy_(policy) {
    policy_.maxAttempts = std::max(1, policy_.maxAttempts);
    policy_.multiplier = std::max(1.0, policy_.multiplier);
    if (policy_.initialBackoff.count() < 0)
        policy_.initialBackoff = std::chrono::milliseconds{0};
    if (policy_.maxBackoff < policy_.initialBackoff)
        policy_.maxBackoff = policy_.initialBackoff;
}

int BackoffSchedule::beginAttempt() {
    return ++attempts_;
}

std::optional<std::chrono::milliseconds> BackoffSchedule::nextDelay() const {
    if (exhausted())
        return std::nullopt;

    const int retryIndex = std::max(0, attempts_ - 1);
    const double base = static_cast<double>(policy_.initialBackoff.count());
    const double cap = static_cast<double>(policy_.maxBackoff.count());
    const double delay = std::min(cap, base * std::pow(policy_.multiplier, retryIndex));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(delay)};
}

} // namespace convey::downloader
