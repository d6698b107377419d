#pragma once

#include <convey/downloader/downloader.hpp>

#include <chrono>
#include <optional>

namespace convey::downloader {

/**
 * Retry state machine for one transfer: an attempt counter and the delay before the
 * next attempt. Deterministic (no jitter) so schedules can be asserted in tests.
 *
 *   BackoffSchedule s{policy};
 *   s.beginAttempt();            // attempt 1
 *   ... transient failure ...
 *   if (auto d = s.nextDelay())  // nullopt once maxAttempts is reached
 *       sleep(*d), s.beginAttempt();
 */
class BackoffSchedule {
public:
    explicit BackoffSchedule(RetryPolicy policy);

    /**
     * Start the next attempt. Returns its 1-based number.
     */
    int beginAttempt();

    /**
     * Delay to wait before the next attempt, or std::nullopt when no attempt is left.
     * The n-th delay is initialBackoff * multiplier^(n-1), capped at maxBackoff.
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> nextDelay() const;

    [[nodiscard]] int attempts() const noexcept { return attempts_; }
    [[nodiscard]] int maxAttempts() const noexcept { return policy_.maxAttempts; }
    [[nodiscard]] bool exhausted() const noexcept { return attempts_ >= policy_.maxAttempts; }

private:
    RetryPolicy policy_;
    int attempts_{0};
};

} // namespace convey::downloader
