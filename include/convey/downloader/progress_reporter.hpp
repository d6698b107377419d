#pragma once

#include <convey/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace convey::downloader {

struct ProgressOptions {
    using Clock = std::chrono::steady_clock;

    // Weight of the newest rate sample in the exponential moving average.
    double smoothing{0.3};
    // Bytes arriving closer together than this are folded into one rate sample.
    std::chrono::milliseconds minSampleInterval{50};
    // Time source; defaults to steady_clock::now.
    std::function<Clock::time_point()> now{};
};

/**
 * @brief Scoped progress accumulator for a single transfer.
 *
 * Created when streaming starts and destroyed when the transfer ends. The destructor
 * publishes an aborted terminal state unless finish() already ran, so every exit path
 * (including early returns) ends the display exactly once.
 *
 * Not thread-safe: advance() is called from the transfer thread only.
 */
class ProgressReporter {
public:
    using Clock = ProgressOptions::Clock;

    ProgressReporter(std::string url, std::optional<std::uint64_t> totalBytes,
                     std::uint64_t initialBytes, ProgressCallback onProgress,
                     ProgressOptions options = ProgressOptions{});
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;
    ProgressReporter(ProgressReporter&&) = delete;
    ProgressReporter& operator=(ProgressReporter&&) = delete;

    /**
     * @brief Account for n more bytes; the cumulative count never decreases
     */
    void advance(std::uint64_t n);

    void setTotal(std::optional<std::uint64_t> totalBytes);
    void setPhase(TransferPhase phase);

    /**
     * @brief The transfer starts over from byte 0 (possibly with a new total).
     *
     * Stays in the same scope: no terminal event is published. The reported count holds
     * at its high-water mark until re-received bytes pass it.
     */
    void restart(std::optional<std::uint64_t> totalBytes);

    /**
     * @brief Compute a snapshot of the current state without mutating it
     */
    [[nodiscard]] ProgressSnapshot snapshot() const;

    /**
     * @brief Push the current snapshot to the callback (no-op once finished)
     */
    void publish() const;

    /**
     * @brief Enter the terminal state (Done or Failed) and publish it; idempotent
     */
    void finish(bool completed);

    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] std::uint64_t bytesTransferred() const noexcept { return state_.bytes; }
    [[nodiscard]] TransferPhase phase() const noexcept { return state_.phase; }

private:
    struct TransferState {
        std::uint64_t bytes{0};
        std::optional<std::uint64_t> total{};
        Clock::time_point start{};
        Clock::time_point lastUpdate{};
        TransferPhase phase{TransferPhase::Streaming};
    };

    [[nodiscard]] Clock::time_point now() const;

    std::string url_;
    ProgressCallback onProgress_;
    ProgressOptions options_;
    TransferState state_;
    // Bytes actually held by the transfer; state_.bytes is max(position_, high-water)
    std::uint64_t position_{0};

    // Rate smoothing
    Clock::time_point sampleStart_{};
    std::uint64_t sampleBytes_{0};
    double rateBps_{0.0};
    bool haveRate_{false};

    bool finished_{false};
};

} // namespace convey::downloader
