/*
 * convey/src/downloader/progress_reporter.cpp
 *
 * Rate is an exponential moving average of per-sample rates, so a short stall or burst
 * moves the ETA gradually instead of making it jump.
 */

#include <convey/downloader/progress_reporter.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace convey::downloader {

ProgressReporter::ProgressReporter(std::string url, std::optional<std::uint64_t> totalBytes,
                                   std::uint64_t initialBytes, ProgressCallback onProgress,
                                   ProgressOptions options)
    : url_(std::move(url)), onProgress_(std::move(onProgress)), options_(std::move(options)) {
    options_.smoothing = std::clamp(options_.smoothing, 0.01, 1.0);
    state_.bytes = initialBytes;
    position_ = initialBytes;
    state_.total = totalBytes;
    state_.start = now();
    state_.lastUpdate = state_.start;
    sampleStart_ = state_.start;
}

ProgressReporter::~ProgressReporter() {
    if (!finished_) {
        finish(false);
    }
}

ProgressReporter::Clock::time_point ProgressReporter::now() const {
    return options_.now ? options_.now() : Clock::now();
}

void ProgressReporter::advance(std::uint64_t n) {
    if (finished_ || n == 0)
        return;

    position_ += n;
    state_.bytes = std::max(state_.bytes, position_);
    sampleBytes_ += n;

    const auto t = now();
    state_.lastUpdate = t;

    const auto dt = t - sampleStart_;
    if (dt < options_.minSampleInterval)
        return;

    const double seconds = std::chrono::duration<double>(dt).count();
    const double instant = static_cast<double>(sampleBytes_) / seconds;
    rateBps_ = haveRate_ ? options_.smoothing * instant + (1.0 - options_.smoothing) * rateBps_
                         : instant;
    haveRate_ = true;
    sampleBytes_ = 0;
    sampleStart_ = t;
}

void ProgressReporter::setTotal(std::optional<std::uint64_t> totalBytes) {
    state_.total = totalBytes;
}

void ProgressReporter::restart(std::optional<std::uint64_t> totalBytes) {
    if (finished_)
        return;
    spdlog::debug("Progress for {} restarts from zero (reported {} bytes)", url_, state_.bytes);
    position_ = 0;
    state_.total = totalBytes;
    state_.phase = TransferPhase::Streaming;
    state_.lastUpdate = now();
    sampleBytes_ = 0;
    sampleStart_ = state_.lastUpdate;
}

void ProgressReporter::setPhase(TransferPhase phase) {
    if (finished_)
        return;
    state_.phase = phase;
}

ProgressSnapshot ProgressReporter::snapshot() const {
    ProgressSnapshot snap;
    snap.url = url_;
    snap.downloadedBytes = state_.bytes;
    snap.totalBytes = state_.total;
    snap.phase = state_.phase;
    snap.timestamp = state_.lastUpdate;
    snap.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(state_.lastUpdate - state_.start);

    if (haveRate_)
        snap.speedBps = static_cast<std::uint64_t>(std::llround(rateBps_));

    if (state_.total) {
        const auto total = *state_.total;
        if (total == 0) {
            snap.percentage = 100.0f;
        } else {
            const double pct = static_cast<double>(state_.bytes) * 100.0 / static_cast<double>(total);
            snap.percentage = static_cast<float>(std::min(pct, 100.0));
        }

        const auto remaining = total > state_.bytes ? total - state_.bytes : 0;
        if (remaining == 0) {
            snap.etaSeconds = 0;
        } else if (haveRate_ && rateBps_ > 0.0) {
            snap.etaSeconds =
                static_cast<std::uint32_t>(std::ceil(static_cast<double>(remaining) / rateBps_));
        }
    }
    return snap;
}

void ProgressReporter::publish() const {
    if (finished_ || !onProgress_)
        return;
    onProgress_(snapshot());
}

void ProgressReporter::finish(bool completed) {
    if (finished_)
        return;
    state_.phase = completed ? TransferPhase::Done : TransferPhase::Failed;
    state_.lastUpdate = now();
    if (!completed) {
        spdlog::debug("Progress for {} closed before completion at {} bytes", url_, state_.bytes);
    }
    if (onProgress_) {
        try {
            onProgress_(snapshot());
        } catch (const std::exception& ex) {
            spdlog::warn("Progress callback threw on finish: {}", ex.what());
        }
    }
    finished_ = true;
}

} // namespace convey::downloader
