/*
 * convey/src/downloader/download_manager.cpp
 *
 * DownloadManager (single-stream, resumable):
 * - Resolving: probe the resource, resolve the filename, compute the destination
 * - Streaming: open (or resume) "<destination>.part" and feed the body through a
 *   chunk buffer into the disk writer, SHA-256 and the progress reporter
 * - Retry transient failures from the current staging length with exponential backoff
 * - Finalizing: sync, optional checksum verification, size check, atomic rename
 * - Optional files cache short-circuits the network for URLs seen before
 *
 * Invariants
 * - The destination is only ever written by IDiskWriter::finalize (atomic rename)
 * - The staging file only ever holds a contiguous prefix of one resource version; on
 *   cancellation it holds whole chunks only
 * - Cancellation and the request deadline are checked at every chunk boundary
 */

#include <convey/downloader/backoff.hpp>
#include <convey/downloader/downloader.hpp>
#include <convey/downloader/filename_resolver.hpp>
#include <convey/downloader/files_cache.hpp>
#include <convey/downloader/http_headers.hpp>
#include <convey/downloader/progress_reporter.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace convey::downloader {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kSleepSlice = std::chrono::milliseconds{50};

// Request fields merged with the manager defaults.
struct EffectiveSettings {
    std::size_t chunkSize{0};
    RetryPolicy retry{};
    bool resume{true};
    bool useCache{false};
    HttpOptions http{};
};

EffectiveSettings effectiveSettings(const DownloaderConfig& cfg, const DownloadRequest& req,
                                    bool haveCache) {
    EffectiveSettings s;
    s.chunkSize = req.chunkSizeBytes != 0 ? req.chunkSizeBytes : cfg.defaultChunkSizeBytes;
    s.chunkSize = std::max<std::size_t>(1, s.chunkSize);
    s.retry = req.retry.value_or(cfg.retry);
    s.resume = req.resume && cfg.resume;
    s.useCache = (req.useCache || cfg.useCache) && haveCache && !downloadCacheDisabledByEnv();

    s.http.headers = req.headers;
    s.http.userAgent = req.userAgent.empty() ? cfg.userAgent : req.userAgent;
    s.http.tls = req.tls;
    s.http.proxy = req.proxy;
    s.http.timeout = req.timeout.count() > 0 ? req.timeout : cfg.defaultTimeout;
    s.http.followRedirects = req.followRedirects && cfg.followRedirects;
    return s;
}

fs::path destinationDirFor(const DownloadRequest& req) {
    if (req.destinationDir)
        return *req.destinationDir;
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? fs::path{"."} : cwd;
}

std::optional<std::string> ifRangeValidator(const RemoteResource& res) {
    // Weak entity tags are not allowed in If-Range.
    if (res.etag && !res.etag->empty() && res.etag->rfind("W/", 0) != 0)
        return "\"" + *res.etag + "\"";
    if (res.lastModified && !res.lastModified->empty())
        return res.lastModified;
    return std::nullopt;
}

enum class ResumeVerdict { Match, Mismatch, Unverifiable };

ResumeVerdict compareValidators(const std::optional<IResumeStore::State>& saved,
                                const RemoteResource& res) {
    if (!saved)
        return ResumeVerdict::Unverifiable;
    if (saved->url != res.url)
        return ResumeVerdict::Mismatch;
    if (saved->etag && res.etag)
        return *saved->etag == *res.etag ? ResumeVerdict::Match : ResumeVerdict::Mismatch;
    if (saved->lastModified && res.lastModified) {
        return *saved->lastModified == *res.lastModified ? ResumeVerdict::Match
                                                         : ResumeVerdict::Mismatch;
    }
    if (saved->totalBytes != 0 && res.contentLength && saved->totalBytes != *res.contentLength)
        return ResumeVerdict::Mismatch;
    return ResumeVerdict::Unverifiable;
}

// Feed the first `length` bytes of an existing staging file to the verifier.
Expected<void> hashPrefix(const fs::path& file, std::uint64_t length, IIntegrityVerifier& v) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::DestinationError, "Failed to read staging file " + file.string()};
    }
    std::array<char, 1 << 16> buffer{};
    std::uint64_t remaining = length;
    while (remaining > 0) {
        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(buffer.size())));
        in.read(buffer.data(), want);
        const auto got = in.gcount();
        if (got <= 0) {
            return Error{ErrorCode::DestinationError,
                         "Short read while hashing staging file " + file.string()};
        }
        v.update(std::span<const std::byte>(reinterpret_cast<const std::byte*>(buffer.data()),
                                            static_cast<std::size_t>(got)));
        remaining -= static_cast<std::uint64_t>(got);
    }
    return Expected<void>{};
}

/*
 * One download() invocation. Owns every piece of mutable transfer state (chunk buffer,
 * verifier, progress reporter), so concurrent calls on one manager share nothing but the
 * stateless collaborators.
 */
class Transfer {
public:
    Transfer(const DownloaderConfig& cfg, IHttpAdapter& http, IDiskWriter& disk,
             IResumeStore& resume, FilesCache* cache, const DownloadRequest& req,
             const ProgressCallback& onProgress, const ShouldCancel& shouldCancel,
             FinalResult& out)
        : cfg_(cfg), http_(http), disk_(disk), resume_(resume), cache_(cache), req_(req),
          onProgress_(onProgress), shouldCancel_(shouldCancel), out_(out),
          settings_(effectiveSettings(cfg, req, cache != nullptr)),
          verifier_(makeIntegrityVerifierSha256Only()), deadline_(req.deadline) {
        if (req.timeBudget) {
            const auto budgetEnd = Clock::now() + *req.timeBudget;
            if (!deadline_ || budgetEnd < *deadline_)
                deadline_ = budgetEnd;
        }
    }

    Expected<void> run() {
        emitPhase(TransferPhase::Resolving);
        if (req_.url.empty()) {
            emitPhase(TransferPhase::Failed);
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }
        if (auto stop = checkStop()) {
            emitPhase(TransferPhase::Failed);
            return *stop;
        }

        if (settings_.useCache) {
            auto served = serveFromCache();
            if (!served.ok()) {
                emitPhase(TransferPhase::Failed);
                return served.error();
            }
            if (served.value())
                return Expected<void>{};
        }

        auto rr = resolve();
        if (!rr.ok()) {
            emitPhase(TransferPhase::Failed);
            return rr;
        }

        auto sr = stream();
        if (sr.ok())
            sr = finalize();
        if (!sr.ok())
            emitPhase(TransferPhase::Failed);

        if (!sr.ok() && sr.error().code != ErrorCode::Cancelled && req_.cleanupOnFailure &&
            !staging_.empty()) {
            spdlog::debug("Removing staging file {} after failure", staging_.string());
            disk_.cleanup(staging_);
            resume_.remove(staging_);
        }
        return sr;
    }

private:
    // ---- Resolving ----

    Expected<void> resolve() {
        auto probe = http_.probe(req_.url, settings_.http);
        if (!probe.ok()) {
            return probe.error();
        }
        adoptResource(std::move(probe).value());

        if (req_.destination) {
            out_.destination = *req_.destination;
        } else {
            auto name = resolveFilename(resource_, req_.filename);
            if (!name.ok())
                return name.error();
            out_.destination = destinationDirFor(req_) / name.value().name;
        }
        out_.stagingPath = stagingPathFor(out_.destination);

        std::error_code ec;
        if (req_.overwrite == OverwritePolicy::Never && fs::exists(out_.destination, ec)) {
            return Error{ErrorCode::DestinationError,
                         "Destination exists and overwrite=never: " + out_.destination.string()};
        }
        return Expected<void>{};
    }

    // ---- Cache ----

    // true when the request was satisfied from the files cache.
    Expected<bool> serveFromCache() {
        auto hit = cache_->lookup(req_.url);
        if (!hit)
            return false;

        fs::path dest;
        if (req_.destination) {
            dest = *req_.destination;
        } else {
            auto name = req_.filename ? sanitizeFilename(*req_.filename) : std::string{};
            if (name.empty())
                name = hit->filename().string();
            dest = destinationDirFor(req_) / name;
        }

        std::error_code ec;
        if (req_.overwrite == OverwritePolicy::Never && fs::exists(dest, ec)) {
            return Error{ErrorCode::DestinationError,
                         "Destination exists and overwrite=never: " + dest.string()};
        }

        const auto staging = stagingPathFor(dest);
        fs::create_directories(staging.parent_path().empty() ? fs::path{"."}
                                                             : staging.parent_path(),
                               ec);
        fs::copy_file(*hit, staging, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::warn("Cannot use cached copy {} ({}); downloading", hit->string(),
                         ec.message());
            return false;
        }

        auto sha = computeFileSha256(staging);
        if (!sha || (req_.checksum && http::toLower(req_.checksum->hex) != *sha)) {
            spdlog::warn("Cached copy of {} failed verification; downloading again", req_.url);
            disk_.cleanup(staging);
            return false;
        }

        const auto size = fs::file_size(staging, ec);
        if (ec) {
            disk_.cleanup(staging);
            return false;
        }
        auto fr = disk_.finalize(staging, dest, static_cast<std::uint64_t>(size));
        if (!fr.ok())
            return fr.error();
        resume_.remove(staging);

        out_.destination = dest;
        out_.stagingPath = staging;
        out_.sizeBytes = static_cast<std::uint64_t>(size);
        out_.sha256 = *sha;
        out_.fromCache = true;

        ProgressEvent ev;
        ev.url = req_.url;
        ev.downloadedBytes = out_.sizeBytes;
        ev.totalBytes = out_.sizeBytes;
        ev.percentage = 100.0f;
        ev.phase = TransferPhase::Done;
        if (onProgress_)
            onProgress_(ev);

        spdlog::info("Served {} from cache -> {}", req_.url, dest.string());
        return true;
    }

    // ---- Streaming ----

    Expected<void> stream() {
        std::uint64_t existing = 0;
        auto opened = disk_.openStaging(out_.destination, settings_.resume, existing);
        if (!opened.ok())
            return opened.error();
        staging_ = opened.value();

        std::uint64_t offset = 0;
        if (existing > 0) {
            if (canResume(existing)) {
                offset = existing;
            } else {
                auto tr = disk_.truncate(staging_, 0);
                if (!tr.ok())
                    return tr.error();
            }
        }

        saveSidecar();

        verifier_->reset(HashAlgo::Sha256);
        if (offset > 0) {
            auto hr = hashPrefix(staging_, offset, *verifier_);
            if (!hr.ok())
                return hr;
            spdlog::info("Resuming {} at byte {}", req_.url, offset);
        }
        out_.resumedFrom = offset;
        written_ = offset;

        reporter_.emplace(req_.url, resource_.contentLength, offset, onProgress_);
        reporter_->publish();

        if (resource_.contentLength && written_ == *resource_.contentLength) {
            spdlog::debug("Staging file for {} is already complete", req_.url);
            return Expected<void>{};
        }

        auto sink = [this](std::span<const std::byte> data) -> Expected<void> {
            return accept(data);
        };

        BackoffSchedule schedule(settings_.retry);
        schedule.beginAttempt();
        bool restarted = false;

        for (;;) {
            out_.attempts = schedule.attempts();
            if (auto stop = checkStop())
                return *stop;

            buffer_.clear();
            buffer_.reserve(settings_.chunkSize);
            auto fr = http_.fetchRange(req_.url, settings_.http, written_,
                                       ifRangeValidator(resource_), sink);
            if (fr.ok())
                return flushBuffer();

            const Error err = fr.error();
            if (err.code == ErrorCode::Cancelled) {
                // Partial chunk is dropped so the staging file holds whole chunks only.
                spdlog::info("Download of {} cancelled at byte {}", req_.url, written_);
                return err;
            }
            if (deadlineHit_) {
                auto fl = flushBuffer();
                if (!fl.ok())
                    return fl;
                return err;
            }

            if (err.code == ErrorCode::RangeNotHonored) {
                if (restarted || written_ == 0) {
                    return Error{ErrorCode::ServerError,
                                 "Server keeps ignoring range requests: " + err.message};
                }
                restarted = true;
                auto rr = restartFromZero(err);
                if (!rr.ok())
                    return rr;
                continue;
            }

            auto fl = flushBuffer();
            if (!fl.ok())
                return fl;

            if (!isTransient(err.code))
                return err;

            auto delay = schedule.nextDelay();
            if (!delay) {
                return Error{err.code, "Giving up after " + std::to_string(schedule.attempts()) +
                                           " attempts: " + err.message};
            }
            spdlog::warn("Attempt {}/{} for {} failed at byte {} ({}); retrying in {} ms",
                         schedule.attempts(), schedule.maxAttempts(), req_.url, written_,
                         err.message, delay->count());
            if (auto stop = sleepUnlessStopped(*delay))
                return *stop;
            schedule.beginAttempt();
        }
    }

    bool canResume(std::uint64_t existing) {
        if (!resource_.acceptsRanges) {
            spdlog::info("{} does not support range requests; restarting from zero", req_.url);
            return false;
        }
        if (resource_.contentLength && existing > *resource_.contentLength) {
            spdlog::info("Staging file for {} is larger than the resource; restarting",
                         req_.url);
            return false;
        }

        std::optional<IResumeStore::State> saved;
        auto loaded = resume_.load(staging_);
        if (loaded.ok()) {
            saved = loaded.value();
        } else {
            spdlog::warn("Cannot read resume sidecar for {}: {}", staging_.string(),
                         loaded.error().message);
        }

        switch (compareValidators(saved, resource_)) {
            case ResumeVerdict::Match:
                return true;
            case ResumeVerdict::Mismatch:
                spdlog::info("{} changed since the interrupted transfer; restarting from zero",
                             req_.url);
                return false;
            case ResumeVerdict::Unverifiable:
                break;
        }
        if (!cfg_.resumeWithoutValidators) {
            spdlog::info("Cannot verify that {} is unchanged; restarting from zero", req_.url);
            return false;
        }
        spdlog::warn("Resuming {} without validators; content is assumed unchanged", req_.url);
        return true;
    }

    // The server answered in full: the resource changed (If-Range mismatch) or ranges
    // are ignored. Re-probe so length and validators describe the body about to arrive.
    Expected<void> restartFromZero(const Error& cause) {
        spdlog::warn("{} ({}); restarting from zero", req_.url, cause.message);
        buffer_.clear();

        auto probe = http_.probe(req_.url, settings_.http);
        if (!probe.ok())
            return probe.error();
        const auto previousEtag = resource_.etag;
        adoptResource(std::move(probe).value());
        if (previousEtag != resource_.etag) {
            spdlog::info("{} changed during the transfer (ETag {} -> {})", req_.url,
                         previousEtag.value_or("none"), resource_.etag.value_or("none"));
        }

        auto tr = disk_.truncate(staging_, 0);
        if (!tr.ok())
            return tr;
        saveSidecar();
        verifier_->reset(HashAlgo::Sha256);
        written_ = 0;
        out_.resumedFrom = 0;
        reporter_->restart(resource_.contentLength);
        reporter_->publish();
        return Expected<void>{};
    }

    // Chunk boundary: buffer incoming bytes and flush every full chunk.
    Expected<void> accept(std::span<const std::byte> data) {
        const auto chunk = settings_.chunkSize;
        while (!data.empty()) {
            const auto take = std::min(chunk - buffer_.size(), data.size());
            buffer_.insert(buffer_.end(), data.begin(), data.begin() + take);
            data = data.subspan(take);
            if (buffer_.size() == chunk) {
                auto r = flushBuffer();
                if (!r.ok())
                    return r;
                if (auto stop = checkStop())
                    return *stop;
            }
        }
        return Expected<void>{};
    }

    Expected<void> flushBuffer() {
        if (buffer_.empty())
            return Expected<void>{};
        const std::span<const std::byte> data(buffer_.data(), buffer_.size());
        auto wr = disk_.writeAt(staging_, written_, data);
        if (!wr.ok()) {
            buffer_.clear();
            return wr;
        }
        verifier_->update(data);
        written_ += data.size();
        reporter_->advance(data.size());
        buffer_.clear();
        reporter_->publish();
        return Expected<void>{};
    }

    // ---- Finalizing ----

    Expected<void> finalize() {
        reporter_->setPhase(TransferPhase::Finalizing);
        reporter_->publish();

        auto sr = disk_.sync(staging_);
        if (!sr.ok())
            return sr;

        auto digest = verifier_->finalize();
        if (digest.hex.empty()) {
            return Error{ErrorCode::Unknown, "Failed to finalize checksum"};
        }

        if (req_.checksum) {
            const auto expected = http::toLower(req_.checksum->hex);
            if (expected != digest.hex) {
                // Known-bad bytes are never worth resuming.
                disk_.cleanup(staging_);
                resume_.remove(staging_);
                return Error{ErrorCode::ChecksumMismatch,
                             "Checksum mismatch (expected " + expected + ", got " + digest.hex +
                                 ")"};
            }
        }

        std::error_code ec;
        if (req_.overwrite == OverwritePolicy::Never && fs::exists(out_.destination, ec)) {
            return Error{ErrorCode::DestinationError,
                         "Destination appeared during download and overwrite=never: " +
                             out_.destination.string()};
        }

        auto fr = disk_.finalize(staging_, out_.destination, resource_.contentLength);
        if (!fr.ok())
            return fr.error();
        resume_.remove(staging_);

        out_.destination = fr.value();
        out_.sizeBytes = written_;
        out_.sha256 = digest.hex;

        if (settings_.useCache) {
            auto cr = cache_->store(req_.url, out_.destination);
            if (!cr.ok()) {
                spdlog::warn("Failed to cache {}: {}", req_.url, cr.error().message);
            }
        }

        reporter_->finish(true);
        spdlog::info("Downloaded {} -> {} ({} bytes, {} attempt(s))", req_.url,
                     out_.destination.string(), out_.sizeBytes, out_.attempts);
        return Expected<void>{};
    }

    // ---- Helpers ----

    void adoptResource(RemoteResource fresh) {
        resource_ = std::move(fresh);
        if (resource_.url.empty())
            resource_.url = req_.url;
        out_.httpStatus = resource_.httpStatus;
        out_.etag = resource_.etag;
        out_.lastModified = resource_.lastModified;
        out_.contentType = resource_.contentType;
    }

    void saveSidecar() {
        auto saved = resume_.save(staging_, IResumeStore::State{resource_.url, resource_.etag,
                                                                resource_.lastModified,
                                                                resource_.contentLength.value_or(0)});
        if (!saved.ok()) {
            spdlog::warn("Resume sidecar not written ({}); a later resume cannot be verified",
                         saved.error().message);
        }
    }

    std::optional<Error> checkStop() {
        if (shouldCancel_ && shouldCancel_()) {
            return Error{ErrorCode::Cancelled, "Cancelled by caller"};
        }
        if (deadline_ && Clock::now() >= *deadline_) {
            deadlineHit_ = true;
            return Error{ErrorCode::Timeout, "Deadline exceeded"};
        }
        return std::nullopt;
    }

    std::optional<Error> sleepUnlessStopped(std::chrono::milliseconds delay) {
        const auto until = Clock::now() + delay;
        for (;;) {
            if (auto stop = checkStop())
                return stop;
            const auto now = Clock::now();
            if (now >= until)
                return std::nullopt;
            std::this_thread::sleep_for(std::min<Clock::duration>(kSleepSlice, until - now));
        }
    }

    void emitPhase(TransferPhase phase) {
        if (reporter_) {
            if (phase == TransferPhase::Failed) {
                reporter_->finish(false);
            } else {
                reporter_->setPhase(phase);
                reporter_->publish();
            }
            return;
        }
        if (!onProgress_)
            return;
        ProgressEvent ev;
        ev.url = req_.url;
        ev.phase = phase;
        onProgress_(ev);
    }

    const DownloaderConfig& cfg_;
    IHttpAdapter& http_;
    IDiskWriter& disk_;
    IResumeStore& resume_;
    FilesCache* cache_;
    const DownloadRequest& req_;
    const ProgressCallback& onProgress_;
    const ShouldCancel& shouldCancel_;
    FinalResult& out_;

    EffectiveSettings settings_;
    std::unique_ptr<IIntegrityVerifier> verifier_;
    RemoteResource resource_{};
    fs::path staging_{};
    std::vector<std::byte> buffer_{};
    std::uint64_t written_{0};
    std::optional<Clock::time_point> deadline_{};
    bool deadlineHit_{false};
    std::optional<ProgressReporter> reporter_{};
};

} // namespace

// ---- DownloadManager implementation ----
class DownloadManager final : public IDownloadManager {
public:
    DownloadManager(DownloaderConfig cfg, std::unique_ptr<IHttpAdapter> http = nullptr,
                    std::unique_ptr<IDiskWriter> disk = nullptr,
                    std::unique_ptr<IResumeStore> resume = nullptr)
        : config_(std::move(cfg)), http_(std::move(http)), disk_(std::move(disk)),
          resume_(std::move(resume)) {
        if (!http_)
            http_ = makeCurlHttpAdapter();
        if (!disk_)
            disk_ = makeDiskWriter();
        if (!resume_)
            resume_ = makeJsonResumeStore();
        if (!config_.cacheDir.empty())
            cache_.emplace(config_.cacheDir);
    }

    FinalResult download(const DownloadRequest& request, const ProgressCallback& onProgress,
                         const ShouldCancel& shouldCancel) override {
        const auto started = Clock::now();
        FinalResult out;
        out.url = request.url;

        try {
            Transfer transfer(config_, *http_, *disk_, *resume_, cache_ ? &*cache_ : nullptr,
                              request, onProgress, shouldCancel, out);
            auto r = transfer.run();
            if (r.ok()) {
                out.status = DownloadStatus::Completed;
            } else if (r.error().code == ErrorCode::Cancelled) {
                out.status = DownloadStatus::Cancelled;
                out.error = r.error();
            } else {
                out.status = DownloadStatus::Failed;
                out.error = r.error();
            }
        } catch (const std::exception& ex) {
            out.status = DownloadStatus::Failed;
            out.error = Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
        }

        if (out.status == DownloadStatus::Failed && out.error) {
            spdlog::debug("Download of {} failed: {} ({})", request.url, out.error->message,
                          errorCodeName(out.error->code));
        }
        out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        return out;
    }

    std::vector<FinalResult> downloadMany(const std::vector<DownloadRequest>& requests,
                                          const ProgressCallback& onProgress,
                                          const ShouldCancel& shouldCancel) override {
        std::vector<FinalResult> results;
        results.reserve(requests.size());
        for (const auto& r : requests) {
            if (shouldCancel && shouldCancel()) {
                FinalResult skipped;
                skipped.url = r.url;
                skipped.status = DownloadStatus::Cancelled;
                skipped.error = Error{ErrorCode::Cancelled, "Cancelled before start"};
                results.push_back(std::move(skipped));
                continue;
            }
            results.push_back(download(r, onProgress, shouldCancel));
        }
        return results;
    }

    Expected<std::string> resolveName(const DownloadRequest& request) override {
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }
        if (request.destination) {
            return request.destination->filename().string();
        }
        auto settings = effectiveSettings(config_, request, false);
        auto probe = http_->probe(request.url, settings.http);
        if (!probe.ok())
            return probe.error();
        auto resource = std::move(probe).value();
        if (resource.url.empty())
            resource.url = request.url;
        auto name = resolveFilename(resource, request.filename);
        if (!name.ok())
            return name.error();
        return name.value().name;
    }

    Expected<void> discard(const DownloadRequest& request) override {
        fs::path destination;
        if (request.destination) {
            destination = *request.destination;
        } else {
            std::string name = request.filename ? sanitizeFilename(*request.filename) : "";
            if (name.empty()) {
                auto resolved = resolveName(request);
                if (!resolved.ok())
                    return resolved.error();
                name = resolved.value();
            }
            destination = destinationDirFor(request) / name;
        }

        const auto staging = stagingPathFor(destination);
        spdlog::info("Discarding staging file {}", staging.string());
        disk_->cleanup(staging);
        resume_->remove(staging);
        return Expected<void>{};
    }

    void clearCache() override {
        if (!cache_) {
            spdlog::debug("No download cache configured");
            return;
        }
        auto r = cache_->clear();
        if (!r.ok()) {
            spdlog::warn("{}", r.error().message);
        }
    }

    [[nodiscard]] DownloaderConfig config() const override { return config_; }

private:
    DownloaderConfig config_;

    std::unique_ptr<IHttpAdapter> http_;
    std::unique_ptr<IDiskWriter> disk_;
    std::unique_ptr<IResumeStore> resume_;
    std::optional<FilesCache> cache_;
};

std::unique_ptr<IDownloadManager>
makeDownloadManagerWithDependencies(const DownloaderConfig& cfg, std::unique_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IDiskWriter> disk,
                                    std::unique_ptr<IResumeStore> resume) {
    return std::make_unique<DownloadManager>(cfg, std::move(http), std::move(disk),
                                             std::move(resume));
}

std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg) {
    return makeDownloadManagerWithDependencies(cfg, nullptr, nullptr, nullptr);
}

} // namespace convey::downloader
