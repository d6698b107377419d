#pragma once

/*
 * convey downloader - public types and manager interfaces (C++20)
 *
 * This header defines the data types and abstract interfaces of the streaming
 * download engine. It contains no implementation details.
 *
 * Design principles:
 * - The destination path only ever receives a complete file, promoted from an
 *   adjacent staging file ("<destination>.part") by an atomic rename
 * - Interrupted transfers leave their staging file behind so a later call can resume
 * - Cooperative cancellation and progress reporting at chunk boundaries
 * - Clear separation of concerns (HTTP adapter, disk writer, resume sidecar,
 *   integrity verification, progress accounting)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace convey::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo { Sha256 };

/**
 * Destination overwrite behavior.
 */
enum class OverwritePolicy { Never, Always };

/**
 * Lifecycle phase of a single transfer.
 */
enum class TransferPhase { Resolving, Streaming, Finalizing, Done, Failed };

/**
 * Terminal outcome of a download call.
 */
enum class DownloadStatus { Completed, Cancelled, Failed };

/**
 * Canonical error codes for downloader operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    ResolutionFailed,
    Unreachable,
    TransientNetwork,
    Timeout,
    ServerError,
    RangeNotHonored,
    IncompleteTransfer,
    DestinationError,
    ChecksumMismatch,
    Cancelled,
    Unknown
};

constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::ResolutionFailed:
            return "ResolutionError";
        case ErrorCode::Unreachable:
            return "UnreachableError";
        case ErrorCode::TransientNetwork:
            return "TransientNetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::RangeNotHonored:
            return "RangeNotHonored";
        case ErrorCode::IncompleteTransfer:
            return "IncompleteTransferError";
        case ErrorCode::DestinationError:
            return "DestinationError";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * Errors worth another attempt with resume-from-offset.
 */
constexpr bool isTransient(ErrorCode code) {
    return code == ErrorCode::TransientNetwork || code == ErrorCode::Timeout;
}

constexpr const char* phaseName(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Resolving:
            return "resolving";
        case TransferPhase::Streaming:
            return "streaming";
        case TransferPhase::Finalizing:
            return "finalizing";
        case TransferPhase::Done:
            return "done";
        case TransferPhase::Failed:
            return "failed";
    }
    return "unknown";
}

inline constexpr std::string_view kStagingSuffix = ".part";
inline constexpr std::string_view kDefaultUserAgent = "Mozilla/5.0";

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex; // lower-case hex
};

/**
 * Retry/backoff policy. maxAttempts counts the first attempt.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Downloader default configuration.
 */
struct DownloaderConfig {
    std::size_t defaultChunkSizeBytes{64ull * 1024ull}; // 64 KiB
    std::chrono::milliseconds defaultTimeout{60000};
    RetryPolicy retry{};
    bool followRedirects{true};
    bool resume{true};
    // Resume a staging file even when the server exposes no ETag/Last-Modified.
    bool resumeWithoutValidators{true};
    bool useCache{false};
    std::string userAgent{kDefaultUserAgent};
    std::filesystem::path cacheDir{}; // empty = no cache available
};

/**
 * Immutable description of a remote resource, as reported by a probe.
 */
struct RemoteResource {
    std::string url;
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> declaredFilename{}; // from Content-Disposition
    std::optional<std::string> contentType{};
    std::optional<std::string> etag{};
    std::optional<std::string> lastModified{};
    bool acceptsRanges{false};
    std::optional<int> httpStatus{};
};

/**
 * A single download request.
 * Destination is `destination` when set, otherwise `destinationDir / <resolved filename>`.
 */
struct DownloadRequest {
    std::string url;

    std::optional<std::string> filename;              // explicit override
    std::optional<std::filesystem::path> destinationDir; // default: current directory
    std::optional<std::filesystem::path> destination;    // explicit full path

    std::vector<Header> headers;
    std::string userAgent; // empty = DownloaderConfig::userAgent
    std::optional<Checksum> checksum;

    std::size_t chunkSizeBytes{0}; // 0 = DownloaderConfig::defaultChunkSizeBytes
    std::chrono::milliseconds timeout{0}; // 0 = DownloaderConfig::defaultTimeout
    std::optional<RetryPolicy> retry;     // default: DownloaderConfig::retry

    bool resume{true};    // combined with DownloaderConfig::resume
    bool useCache{false}; // or DownloaderConfig::useCache
    bool cleanupOnFailure{false};
    OverwritePolicy overwrite{OverwritePolicy::Always};

    std::optional<std::string> proxy;
    TlsConfig tls{};
    bool followRedirects{true};

    // Checked at chunk boundaries like cancellation.
    std::optional<std::chrono::steady_clock::time_point> deadline;
    // Overall budget measured from the start of download(); the earlier of the two wins.
    std::optional<std::chrono::milliseconds> timeBudget;
};

/**
 * Value snapshot of a transfer's progress.
 */
struct ProgressEvent {
    std::string url;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<float> percentage{}; // 0.0 - 100.0 (approx)
    std::optional<std::uint64_t> speedBps{};
    std::optional<std::uint32_t> etaSeconds{};
    std::chrono::milliseconds elapsed{0};
    TransferPhase phase{TransferPhase::Streaming};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

using ProgressSnapshot = ProgressEvent;

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Outcome of a download call.
 */
struct FinalResult {
    std::string url;
    DownloadStatus status{DownloadStatus::Failed};

    std::filesystem::path destination; // final path (or intended path when not completed)
    std::filesystem::path stagingPath;
    std::uint64_t sizeBytes{0};
    std::string sha256; // lower-case hex, empty unless completed

    int attempts{0};
    std::uint64_t resumedFrom{0};
    bool fromCache{false};

    std::optional<int> httpStatus{};
    std::optional<std::string> etag{};
    std::optional<std::string> lastModified{};
    std::optional<std::string> contentType{};

    std::optional<Error> error{};

    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool completed() const noexcept { return status == DownloadStatus::Completed; }
    [[nodiscard]] bool cancelled() const noexcept { return status == DownloadStatus::Cancelled; }
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel at the next chunk boundary
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Options shared by every request an adapter issues for one transfer.
 */
struct HttpOptions {
    std::vector<Header> headers;
    std::string userAgent{kDefaultUserAgent};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::chrono::milliseconds timeout{60000};
    bool followRedirects{true};
};

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 *
 * Error contract:
 * - probe(): Unreachable when the resource cannot be opened at all (DNS, connect,
 *   4xx/5xx status).
 * - fetchRange(): TransientNetwork/Timeout for retryable mid-stream failures,
 *   RangeNotHonored when offset > 0 and the server answered with the full body,
 *   ServerError for non-retryable HTTP statuses, and the sink's own error verbatim
 *   when the sink rejected data (this is how cancellation propagates).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Probe server metadata (HEAD preferred) for range capability, size, validators and
     * declared filename.
     */
    virtual Expected<RemoteResource> probe(std::string_view url, const HttpOptions& options) = 0;

    /**
     * Open the resource at `offset` and stream bytes to `sink` until EOF.
     * When `ifRange` holds a validator it is sent as If-Range so a modified resource
     * is answered in full (reported as RangeNotHonored).
     * The sink may be called multiple times on the calling thread with buffers of any size.
     */
    virtual Expected<void> fetchRange(std::string_view url, const HttpOptions& options,
                                      std::uint64_t offset,
                                      const std::optional<std::string>& ifRange,
                                      const ByteSink& sink) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Disk writer owning the staging file of a transfer.
 * The destination path must only ever be created or replaced by finalize().
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Open the staging file for `destination` ("<destination>.part").
     * - resume == true: keep an existing staging file and report its length in currentSize
     * - resume == false: create or truncate it (currentSize = 0)
     * Parent directories are created; the file is private (0600) on POSIX.
     */
    virtual Expected<std::filesystem::path> openStaging(const std::filesystem::path& destination,
                                                        bool resume,
                                                        /* out */ std::uint64_t& currentSize) = 0;

    /**
     * Write a contiguous block at a specific offset.
     */
    virtual Expected<void> writeAt(const std::filesystem::path& stagingFile, std::uint64_t offset,
                                   std::span<const std::byte> data) = 0;

    /**
     * Shrink (or extend) the staging file to `size` bytes.
     */
    virtual Expected<void> truncate(const std::filesystem::path& stagingFile,
                                    std::uint64_t size) = 0;

    /**
     * Ensure data durability (fsync file and its directory).
     */
    virtual Expected<void> sync(const std::filesystem::path& stagingFile) = 0;

    /**
     * Verify the staging size against expectedSize (when known) and promote the staging
     * file to destination with an atomic rename.
     */
    virtual Expected<std::filesystem::path> finalize(const std::filesystem::path& stagingFile,
                                                     const std::filesystem::path& destination,
                                                     std::optional<std::uint64_t> expectedSize) = 0;

    /**
     * Best-effort cleanup of a staging file.
     */
    virtual void cleanup(const std::filesystem::path& stagingFile) noexcept = 0;
};

/**
 * Resume sidecar persistence: which resource version an interrupted staging file holds.
 */
class IResumeStore {
public:
    struct State {
        std::string url;
        std::optional<std::string> etag;
        std::optional<std::string> lastModified;
        std::uint64_t totalBytes{0}; // 0 if unknown
    };

    virtual ~IResumeStore() = default;

    virtual Expected<std::optional<State>> load(const std::filesystem::path& stagingFile) = 0;
    virtual Expected<void> save(const std::filesystem::path& stagingFile, const State& state) = 0;
    virtual void remove(const std::filesystem::path& stagingFile) noexcept = 0;
};

/**
 * Download manager abstraction (orchestrates adapter/writer/integrity/resume/progress).
 */
class IDownloadManager {
public:
    virtual ~IDownloadManager() = default;

    /**
     * Execute a single request. Never throws; failures are reported through
     * FinalResult::status == Failed with FinalResult::error set.
     */
    virtual FinalResult download(const DownloadRequest& request,
                                 const ProgressCallback& onProgress = {},
                                 const ShouldCancel& shouldCancel = {}) = 0;

    /**
     * Execute multiple requests sequentially. Order of results matches the order of requests.
     */
    virtual std::vector<FinalResult> downloadMany(const std::vector<DownloadRequest>& requests,
                                                  const ProgressCallback& onProgress = {},
                                                  const ShouldCancel& shouldCancel = {}) = 0;

    /**
     * Resolve the filename a request would be stored under (probes the remote).
     */
    virtual Expected<std::string> resolveName(const DownloadRequest& request) = 0;

    /**
     * Explicitly discard the staging file and sidecar of a request's destination.
     */
    virtual Expected<void> discard(const DownloadRequest& request) = 0;

    /**
     * Delete every cached download.
     */
    virtual void clearCache() = 0;

    [[nodiscard]] virtual DownloaderConfig config() const = 0;
};

// ======================
// Utility path builders
// ======================

[[nodiscard]] inline std::filesystem::path stagingPathFor(const std::filesystem::path& destination) {
    auto p = destination;
    p += std::string(kStagingSuffix);
    return p;
}

[[nodiscard]] inline std::filesystem::path sidecarPathFor(const std::filesystem::path& stagingFile) {
    auto p = stagingFile;
    p += ".json";
    return p;
}

// ==========
// Factories
// ==========

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IResumeStore> makeJsonResumeStore();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256Only();

/**
 * Compute the SHA-256 of a file, or std::nullopt if it cannot be read.
 */
std::optional<std::string> computeFileSha256(const std::filesystem::path& path);

/**
 * SHA-256 of an in-memory string (lower-case hex).
 */
std::string sha256Hex(std::string_view data);

/**
 * Factory function to create a default DownloadManager instance.
 */
std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg);

/**
 * Factory with injectable collaborators (nullptr = default implementation).
 */
std::unique_ptr<IDownloadManager>
makeDownloadManagerWithDependencies(const DownloaderConfig& cfg, std::unique_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IDiskWriter> disk,
                                    std::unique_ptr<IResumeStore> resume);

} // namespace convey::downloader
