/*
 * convey/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Staging file "<destination>.part" in the destination directory, so promotion is a
 *   same-filesystem atomic rename
 * - Deterministic staging name, so a later call for the same destination can resume it
 * - Restrictive permissions for staging (0600) on POSIX
 * - No cross-device fallback: a copy would expose a partially written destination
 */

#include <convey/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace convey::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::DestinationError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::DestinationError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::DestinationError, "open() failed for fsync: " + p.string() +
                                                      ": " + std::strerror(errno)};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return Error{ErrorCode::DestinationError,
                     "fsync() failed for: " + p.string() + ": " + std::strerror(err)};
    }
#endif
    ::close(fd);
    return Expected<void>{};
#endif
}

static Expected<void> fsync_dir(const fs::path& dir) {
#if defined(_WIN32)
    // Directory entries are durable once the rename returns on NTFS.
    (void)dir;
    return Expected<void>{};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::DestinationError,
                     "open(O_DIRECTORY) failed for: " + dir.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::DestinationError, "fsync(dir) failed for: " + dir.string()};
    }
#endif
    ::close(fd);
    return Expected<void>{};
#endif
}

static void ensure_file_private(const fs::path& p) {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

// Promoted files get regular permissions (umask-like 0644) instead of the staging 0600.
static void set_file_public_read(const fs::path& p) noexcept {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions for {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

static fs::path parent_or_cwd(const fs::path& p) {
    auto parent = p.parent_path();
    return parent.empty() ? fs::path{"."} : parent;
}

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    Expected<fs::path> openStaging(const fs::path& destination, bool resume,
                                   std::uint64_t& currentSize) override {
        currentSize = 0;
        if (destination.empty() || !destination.has_filename()) {
            return Error{ErrorCode::InvalidArgument,
                         "Destination has no filename: " + destination.string()};
        }

        std::error_code ec;
        const auto dir = parent_or_cwd(destination);
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::DestinationError,
                         "Failed to create directory " + dir.string() + ": " + ec.message()};
        }

        const auto stagingFile = stagingPathFor(destination);

        if (resume && fs::is_regular_file(stagingFile, ec)) {
            auto sz = fs::file_size(stagingFile, ec);
            if (!ec) {
                currentSize = static_cast<std::uint64_t>(sz);
                spdlog::debug("Found staging file {} ({} bytes)", stagingFile.string(),
                              currentSize);
                return stagingFile;
            }
            spdlog::debug("Cannot stat staging file {} ({}); starting over", stagingFile.string(),
                          ec.message());
        }

        {
            std::ofstream os(stagingFile, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::DestinationError,
                             "Failed to create staging file: " + stagingFile.string() + ": " +
                                 std::strerror(errno)};
            }
        }
        ensure_file_private(stagingFile);
        return stagingFile;
    }

    Expected<void> writeAt(const fs::path& stagingFile, std::uint64_t offset,
                           std::span<const std::byte> data) override {
        if (data.empty())
            return Expected<void>{};

        std::fstream fsio(stagingFile, std::ios::binary | std::ios::in | std::ios::out);
        if (!fsio.good()) {
            return Error{ErrorCode::DestinationError,
                         "Failed to open staging for write: " + stagingFile.string()};
        }

        fsio.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!fsio.good()) {
            return Error{ErrorCode::DestinationError, "seekp failed on: " + stagingFile.string()};
        }

        fsio.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        fsio.flush();
        if (!fsio.good()) {
            return Error{ErrorCode::DestinationError, "write failed on: " + stagingFile.string() +
                                                          ": " + std::strerror(errno)};
        }

        // Durability is deferred to sync()
        fsio.close();
        return Expected<void>{};
    }

    Expected<void> truncate(const fs::path& stagingFile, std::uint64_t size) override {
        std::error_code ec;
        fs::resize_file(stagingFile, size, ec);
        if (ec) {
            return Error{ErrorCode::DestinationError, "Failed to truncate " +
                                                          stagingFile.string() + ": " +
                                                          ec.message()};
        }
        return Expected<void>{};
    }

    Expected<void> sync(const fs::path& stagingFile) override {
        auto r = fsync_file(stagingFile);
        if (!r.ok())
            return r;
        return fsync_dir(parent_or_cwd(stagingFile));
    }

    Expected<fs::path> finalize(const fs::path& stagingFile, const fs::path& destination,
                                std::optional<std::uint64_t> expectedSize) override {
        std::error_code ec;
        const auto actual = fs::file_size(stagingFile, ec);
        if (ec) {
            return Error{ErrorCode::DestinationError,
                         "Staging file missing: " + stagingFile.string() + ": " + ec.message()};
        }
        if (expectedSize && static_cast<std::uint64_t>(actual) != *expectedSize) {
            return Error{ErrorCode::IncompleteTransfer,
                         "Received " + std::to_string(actual) + " of " +
                             std::to_string(*expectedSize) + " bytes for " +
                             destination.string()};
        }

        auto r = fsync_file(stagingFile);
        if (!r.ok())
            return Error{r.error().code, "Failed to fsync staging: " + r.error().message};

        // Same directory by construction, so rename replaces the destination atomically.
        fs::rename(stagingFile, destination, ec);
        if (ec) {
            return Error{ErrorCode::DestinationError, "rename() failed (" + ec.message() +
                                                          ") from " + stagingFile.string() +
                                                          " to " + destination.string()};
        }

        set_file_public_read(destination);

        auto rd = fsync_dir(parent_or_cwd(destination));
        if (!rd.ok()) {
            spdlog::debug("fsync on destination dir failed (continuing): {}",
                          rd.error().message);
        }
        return destination;
    }

    void cleanup(const fs::path& stagingFile) noexcept override {
        std::error_code ec;
        fs::remove(stagingFile, ec);
        if (ec) {
            spdlog::debug("cleanup: failed to remove staging file {}: {}", stagingFile.string(),
                          ec.message());
        }
    }
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace convey::downloader
