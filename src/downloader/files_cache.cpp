/*
 * convey/src/downloader/files_cache.cpp
 */

#include <convey/downloader/files_cache.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace convey::downloader {

namespace fs = std::filesystem;

namespace {

constexpr const char* kCacheDirName = "download-cache";
constexpr const char* kDisableEnvVar = "CONVEY_DISABLE_DOWNLOAD_CACHE";

std::string unique_suffix() {
    static std::atomic<unsigned> counter{0};
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    return std::to_string(ticks) + "-" + std::to_string(tid % 100000) + "-" +
           std::to_string(counter.fetch_add(1));
}

} // namespace

bool downloadCacheDisabledByEnv() {
    const char* v = std::getenv(kDisableEnvVar);
    return v && *v;
}

FilesCache::FilesCache(fs::path root) : path_(std::move(root) / kCacheDirName) {}

bool FilesCache::exists() const {
    std::error_code ec;
    return fs::is_directory(path_, ec);
}

bool FilesCache::isEmpty() const {
    std::error_code ec;
    if (!fs::is_directory(path_, ec))
        return true;
    return fs::is_empty(path_, ec) || ec;
}

fs::path FilesCache::entryDir(std::string_view url) const {
    return path_ / sha256Hex(url);
}

std::optional<fs::path> FilesCache::lookup(std::string_view url) const {
    std::error_code ec;
    const auto dir = entryDir(url);
    if (!fs::is_directory(dir, ec))
        return std::nullopt;

    std::optional<fs::path> found;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        if (found) {
            spdlog::warn("Download cache entry {} holds more than one file; using {}",
                         dir.string(), found->string());
            break;
        }
        found = it->path();
    }
    if (!found) {
        // Entry directory survived a temp-dir sweep that removed its file.
        spdlog::debug("Download cache entry {} is empty", dir.string());
    }
    return found;
}

Expected<fs::path> FilesCache::store(std::string_view url, const fs::path& file) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Error{ErrorCode::InvalidArgument, "Not a regular file: " + file.string()};
    }

    fs::create_directories(path_, ec);
    if (ec) {
        return Error{ErrorCode::DestinationError,
                     "Failed to create cache directory " + path_.string() + ": " + ec.message()};
    }

    const auto dir = entryDir(url);
    fs::path tmp = dir;
    tmp += ".tmp-" + unique_suffix();

    fs::create_directory(tmp, ec);
    if (ec) {
        return Error{ErrorCode::DestinationError,
                     "Failed to create cache entry " + tmp.string() + ": " + ec.message()};
    }

    const auto cached = tmp / file.filename();
    fs::copy_file(file, cached, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove_all(tmp, ignore);
        return Error{ErrorCode::DestinationError,
                     "Failed to copy " + file.string() + " into cache: " + ec.message()};
    }

    if (fs::exists(dir, ec)) {
        spdlog::debug("Replacing download cache entry {}", dir.string());
        fs::remove_all(dir, ec);
    }
    fs::rename(tmp, dir, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove_all(tmp, ignore);
        return Error{ErrorCode::DestinationError,
                     "Failed to publish cache entry " + dir.string() + ": " + ec.message()};
    }

    spdlog::debug("Cached {} as {}", std::string(url), (dir / file.filename()).string());
    return dir / file.filename();
}

Expected<void> FilesCache::clear() {
    std::error_code ec;
    if (!fs::exists(path_, ec))
        return Expected<void>();
    spdlog::debug("Removing download cache {}", path_.string());
    fs::remove_all(path_, ec);
    if (ec) {
        return Error{ErrorCode::DestinationError,
                     "Failed to clear cache " + path_.string() + ": " + ec.message()};
    }
    return Expected<void>();
}

} // namespace convey::downloader
