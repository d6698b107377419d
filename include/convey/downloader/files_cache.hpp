#pragma once

#include <convey/downloader/downloader.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace convey::downloader {

/**
 * Cross-session cache of single downloaded files, keyed by URL.
 *
 * Layout: <root>/download-cache/<sha256(url)>/<filename>. Each entry directory holds
 * exactly one file. Entries are published by renaming a fully copied temporary
 * directory, so a reader never sees a half-copied file.
 *
 * The cache lives in a location other tools may wipe; a missing entry is a miss, not
 * an error.
 */
class FilesCache {
public:
    explicit FilesCache(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool exists() const;
    [[nodiscard]] bool isEmpty() const;

    /**
     * Cached file for url, or std::nullopt on a miss.
     */
    [[nodiscard]] std::optional<std::filesystem::path> lookup(std::string_view url) const;

    /**
     * Copy file into the cache under url, replacing an older entry. Returns the cached path.
     */
    Expected<std::filesystem::path> store(std::string_view url, const std::filesystem::path& file);

    /**
     * Delete every entry. Missing cache directory is not an error.
     */
    Expected<void> clear();

private:
    [[nodiscard]] std::filesystem::path entryDir(std::string_view url) const;

    std::filesystem::path path_;
};

/**
 * True when CONVEY_DISABLE_DOWNLOAD_CACHE is set to a non-empty value.
 */
bool downloadCacheDisabledByEnv();

} // namespace convey::downloader
