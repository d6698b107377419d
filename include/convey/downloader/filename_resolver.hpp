#pragma once

#include <convey/downloader/downloader.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace convey::downloader {

inline constexpr std::size_t kMaxFilenameBytes = 255;

/**
 * Where a resolved filename came from.
 */
enum class FilenameSource { Explicit, Declared, UrlPath, Fallback };

struct ResolvedFilename {
    std::string name;
    FilenameSource source{FilenameSource::Fallback};
};

/**
 * Make a filename safe for any local filesystem.
 * - path separators, NUL/control characters and <>:"|?* become '_'
 * - surrounding whitespace and dots are trimmed ("." and ".." become empty)
 * - Windows device names (CON, NUL, COM1, ...) are prefixed with '_'
 * - length is bounded to kMaxFilenameBytes, keeping a short extension and never
 *   splitting a UTF-8 sequence
 * May return an empty string; callers fall through to the next candidate.
 */
std::string sanitizeFilename(std::string_view candidate);

/**
 * Last path segment of a URL with query and fragment stripped and %XX decoded.
 * Empty for "https://host/" or "https://host/dir/".
 */
std::string urlPathFilename(std::string_view url);

/**
 * Deterministic generated name: "download-<12 hex of sha256(url)>" plus an extension
 * derived from the Content-Type when it names a media type.
 */
std::string fallbackFilename(std::string_view url, const std::optional<std::string>& contentType);

/**
 * Pick the target filename for a resource. Priority: explicit name, declared
 * (Content-Disposition) name, URL path segment (with a Content-Type extension appended
 * when it has none), generated fallback. Fails with ErrorCode::ResolutionFailed only
 * when the fallback itself sanitizes to nothing.
 */
Expected<ResolvedFilename> resolveFilename(const RemoteResource& resource,
                                           const std::optional<std::string>& explicitName);

} // namespace convey::downloader
