#pragma once

#include <convey/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace convey::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Scalar parsing; std::nullopt on anything that is not a complete, valid value
std::optional<bool> parse_bool(std::string_view s);
std::optional<std::uint64_t> parse_u64(std::string_view s);
std::optional<double> parse_double(std::string_view s);

/// Key/value pairs of a TOML-subset file, keyed by "section.key" ("key" for the root table).
using ConfigMap = std::map<std::string, std::string>;

/// Read every key of a config file. Missing or unreadable file yields an empty map.
ConfigMap parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from TOML config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path ($CONVEY_CONFIG, else <config dir>/config.toml)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Windows: %APPDATA%\convey
/// Unix: $XDG_CONFIG_HOME/convey or ~/.config/convey
std::filesystem::path get_config_dir();

/// Returns the user cache directory (download cache)
/// Windows: %LOCALAPPDATA%\convey\cache
/// Unix: $XDG_CACHE_HOME/convey or ~/.cache/convey
std::filesystem::path get_cache_dir();

/**
 * Build the downloader configuration: defaults, overlaid with the [downloader] and
 * [cache] sections of config_path. Invalid values are logged and ignored.
 */
downloader::DownloaderConfig loadDownloaderConfig(const std::filesystem::path& config_path);

/// Same as loadDownloaderConfig over an already parsed map.
downloader::DownloaderConfig downloaderConfigFromMap(const ConfigMap& values);

} // namespace convey::config
