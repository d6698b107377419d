#include <convey/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <system_error>

namespace convey::config {

namespace {

// Split "key = value  # comment" into trimmed parts. Returns false when no '=' is present.
bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t eq = line.find('=');
    if (eq == std::string::npos)
        return false;
    key = line.substr(0, eq);
    value = line.substr(eq + 1);
    trim(key);
    trim(value);

    // Remove inline comments outside quotes
    bool inQuotes = false;
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if ((c == '"' || c == '\'') && (!inQuotes || c == quote)) {
            inQuotes = !inQuotes;
            quote = c;
        } else if (c == '#' && !inQuotes) {
            value.resize(i);
            trim(value);
            break;
        }
    }
    value = unquote(value);
    return !key.empty();
}

const std::string* find_value(const ConfigMap& values, const std::string& key) {
    auto it = values.find(key);
    return it == values.end() ? nullptr : &it->second;
}

template <typename T, typename Parser>
void apply(const ConfigMap& values, const std::string& key, Parser parse, T& target) {
    const auto* raw = find_value(values, key);
    if (!raw)
        return;
    if (auto parsed = parse(*raw)) {
        target = static_cast<T>(*parsed);
    } else {
        spdlog::warn("Ignoring invalid config value {} = '{}'", key, *raw);
    }
}

} // namespace

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::string v(s);
    trim(v);
    // TOML allows '_' as digit separator
    v.erase(std::remove(v.begin(), v.end(), '_'), v.end());
    if (v.empty())
        return std::nullopt;
    std::uint64_t out = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    double out = 0.0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

ConfigMap parse_config_file(const std::filesystem::path& config_path) {
    ConfigMap out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        std::string k;
        std::string v;
        if (!split_key_value(line, k, v))
            continue;
        // Dotted keys ("downloader.chunk_size") are accepted in any section
        if (currentSection.empty() || k.find('.') != std::string::npos) {
            out[k] = v;
        } else {
            out[currentSection + "." + k] = v;
        }
    }
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    const auto* v = find_value(values, section.empty() ? key : section + "." + key);
    return v ? *v : std::string{};
}

std::filesystem::path get_config_dir() {
#if defined(_WIN32)
    if (const char* appData = std::getenv("APPDATA"); appData && *appData) {
        return std::filesystem::path(appData) / "convey";
    }
#endif
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "convey";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "convey";
    }
    return std::filesystem::path(".convey");
}

std::filesystem::path get_cache_dir() {
#if defined(_WIN32)
    if (const char* localAppData = std::getenv("LOCALAPPDATA"); localAppData && *localAppData) {
        return std::filesystem::path(localAppData) / "convey" / "cache";
    }
#endif
    if (const char* xdgCache = std::getenv("XDG_CACHE_HOME"); xdgCache && *xdgCache) {
        return std::filesystem::path(xdgCache) / "convey";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".cache" / "convey";
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path(".convey-cache") : tmp / "convey";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("CONVEY_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

downloader::DownloaderConfig downloaderConfigFromMap(const ConfigMap& values) {
    downloader::DownloaderConfig cfg;
    cfg.cacheDir = get_cache_dir();

    auto positive_u64 = [](std::string_view s) -> std::optional<std::uint64_t> {
        auto v = parse_u64(s);
        if (v && *v == 0)
            return std::nullopt;
        return v;
    };
    auto milliseconds = [](std::string_view s) -> std::optional<std::chrono::milliseconds> {
        auto v = parse_u64(s);
        if (!v)
            return std::nullopt;
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(*v)};
    };
    auto multiplier = [](std::string_view s) -> std::optional<double> {
        auto v = parse_double(s);
        if (v && *v < 1.0)
            return std::nullopt;
        return v;
    };
    auto text = [](std::string_view s) -> std::optional<std::string> {
        if (s.empty())
            return std::nullopt;
        return std::string(s);
    };
    auto path = [](std::string_view s) -> std::optional<std::filesystem::path> {
        if (s.empty())
            return std::nullopt;
        return expand_tilde(std::string(s));
    };

    apply(values, "downloader.chunk_size", positive_u64, cfg.defaultChunkSizeBytes);
    apply(values, "downloader.timeout_ms", milliseconds, cfg.defaultTimeout);
    apply(values, "downloader.max_attempts", positive_u64, cfg.retry.maxAttempts);
    apply(values, "downloader.initial_backoff_ms", milliseconds, cfg.retry.initialBackoff);
    apply(values, "downloader.backoff_multiplier", multiplier, cfg.retry.multiplier);
    apply(values, "downloader.max_backoff_ms", milliseconds, cfg.retry.maxBackoff);
    apply(values, "downloader.resume", parse_bool, cfg.resume);
    apply(values, "downloader.resume_without_validators", parse_bool,
          cfg.resumeWithoutValidators);
    apply(values, "downloader.user_agent", text, cfg.userAgent);
    apply(values, "downloader.use_cache", parse_bool, cfg.useCache);
    apply(values, "downloader.follow_redirects", parse_bool, cfg.followRedirects);
    apply(values, "cache.dir", path, cfg.cacheDir);

    return cfg;
}

downloader::DownloaderConfig loadDownloaderConfig(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!config_path.empty() && std::filesystem::exists(config_path, ec)) {
        spdlog::debug("Loading config from {}", config_path.string());
    }
    return downloaderConfigFromMap(parse_config_file(config_path));
}

} // namespace convey::config
