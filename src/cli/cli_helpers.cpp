#include <convey/cli/cli_helpers.h>

#include <algorithm>
#include <cctype>

namespace convey::cli {

namespace {

std::string lower(std::string_view s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return v;
}

const char* statusName(downloader::DownloadStatus status) {
    switch (status) {
        case downloader::DownloadStatus::Completed:
            return "completed";
        case downloader::DownloadStatus::Cancelled:
            return "cancelled";
        case downloader::DownloadStatus::Failed:
            return "failed";
    }
    return "failed";
}

} // namespace

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view s) {
    const auto v = lower(s);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

std::optional<downloader::Checksum> parseChecksum(std::string_view s) {
    auto colon = s.find(':');
    if (colon != std::string_view::npos) {
        if (lower(s.substr(0, colon)) != "sha256")
            return std::nullopt;
        s = s.substr(colon + 1);
    }
    if (s.size() != 64)
        return std::nullopt;
    if (!std::all_of(s.begin(), s.end(),
                     [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; })) {
        return std::nullopt;
    }
    return downloader::Checksum{downloader::HashAlgo::Sha256, lower(s)};
}

std::optional<downloader::Header> parseHeader(std::string_view s) {
    auto colon = s.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return std::nullopt;
    auto name = s.substr(0, colon);
    auto value = s.substr(colon + 1);
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back())))
        name.remove_suffix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);
    if (name.empty())
        return std::nullopt;
    return downloader::Header{std::string(name), std::string(value)};
}

int exitCodeFor(const downloader::FinalResult& result) {
    switch (result.status) {
        case downloader::DownloadStatus::Completed:
            return kExitCompleted;
        case downloader::DownloadStatus::Cancelled:
            return kExitCancelled;
        case downloader::DownloadStatus::Failed:
            return kExitFailed;
    }
    return kExitFailed;
}

nlohmann::json resultToJson(const downloader::FinalResult& result) {
    using json = nlohmann::json;
    auto optional_string = [](const std::optional<std::string>& v) -> json {
        return v ? json(*v) : json(nullptr);
    };

    json out = {
        {"type", "result"},
        {"url", result.url},
        {"status", statusName(result.status)},
        {"destination", result.destination.string()},
        {"size_bytes", result.sizeBytes},
        {"sha256", result.sha256.empty() ? json(nullptr) : json(result.sha256)},
        {"attempts", result.attempts},
        {"resumed_from", result.resumedFrom},
        {"from_cache", result.fromCache},
        {"http_status", result.httpStatus ? json(*result.httpStatus) : json(nullptr)},
        {"etag", optional_string(result.etag)},
        {"last_modified", optional_string(result.lastModified)},
        {"content_type", optional_string(result.contentType)},
        {"elapsed_ms", result.elapsed.count()},
    };
    if (!result.completed() && !result.stagingPath.empty()) {
        out["staging_path"] = result.stagingPath.string();
    }
    if (result.error) {
        out["error"] = {{"code", downloader::errorCodeName(result.error->code)},
                        {"message", result.error->message}};
    } else {
        out["error"] = nullptr;
    }
    return out;
}

} // namespace convey::cli
