/*
 * convey/src/downloader/filename_resolver.cpp
 *
 * Target filename derivation: explicit > Content-Disposition > URL path > generated.
 */

#include <convey/downloader/filename_resolver.hpp>
#include <convey/downloader/http_headers.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace convey::downloader {

namespace {

constexpr std::string_view kUnsafeChars = "<>:\"|?*";
constexpr std::size_t kMaxExtensionBytes = 16;

constexpr std::array<std::string_view, 22> kReservedDeviceNames = {
    "con",  "prn",  "aux",  "nul",  "com1", "com2", "com3", "com4", "com5", "com6", "com7",
    "com8", "com9", "lpt1", "lpt2", "lpt3", "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9"};

bool isTrimmable(char c) {
    return c == '.' || std::isspace(static_cast<unsigned char>(c));
}

bool isUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Cut s to at most maxBytes without leaving a dangling UTF-8 lead byte.
std::string truncateUtf8(std::string_view s, std::size_t maxBytes) {
    if (s.size() <= maxBytes)
        return std::string(s);
    std::size_t cut = maxBytes;
    while (cut > 0 && isUtf8Continuation(s[cut]))
        --cut;
    return std::string(s.substr(0, cut));
}

bool isReservedDeviceName(std::string_view name) {
    auto dot = name.find('.');
    auto stem = http::toLower(name.substr(0, dot));
    return std::find(kReservedDeviceNames.begin(), kReservedDeviceNames.end(), stem) !=
           kReservedDeviceNames.end();
}

bool hasExtension(std::string_view name) {
    auto dot = name.rfind('.');
    return dot != std::string_view::npos && dot > 0 && dot + 1 < name.size();
}

const char* sourceName(FilenameSource source) {
    switch (source) {
        case FilenameSource::Explicit:
            return "explicit";
        case FilenameSource::Declared:
            return "content-disposition";
        case FilenameSource::UrlPath:
            return "url";
        case FilenameSource::Fallback:
            return "fallback";
    }
    return "unknown";
}

} // namespace

std::string sanitizeFilename(std::string_view candidate) {
    std::string out;
    out.reserve(candidate.size());
    for (char c : candidate) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7F ||
            kUnsafeChars.find(c) != std::string_view::npos) {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }

    size_t b = 0;
    size_t e = out.size();
    while (b < e && isTrimmable(out[b]))
        ++b;
    while (e > b && isTrimmable(out[e - 1]))
        --e;
    out = out.substr(b, e - b);
    if (out.empty())
        return out;

    if (isReservedDeviceName(out))
        out.insert(out.begin(), '_');

    if (out.size() > kMaxFilenameBytes) {
        std::string ext;
        auto dot = out.rfind('.');
        if (dot != std::string::npos && dot > 0 && out.size() - dot <= kMaxExtensionBytes) {
            ext = out.substr(dot);
            out.resize(dot);
        }
        out = truncateUtf8(out, kMaxFilenameBytes - ext.size());
        while (!out.empty() && isTrimmable(out.back()))
            out.pop_back();
        if (out.empty())
            return out;
        out += ext;
    }
    return out;
}

std::string urlPathFilename(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);

    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        auto pathStart = url.find('/', scheme + 3);
        if (pathStart == std::string_view::npos)
            return {};
        url = url.substr(pathStart);
    }

    auto slash = url.rfind('/');
    auto segment = slash == std::string_view::npos ? url : url.substr(slash + 1);
    return http::percentDecode(segment);
}

std::string fallbackFilename(std::string_view url, const std::optional<std::string>& contentType) {
    std::string name = "download-" + sha256Hex(url).substr(0, 12);
    if (contentType) {
        if (auto ext = http::extensionForContentType(*contentType))
            name += *ext;
    }
    return name;
}

Expected<ResolvedFilename> resolveFilename(const RemoteResource& resource,
                                           const std::optional<std::string>& explicitName) {
    auto pick = [&](std::string name, FilenameSource source) {
        spdlog::debug("Resolved filename '{}' for {} ({})", name, resource.url, sourceName(source));
        return ResolvedFilename{std::move(name), source};
    };

    if (explicitName) {
        if (auto name = sanitizeFilename(*explicitName); !name.empty())
            return pick(std::move(name), FilenameSource::Explicit);
        spdlog::debug("Explicit filename '{}' is unusable after sanitization", *explicitName);
    }

    if (resource.declaredFilename) {
        if (auto name = sanitizeFilename(*resource.declaredFilename); !name.empty())
            return pick(std::move(name), FilenameSource::Declared);
    }

    if (auto name = sanitizeFilename(urlPathFilename(resource.url)); !name.empty()) {
        if (!hasExtension(name) && resource.contentType) {
            if (auto ext = http::extensionForContentType(*resource.contentType))
                name = sanitizeFilename(name + *ext);
        }
        return pick(std::move(name), FilenameSource::UrlPath);
    }

    auto name = sanitizeFilename(fallbackFilename(resource.url, resource.contentType));
    if (name.empty()) {
        return Error{ErrorCode::ResolutionFailed,
                     "Cannot derive a safe filename for " + resource.url};
    }
    return pick(std::move(name), FilenameSource::Fallback);
}

} // namespace convey::downloader
