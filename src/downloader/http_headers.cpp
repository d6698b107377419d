/*
 * convey/src/downloader/http_headers.cpp
 *
 * Response header helpers shared by the curl adapter and the filename resolver.
 * Everything here is tolerant: malformed values are normalized or ignored, never fatal.
 */

#include <convey/downloader/http_headers.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <vector>

namespace convey::downloader::http {

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<HeaderLine> parseHeaderLine(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return std::nullopt;

    HeaderLine out;
    out.name = toLower(trim(line.substr(0, colon)));
    out.value = trim(line.substr(colon + 1));
    if (out.name.empty())
        return std::nullopt;
    return out;
}

std::string unquoteValidator(std::string_view value) {
    auto v = trim(value);
    if (v.size() >= 2 &&
        ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Split "a; b=\"x;y\"; c" on ';' outside quoted strings.
std::vector<std::string_view> splitParams(std::string_view value) {
    std::vector<std::string_view> parts;
    bool inQuotes = false;
    size_t start = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '\\' && inQuotes && i + 1 < value.size()) {
            ++i;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == ';' && !inQuotes) {
            parts.push_back(value.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(value.substr(start));
    return parts;
}

std::string unquoteParam(std::string_view raw) {
    auto v = trim(raw);
    if (v.empty() || v.front() != '"')
        return v;

    std::string out;
    out.reserve(v.size());
    for (size_t i = 1; i < v.size(); ++i) {
        const char c = v[i];
        if (c == '\\' && i + 1 < v.size()) {
            out.push_back(v[++i]);
        } else if (c == '"') {
            break;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// RFC 5987 ext-value: charset'language'pct-encoded. A value missing the two quotes is
// decoded as a whole.
std::string decodeExtValue(std::string_view raw) {
    auto v = unquoteParam(raw);
    auto first = v.find('\'');
    if (first != std::string::npos) {
        auto second = v.find('\'', first + 1);
        if (second != std::string::npos) {
            return percentDecode(std::string_view(v).substr(second + 1));
        }
    }
    return percentDecode(v);
}

} // namespace

std::optional<std::string> parseContentDispositionFilename(std::string_view value) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    for (auto part : splitParams(value)) {
        auto eq = part.find('=');
        if (eq == std::string_view::npos)
            continue;
        auto key = toLower(trim(part.substr(0, eq)));
        auto raw = part.substr(eq + 1);
        if (key == "filename*" && !extended) {
            auto decoded = decodeExtValue(raw);
            if (!decoded.empty())
                extended = std::move(decoded);
        } else if (key == "filename" && !plain) {
            auto v = unquoteParam(raw);
            if (!v.empty())
                plain = std::move(v);
        }
    }

    if (extended)
        return extended;
    return plain;
}

std::string percentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::optional<std::uint64_t> parseContentLength(std::string_view value) {
    auto v = trim(value);
    if (v.empty())
        return std::nullopt;
    std::uint64_t out{0};
    const char* first = v.data();
    const char* last = v.data() + v.size();
    auto res = std::from_chars(first, last, out);
    if (res.ec != std::errc() || res.ptr != last)
        return std::nullopt;
    return out;
}

std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value) {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    return parseContentLength(value.substr(slash + 1));
}

std::optional<std::string> extensionForContentType(std::string_view contentType) {
    auto semi = contentType.find(';');
    auto mime = toLower(trim(contentType.substr(0, semi)));
    auto slash = mime.find('/');
    if (slash == std::string::npos)
        return std::nullopt;

    const auto type = mime.substr(0, slash);
    if (type != "image" && type != "video" && type != "audio" && type != "text")
        return std::nullopt;

    auto subtype = mime.substr(slash + 1);
    auto plus = subtype.find('+');
    if (plus != std::string::npos)
        subtype = subtype.substr(0, plus);
    if (subtype.empty())
        return std::nullopt;
    return "." + subtype;
}

} // namespace convey::downloader::http
