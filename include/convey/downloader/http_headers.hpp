#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace convey::downloader::http {

std::string toLower(std::string_view s);
std::string trim(std::string_view s);
bool iequals(std::string_view a, std::string_view b);

/**
 * A single "Name: value" response header line. Name is lower-cased, value trimmed.
 */
struct HeaderLine {
    std::string name;
    std::string value;
};

/**
 * Parse one raw header line (CRLF tolerated). Returns std::nullopt for status lines,
 * blank lines and lines without a colon.
 */
std::optional<HeaderLine> parseHeaderLine(std::string_view line);

/**
 * Strip surrounding single or double quotes from a validator value.
 */
std::string unquoteValidator(std::string_view value);

/**
 * Extract the filename from a Content-Disposition value.
 * RFC 5987 `filename*=charset'lang'pct-encoded` wins over `filename=`. Quoted strings
 * are unescaped. Malformed input never fails; an absent or empty filename yields nullopt.
 */
std::optional<std::string> parseContentDispositionFilename(std::string_view value);

/**
 * Decode %XX escapes. Invalid escapes are kept verbatim. '+' is not treated as space.
 */
std::string percentDecode(std::string_view s);

/**
 * Total length from a Content-Range value ("bytes 0-0/1234"); nullopt for "*" or garbage.
 */
std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value);

/**
 * Parse a decimal Content-Length value.
 */
std::optional<std::uint64_t> parseContentLength(std::string_view value);

/**
 * File extension (with leading dot) for media Content-Types: image/, video/, audio/ and
 * text/ types map to their subtype up to any '+' ("image/svg+xml" -> ".svg").
 * Parameters after ';' are ignored. Other types yield nullopt.
 */
std::optional<std::string> extensionForContentType(std::string_view contentType);

} // namespace convey::downloader::http
