#pragma once

#include <convey/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <optional>
#include <string>
#include <string_view>

namespace convey::cli {

// Process exit codes
inline constexpr int kExitCompleted = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitCancelled = 130;

/**
 * @brief Parse a log level name (trace, debug, info, warn, error, critical, off)
 */
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view s);

/**
 * @brief Parse "sha256:<64 hex>" (the "sha256:" prefix is optional)
 */
std::optional<downloader::Checksum> parseChecksum(std::string_view s);

/**
 * @brief Parse "Name: value"
 */
std::optional<downloader::Header> parseHeader(std::string_view s);

/**
 * @brief Exit code for a batch of results: cancelled wins over failed
 */
int exitCodeFor(const downloader::FinalResult& result);

/**
 * @brief Machine readable form of a download result
 */
nlohmann::json resultToJson(const downloader::FinalResult& result);

} // namespace convey::cli
