#pragma once

#include <convey/cli/cli_helpers.h>
#include <convey/downloader/downloader.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace CLI {
class App;
}

namespace convey::cli {

/**
 * @brief State shared by every subcommand of one CLI invocation
 *
 * Subcommand callbacks run after parsing, so the config file named by --config is loaded
 * lazily through config().
 */
struct CliContext {
    using ManagerFactory =
        std::function<std::unique_ptr<downloader::IDownloadManager>(const downloader::DownloaderConfig&)>;

    std::string configOverride;
    downloader::ShouldCancel shouldCancel;
    ManagerFactory makeManager;

    // Streams for results (stdout) and progress (stderr)
    std::ostream* out{nullptr};
    std::ostream* err{nullptr};
    bool progressInteractive{false};

    int exitCode{kExitCompleted};

    downloader::DownloaderConfig config();
    std::unique_ptr<downloader::IDownloadManager> manager();

private:
    std::optional<downloader::DownloaderConfig> config_;
};

void registerDownloadCommand(CLI::App& app, std::shared_ptr<CliContext> ctx);
void registerResolveCommand(CLI::App& app, std::shared_ptr<CliContext> ctx);
void registerDiscardCommand(CLI::App& app, std::shared_ptr<CliContext> ctx);
void registerCacheCommand(CLI::App& app, std::shared_ptr<CliContext> ctx);

/**
 * @brief Register all subcommands
 */
void registerAllCommands(CLI::App& app, std::shared_ptr<CliContext> ctx);

} // namespace convey::cli
