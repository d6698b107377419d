/*
 * convey/src/cli/command_registry.cpp
 *
 * Shared CLI context plus the small maintenance subcommands:
 *   convey resolve <url>     print the filename a download would use
 *   convey discard <url>     delete a staged partial download
 *   convey cache clear       empty the download cache
 */

#include <convey/cli/commands.h>
#include <convey/config/config_helpers.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace convey::cli {

downloader::DownloaderConfig CliContext::config() {
    if (!config_) {
        config_ = config::loadDownloaderConfig(config::get_config_path(configOverride));
    }
    return *config_;
}

std::unique_ptr<downloader::IDownloadManager> CliContext::manager() {
    if (makeManager) {
        return makeManager(config());
    }
    return downloader::makeDownloadManager(config());
}

namespace {

struct TargetOpts {
    std::string url;
    std::optional<fs::path> dir;
    std::optional<fs::path> output;
    std::optional<std::string> name;
};

void add_target_options(CLI::App* sub, const std::shared_ptr<TargetOpts>& opts) {
    sub->add_option("url", opts->url, "Source URL.")->required()->check(CLI::NonEmpty());
    sub->add_option("-d,--dir", opts->dir, "Destination directory (default: current directory).");
    sub->add_option("-o,--output", opts->output, "Explicit destination path.");
    sub->add_option("--name", opts->name, "Override the resolved filename.");
}

downloader::DownloadRequest to_request(const TargetOpts& opts) {
    downloader::DownloadRequest req;
    req.url = opts.url;
    req.destinationDir = opts.dir;
    req.destination = opts.output;
    req.filename = opts.name;
    return req;
}

} // namespace

void registerResolveCommand(CLI::App& app, std::shared_ptr<CliContext> ctx) {
    auto* sub = app.add_subcommand("resolve", "Print the filename a download would be saved as.");
    auto opts = std::make_shared<TargetOpts>();
    sub->add_option("url", opts->url, "Source URL.")->required()->check(CLI::NonEmpty());
    sub->add_option("--name", opts->name, "Override the resolved filename.");

    sub->callback([opts, ctx]() {
        auto manager = ctx->manager();
        auto name = manager->resolveName(to_request(*opts));
        if (!name.ok()) {
            spdlog::error("Cannot resolve {}: [{}] {}", opts->url,
                          downloader::errorCodeName(name.error().code), name.error().message);
            ctx->exitCode = kExitFailed;
            return;
        }
        *ctx->out << fmt::format("{}\n", name.value()) << std::flush;
        ctx->exitCode = kExitCompleted;
    });
}

void registerDiscardCommand(CLI::App& app, std::shared_ptr<CliContext> ctx) {
    auto* sub = app.add_subcommand(
        "discard", "Delete the staging file and resume state of an interrupted download.");
    auto opts = std::make_shared<TargetOpts>();
    add_target_options(sub, opts);

    sub->callback([opts, ctx]() {
        auto manager = ctx->manager();
        auto res = manager->discard(to_request(*opts));
        if (!res.ok()) {
            spdlog::error("Cannot discard {}: [{}] {}", opts->url,
                          downloader::errorCodeName(res.error().code), res.error().message);
            ctx->exitCode = kExitFailed;
            return;
        }
        spdlog::info("Discarded staged data for {}", opts->url);
        ctx->exitCode = kExitCompleted;
    });
}

void registerCacheCommand(CLI::App& app, std::shared_ptr<CliContext> ctx) {
    auto* sub = app.add_subcommand("cache", "Manage the download cache.");
    sub->require_subcommand(1);

    auto* clear = sub->add_subcommand("clear", "Delete every cached download.");
    clear->callback([ctx]() {
        auto manager = ctx->manager();
        manager->clearCache();
        ctx->exitCode = kExitCompleted;
    });

    auto* path = sub->add_subcommand("path", "Print the download cache directory.");
    path->callback([ctx]() {
        const auto cfg = ctx->config();
        if (cfg.cacheDir.empty()) {
            spdlog::error("No cache directory configured");
            ctx->exitCode = kExitFailed;
            return;
        }
        *ctx->out << fmt::format("{}\n", (cfg.cacheDir / "download-cache").string()) << std::flush;
        ctx->exitCode = kExitCompleted;
    });
}

void registerAllCommands(CLI::App& app, std::shared_ptr<CliContext> ctx) {
    registerDownloadCommand(app, ctx);
    registerResolveCommand(app, ctx);
    registerDiscardCommand(app, ctx);
    registerCacheCommand(app, ctx);
}

} // namespace convey::cli
