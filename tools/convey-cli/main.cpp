#include <convey/cli/commands.h>
#include <convey/cli/progress_bar.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_sigint(int) {
    g_interrupted.store(true);
    // A second Ctrl-C terminates immediately
    std::signal(SIGINT, SIG_DFL);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so --json output on stdout stays clean
        spdlog::set_default_logger(spdlog::stderr_color_mt("convey"));
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        std::signal(SIGINT, on_sigint);
#if defined(SIGTERM)
        std::signal(SIGTERM, on_sigint);
#endif

        auto ctx = std::make_shared<convey::cli::CliContext>();
        ctx->shouldCancel = [] { return g_interrupted.load(); };
        ctx->out = &std::cout;
        ctx->err = &std::cerr;
        ctx->progressInteractive = convey::cli::ProgressBar::stderrIsTty();

        CLI::App app{"convey - resumable streaming downloads"};
        app.require_subcommand(1);

        bool verbose = false;
        bool quiet = false;
        app.add_option("--config", ctx->configOverride,
                       "Config file (default: $CONVEY_CONFIG or ~/.config/convey/config.toml).");
        app.add_flag("-v,--verbose", verbose, "Enable debug logging.");
        app.add_flag("-q,--quiet", quiet, "Only log errors.");

        // Precedence: env CONVEY_LOG_LEVEL > --verbose/--quiet > warn.
        // Runs after parsing and before any subcommand callback.
        app.parse_complete_callback([&verbose, &quiet]() {
            if (const char* envLvl = std::getenv("CONVEY_LOG_LEVEL"); envLvl && *envLvl) {
                if (auto lvl = convey::cli::parseLogLevel(envLvl)) {
                    spdlog::set_level(*lvl);
                    return;
                }
                spdlog::warn("Ignoring invalid CONVEY_LOG_LEVEL '{}'", envLvl);
            }
            if (verbose) {
                spdlog::set_level(spdlog::level::debug);
            } else if (quiet) {
                spdlog::set_level(spdlog::level::err);
            }
        });

        convey::cli::registerAllCommands(app, ctx);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e);
        }

        if (g_interrupted.load() && ctx->exitCode == convey::cli::kExitCompleted) {
            return convey::cli::kExitCancelled;
        }
        return ctx->exitCode;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return convey::cli::kExitFailed;
    }
}
