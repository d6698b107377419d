#include <convey/cli/progress_bar.h>

#include <algorithm>
#include <array>
#include <iomanip>
#include <ostream>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#define CONVEY_ISATTY _isatty
#define CONVEY_FILENO _fileno
#else
#include <unistd.h>
#define CONVEY_ISATTY isatty
#define CONVEY_FILENO fileno
#endif
#include <cstdio>

namespace convey::cli {

using downloader::ProgressEvent;
using downloader::TransferPhase;

std::string formatBytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> kUnits = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
    return oss.str();
}

std::string formatDuration(std::uint32_t seconds) {
    std::ostringstream oss;
    if (seconds < 60) {
        oss << seconds << "s";
    } else if (seconds < 3600) {
        oss << seconds / 60 << "m" << std::setw(2) << std::setfill('0') << seconds % 60 << "s";
    } else {
        oss << seconds / 3600 << "h" << std::setw(2) << std::setfill('0') << (seconds % 3600) / 60
            << "m";
    }
    return oss.str();
}

std::string renderProgressLine(const ProgressEvent& ev, int width) {
    std::ostringstream oss;

    if (width > 0) {
        if (ev.percentage) {
            const int filled =
                std::clamp(static_cast<int>(*ev.percentage / 100.0f * static_cast<float>(width)),
                           0, width);
            oss << "[" << std::string(static_cast<size_t>(filled), '#')
                << std::string(static_cast<size_t>(width - filled), '-') << "] ";
        } else {
            oss << "[" << std::string(static_cast<size_t>(width), '?') << "] ";
        }
    }

    if (ev.percentage) {
        oss << std::setw(3) << static_cast<int>(*ev.percentage) << "% ";
    }

    oss << formatBytes(ev.downloadedBytes);
    if (ev.totalBytes) {
        oss << " / " << formatBytes(*ev.totalBytes);
    }
    if (ev.speedBps) {
        oss << "  " << formatBytes(*ev.speedBps) << "/s";
    }

    switch (ev.phase) {
        case TransferPhase::Resolving:
            oss << "  resolving";
            break;
        case TransferPhase::Streaming:
            if (ev.etaSeconds) {
                oss << "  ETA " << formatDuration(*ev.etaSeconds);
            }
            break;
        case TransferPhase::Finalizing:
            oss << "  finalizing";
            break;
        case TransferPhase::Done:
            oss << "  done in "
                << formatDuration(static_cast<std::uint32_t>(ev.elapsed.count() / 1000));
            break;
        case TransferPhase::Failed:
            oss << "  aborted";
            break;
    }
    return oss.str();
}

ProgressBar::ProgressBar(std::ostream& out, bool interactive)
    : out_(out), interactive_(interactive) {}

ProgressBar::~ProgressBar() {
    if (drawing_) {
        out_ << "\n" << std::flush;
    }
}

bool ProgressBar::stderrIsTty() {
    return CONVEY_ISATTY(CONVEY_FILENO(stderr)) != 0;
}

void ProgressBar::onEvent(const ProgressEvent& ev) {
    const bool terminal = ev.phase == TransferPhase::Done || ev.phase == TransferPhase::Failed;

    if (!interactive_) {
        if (terminal) {
            out_ << ev.url << ": " << renderProgressLine(ev, 0) << "\n" << std::flush;
        }
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (!terminal && drawing_ && now - lastDraw_ < updateInterval_) {
        return;
    }
    lastDraw_ = now;
    draw(renderProgressLine(ev, 30));

    if (terminal) {
        out_ << "\n" << std::flush;
        drawing_ = false;
    }
}

void ProgressBar::draw(const std::string& line) {
    // Clear the line
    out_ << "\r\033[K" << line << std::flush;
    drawing_ = true;
}

} // namespace convey::cli
