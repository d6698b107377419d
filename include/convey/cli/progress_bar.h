#pragma once

#include <convey/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace convey::cli {

/**
 * @brief Human readable byte count ("512 B", "4.0 MiB")
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * @brief Compact duration ("42s", "3m05s", "1h02m")
 */
std::string formatDuration(std::uint32_t seconds);

/**
 * @brief Render one progress line (no carriage return or newline)
 * @param ev Progress snapshot
 * @param width Width of the bar in cells; 0 renders without a bar
 */
std::string renderProgressLine(const downloader::ProgressEvent& ev, int width);

/**
 * @brief Terminal progress display fed by downloader progress events
 *
 * On a TTY the line is redrawn in place at most every updateInterval; elsewhere only the
 * terminal state is printed so logs stay readable.
 */
class ProgressBar {
public:
    /**
     * @brief Construct a progress bar
     * @param out Stream to draw on (stderr for the CLI)
     * @param interactive Redraw in place (TTY) or print terminal lines only
     */
    ProgressBar(std::ostream& out, bool interactive);

    /**
     * @brief Destructor - ends the line if a transfer is still drawn
     */
    ~ProgressBar();

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    /**
     * @brief Consume a progress event (suitable as a downloader::ProgressCallback)
     */
    void onEvent(const downloader::ProgressEvent& ev);

    void setUpdateInterval(std::chrono::milliseconds interval) { updateInterval_ = interval; }

    /**
     * @brief True when stderr is attached to a terminal
     */
    static bool stderrIsTty();

private:
    void draw(const std::string& line);

    std::ostream& out_;
    bool interactive_;
    bool drawing_{false};
    std::chrono::milliseconds updateInterval_{100};
    std::chrono::steady_clock::time_point lastDraw_{};
};

} // namespace convey::cli
