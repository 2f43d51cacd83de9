// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace nzbstream::cli {

namespace {

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

std::string scaled(std::uint64_t value, std::uint64_t unit, int precision, std::string_view suffix) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision)
       << (static_cast<double>(value) / static_cast<double>(unit)) << suffix;
    return ss.str();
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0) return;
    current_ = std::min(current, total_);

    double percent = static_cast<double>(current_) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on whole-percent changes
    const int whole = static_cast<int>(percent);
    if (whole == last_percent_) return;
    last_percent_ = whole;

    try {
        std::string line = "\r";
        if (!label_.empty()) {
            line += label_;
            line += ": ";
        }

        line += render_bar(percent);

        line += " ";
        if (whole < 100) line += " ";
        if (whole < 10) line += " ";
        line += std::to_string(whole) + "%";

        line += " (";
        line += format_bytes(current_);
        line += "/";
        line += format_bytes(total_);
        line += ")";

        if (speed_bps > 0) {
            line += " @ ";
            line += format_speed(speed_bps);

            const std::uint64_t remaining = total_ - current_;
            if (remaining > 0) {
                line += " ETA: ";
                line += format_time(remaining / speed_bps);
            }
        }

        // Clear rest of line
        line += std::string(10, ' ');

        std::cerr << line << std::flush;
    } catch (const std::exception&) {
        // Drawing is best effort
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    last_percent_ = -1;
    update(total_, 0);
    std::cerr << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cerr << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    if (bps >= GB) return scaled(bps, GB, 1, " GB/s");
    if (bps >= MB) return scaled(bps, MB, 1, " MB/s");
    if (bps >= KB) return scaled(bps, KB, 1, " KB/s");
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    if (bytes >= TB) return scaled(bytes, TB, 2, " TB");
    if (bytes >= GB) return scaled(bytes, GB, 2, " GB");
    if (bytes >= MB) return scaled(bytes, MB, 1, " MB");
    if (bytes >= KB) return scaled(bytes, KB, 0, " KB");
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
    } else if (minutes > 0) {
        ss << minutes << "m " << secs << "s";
    } else {
        ss << secs << "s";
    }
    return ss.str();
}

} // namespace nzbstream::cli
