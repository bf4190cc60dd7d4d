// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace volley::cli {

namespace {

constexpr int BAR_WIDTH = 30;

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0 || finished_) return;

    auto percent = static_cast<int>(std::clamp(
        static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0));
    if (percent == last_percent_) return;
    last_percent_ = percent;

    try {
        std::cout << '\r' << render(current, speed_bps) << std::flush;
    } catch (const std::exception&) {
        // Display only, the download goes on
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    last_percent_ = -1;
    update(total_, 0);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << '\r' << std::string(100, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const {
    double percent = total_ == 0 ? 100.0
        : std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    auto pct = std::to_string(static_cast<int>(percent));
    line += " ";
    line += std::string(3 - std::min<std::size_t>(pct.size(), 3), ' ');
    line += pct;
    line += "% (";
    line += format_bytes(current);
    line += "/";
    line += format_bytes(total_);
    line += ")";

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        if (current < total_) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed_bps);
        }
    }

    return line;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) return fixed(static_cast<double>(bps) / GB, 1) + " GB/s";
    if (bps >= MB) return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
    if (bps >= KB) return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    if (bytes >= GB) return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    if (bytes >= MB) return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    if (bytes >= KB) return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace volley::cli
