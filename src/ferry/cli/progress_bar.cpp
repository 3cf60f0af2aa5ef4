// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace ferry::cli {

namespace {

constexpr int BAR_WIDTH = 30;

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

double percent_of(std::uint64_t current, std::uint64_t total) noexcept {
    if (total == 0) {
        return 100.0;
    }
    return std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0);
}

} // namespace

std::string format_speed(std::uint64_t bps) {
    if (bps >= GB) return std::format("{:.1f} GB/s", static_cast<double>(bps) / GB);
    if (bps >= MB) return std::format("{:.1f} MB/s", static_cast<double>(bps) / MB);
    if (bps >= KB) return std::format("{:.1f} KB/s", static_cast<double>(bps) / KB);
    return std::format("{} B/s", bps);
}

std::string format_bytes(std::uint64_t bytes) {
    if (bytes >= TB) return std::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    if (bytes >= GB) return std::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    return std::format("{} B", bytes);
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}h {:02}m {}s", hours, minutes, secs);
    }
    if (minutes > 0) {
        return std::format("{}m {}s", minutes, secs);
    }
    return std::format("{}s", secs);
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const {
    double percent = percent_of(current, total_);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    line += '>';
    line.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    line += ']';

    line += std::format(" {:3}% ({}/{})", static_cast<int>(percent), format_bytes(current), format_bytes(total_));

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

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    auto percent = static_cast<std::uint64_t>(percent_of(current, total_));
    if (drawn_ && percent <= last_percent_ && !finished_) {
        return;
    }
    drawn_ = true;
    last_percent_ = percent;

    std::cout << '\r' << render(current, speed_bps) << std::string(10, ' ') << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(total_, 0);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << '\r' << std::string(80, ' ') << '\r' << std::flush;
}

} // namespace ferry::cli
