// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace grab::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

constexpr auto SPINNER_INTERVAL = std::chrono::milliseconds(100);

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::uint64_t bytes) noexcept {
    auto now = std::chrono::steady_clock::now();
    if (now - last_draw_ < SPINNER_INTERVAL) return;
    last_draw_ = now;

    std::cout << "\r" << SPINNER_FRAMES[frame_ % 4] << " "
              << ProgressBar::format_bytes(bytes) << "      " << std::flush;
    ++frame_;
}

void Spinner::finish() noexcept {
    std::cout << "\r done" << std::string(20, ' ') << std::endl;
}

void Spinner::clear() noexcept {
    std::cout << "\r" << std::string(30, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label)
    , start_(std::chrono::steady_clock::now()) {}

void ProgressBar::update(std::uint64_t current, std::size_t chunks_done, std::size_t chunks_total) noexcept {
    if (total_ == 0 || finished_) return;

    double percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);

    // Only redraw on whole-percent steps
    const int whole = static_cast<int>(percent);
    if (whole <= last_percent_) return;
    last_percent_ = whole;

    std::cout << render(current, chunks_done, chunks_total) << std::flush;
}

std::string ProgressBar::render(std::uint64_t current,
                                std::size_t chunks_done,
                                std::size_t chunks_total) const {
    double percent = 0.0;
    if (total_ > 0) {
        percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);
    }

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    int pct_int = static_cast<int>(percent);
    line += " ";
    if (pct_int < 100) line += " ";
    if (pct_int < 10) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (" + format_bytes(current) + "/" + format_bytes(total_) + ")";

    if (chunks_total > 0) {
        line += " [" + std::to_string(chunks_done) + "/" + std::to_string(chunks_total) + " chunks]";
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
    if (elapsed > 0 && current > 0) {
        auto speed = static_cast<std::uint64_t>(static_cast<double>(current) * 1000.0 / static_cast<double>(elapsed));
        line += " @ " + format_speed(speed);
        if (speed > 0 && current < total_) {
            line += " ETA: " + format_time((total_ - current) / speed);
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    return line;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (total_ > 0) {
        std::cout << render(total_, 0, 0) << std::endl;
    }
    finished_ = true;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (empty > 0) {
        bar += '>';
        bar.append(static_cast<std::size_t>(empty - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    } else if (bytes >= GB) {
        return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace grab::cli
