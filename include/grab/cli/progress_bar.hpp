// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace grab::cli {

// Single-line progress bar for transfers of known size
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total, std::string_view label = {});

    // Redraw if at least one more percent is done
    void update(std::uint64_t current, std::size_t chunks_done = 0, std::size_t chunks_total = 0) noexcept;

    // Draw 100% and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    // Render without printing
    [[nodiscard]] std::string render(std::uint64_t current,
                                     std::size_t chunks_done,
                                     std::size_t chunks_total) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::uint64_t total_{0};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point start_;
};

// Spinner for transfers of unknown size
class Spinner {
public:
    Spinner() noexcept = default;

    // Advance one frame and show the byte count
    void update(std::uint64_t bytes) noexcept;
    void finish() noexcept;
    void clear() noexcept;

private:
    std::size_t frame_{0};
    std::chrono::steady_clock::time_point last_draw_;
};

} // namespace grab::cli
