// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ferry::cli {

// Human-readable units, 1024-based
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

// Single-line transfer progress on stdout
class ProgressBar {
public:
    ProgressBar(std::uint64_t total, std::string_view label = {});

    // Redraws at most once per percent
    void update(std::uint64_t current, std::uint64_t speed_bps = 0) noexcept;

    void finish() noexcept;
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    // Text of the line update() would draw
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed_bps) const;

private:
    std::uint64_t total_{0};
    std::uint64_t last_percent_{0};
    std::string label_;
    bool drawn_{false};
    bool finished_{false};
};

} // namespace ferry::cli
