// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/stream.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>

namespace ferry::core {

// Receives the cumulative byte count. Must not throw.
using ProgressCallback = std::function<void(std::uint64_t bytes)>;

struct CopyOptions {
    std::chrono::milliseconds interval{PROGRESS_INTERVAL};
    bool tolerate_short_read{false};    // Accept end of stream before `total`
};

// Copy `total` bytes in COPY_CHUNK_SIZE chunks, reporting progress at most
// once per interval and once more at the end. Returns the bytes copied.
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
copy_with_progress(Writer& dst,
                   Reader& src,
                   std::uint64_t total,
                   const ProgressCallback& on_tick,
                   const CopyOptions& options = {}) noexcept;

} // namespace ferry::core
