// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/progress.hpp>
#include <ferry/log.hpp>
#include <algorithm>
#include <new>
#include <vector>

namespace ferry::core {

std::expected<std::uint64_t, std::error_code>
copy_with_progress(Writer& dst,
                   Reader& src,
                   std::uint64_t total,
                   const ProgressCallback& on_tick,
                   const CopyOptions& options) noexcept {
    using clock = std::chrono::steady_clock;

    std::vector<std::byte> buffer;
    try {
        buffer.resize(static_cast<std::size_t>(std::min<std::uint64_t>(total, COPY_CHUNK_SIZE)));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    auto emit = [&](std::uint64_t bytes) {
        if (on_tick) {
            on_tick(bytes);
        }
    };

    std::uint64_t copied = 0;
    auto next_tick = clock::now() + options.interval;

    while (copied < total) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(total - copied, buffer.size()));
        auto n = src.read(std::span(buffer).first(want));
        if (!n) {
            return std::unexpected(n.error());
        }

        if (*n == 0) {
            if (options.tolerate_short_read) {
                log::get()->warn("Stream ended after {} of {} bytes", copied, total);
                break;
            }
            return std::unexpected(make_error_code(TransferErrc::short_read));
        }

        if (auto ec = dst.write(std::span<const std::byte>(buffer).first(*n))) {
            return std::unexpected(ec);
        }
        copied += *n;

        // Missed ticks are dropped, not queued
        auto now = clock::now();
        if (now >= next_tick) {
            emit(copied);
            next_tick = now + options.interval;
        }
    }

    emit(copied);
    return copied;
}

} // namespace ferry::core
