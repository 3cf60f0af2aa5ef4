// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/stream.hpp>
#include <ferry/core/config.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <new>

namespace ferry::core {

std::error_code read_exact(Reader& reader, std::span<std::byte> buffer, TransferErrc on_eof) noexcept {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto n = reader.read(buffer.subspan(filled));
        if (!n) {
            return n.error();
        }
        if (*n == 0) {
            return make_error_code(on_eof);
        }
        filled += *n;
    }
    return {};
}

std::error_code discard(Reader& reader, std::uint64_t count) noexcept {
    std::array<std::byte, 4096> scratch;
    while (count > 0) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(count, scratch.size()));
        auto n = reader.read(std::span(scratch).first(want));
        if (!n) {
            return n.error();
        }
        if (*n == 0) {
            return make_error_code(TransferErrc::truncated_fork);
        }
        count -= *n;
    }
    return {};
}

std::error_code copy_exact(Writer& dst, Reader& src, std::uint64_t count) noexcept {
    std::vector<std::byte> buf;
    try {
        buf.resize(static_cast<std::size_t>(std::min<std::uint64_t>(count, COPY_CHUNK_SIZE)));
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    while (count > 0) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(count, buf.size()));
        auto n = src.read(std::span(buf).first(want));
        if (!n) {
            return n.error();
        }
        if (*n == 0) {
            return make_error_code(TransferErrc::short_read);
        }
        if (auto ec = dst.write(std::span<const std::byte>(buf).first(*n))) {
            return ec;
        }
        count -= *n;
    }
    return {};
}

//=============================================================================
// MemoryReader / MemoryWriter
//=============================================================================

std::expected<std::size_t, std::error_code>
MemoryReader::read(std::span<std::byte> buffer) noexcept {
    std::size_t n = std::min(buffer.size(), remaining());
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

std::error_code MemoryWriter::write(std::span<const std::byte> data) noexcept {
    try {
        data_.insert(data_.end(), data.begin(), data.end());
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
    return {};
}

} // namespace ferry::core
