// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

namespace ferry::core {

// Blocking byte source. read() returns 0 at end of stream.
class Reader {
public:
    virtual ~Reader() = default;

    [[nodiscard]] virtual std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) noexcept = 0;
};

// Blocking byte sink. write() either writes everything or fails.
class Writer {
public:
    virtual ~Writer() = default;

    [[nodiscard]] virtual std::error_code write(std::span<const std::byte> data) noexcept = 0;
};

// Fill the whole buffer or fail with `on_eof` when the stream ends first
[[nodiscard]] std::error_code read_exact(Reader& reader,
                                         std::span<std::byte> buffer,
                                         TransferErrc on_eof = TransferErrc::short_read) noexcept;

// Read and drop exactly `count` bytes
[[nodiscard]] std::error_code discard(Reader& reader, std::uint64_t count) noexcept;

// Copy exactly `count` bytes without progress reporting
[[nodiscard]] std::error_code copy_exact(Writer& dst, Reader& src, std::uint64_t count) noexcept;

// Reader over an in-memory buffer
class MemoryReader : public Reader {
public:
    explicit MemoryReader(std::span<const std::byte> data) noexcept : data_(data) {}

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) noexcept override;

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const std::byte> data_;
    std::size_t pos_{0};
};

// Writer appending to an in-memory buffer
class MemoryWriter : public Writer {
public:
    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept override;

    [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return data_; }
    [[nodiscard]] std::vector<std::byte> take() noexcept { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

} // namespace ferry::core
