// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/stream.hpp>
#include <ferry/disk/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace ferry::disk {

enum class OpenMode {
    truncate,       // Create or replace
    exclusive       // Create only; name_taken when the path exists
};

// Sequential writer over a local file
class FileWriter : public core::Writer {
public:
    FileWriter() = default;
    ~FileWriter() override { close(); }

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    [[nodiscard]] std::error_code open(const std::filesystem::path& path,
                                       OpenMode mode = OpenMode::truncate) noexcept;

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept override;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::filesystem::path path_;
};

// Sequential reader over a local file
class FileReader : public core::Reader {
public:
    FileReader() = default;
    ~FileReader() override { close(); }

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;

    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) noexcept override;

    // Reposition to an absolute offset
    [[nodiscard]] std::error_code seek(std::uint64_t offset) noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] std::chrono::system_clock::time_point modification_time() const noexcept { return mtime_; }

private:
    int fd_{-1};
    std::uint64_t size_{0};
    std::chrono::system_clock::time_point mtime_;
};

} // namespace ferry::disk
