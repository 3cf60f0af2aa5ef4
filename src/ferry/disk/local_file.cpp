// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/local_file.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <utility>

namespace ferry::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path, OpenMode mode) noexcept {
    if (fd_ >= 0) {
        return make_error_code(LocalErrc::name_taken);
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= mode == OpenMode::exclusive ? O_EXCL : O_TRUNC;

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return from_errno(errno, LocalErrc::write_failed);
    }

    fd_ = fd;
    path_ = path;
    return {};
}

std::error_code FileWriter::write(std::span<const std::byte> data) noexcept {
    if (fd_ < 0) {
        return make_error_code(LocalErrc::not_open);
    }

    std::size_t offset = 0;
    while (offset < data.size()) {
        auto n = ::write(fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return from_errno(errno, LocalErrc::write_failed);
        }
        offset += static_cast<std::size_t>(n);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// FileReader
//=============================================================================

FileReader::FileReader(FileReader&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , size_(std::exchange(other.size_, 0))
    , mtime_(other.mtime_) {}

FileReader& FileReader::operator=(FileReader&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        size_ = std::exchange(other.size_, 0);
        mtime_ = other.mtime_;
    }
    return *this;
}

std::error_code FileReader::open(const std::filesystem::path& path) noexcept {
    if (fd_ >= 0) {
        return make_error_code(LocalErrc::name_taken);
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return from_errno(errno, LocalErrc::read_failed);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        auto ec = from_errno(errno, LocalErrc::read_failed);
        ::close(fd);
        return ec;
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        return make_error_code(LocalErrc::bad_path);
    }

    fd_ = fd;
    size_ = static_cast<std::uint64_t>(st.st_size);
    mtime_ = std::chrono::system_clock::time_point(std::chrono::seconds(st.st_mtime));
    return {};
}

std::expected<std::size_t, std::error_code> FileReader::read(std::span<std::byte> buffer) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(LocalErrc::not_open));
    }

    for (;;) {
        auto n = ::read(fd_, buffer.data(), buffer.size());
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return std::unexpected(from_errno(errno, LocalErrc::read_failed));
        }
    }
}

std::error_code FileReader::seek(std::uint64_t offset) noexcept {
    if (fd_ < 0) {
        return make_error_code(LocalErrc::not_open);
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return make_error_code(LocalErrc::seek_failed);
    }
    return {};
}

void FileReader::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace ferry::disk
