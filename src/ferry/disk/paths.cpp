// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/paths.hpp>
#include <cstdint>
#include <format>

namespace ferry::disk {

namespace {

bool path_taken(const std::filesystem::path& p) noexcept {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(p, ec));
}

// A remote name must not escape the download directory
bool safe_name(std::string_view file_name) noexcept {
    return !file_name.empty() && file_name != "." && file_name != ".." &&
           file_name.find('/') == std::string_view::npos;
}

// dir/name for n == 0, dir/"stem (n).ext" otherwise.
// "archive.tar.gz" splits into stem "archive.tar" and extension ".gz".
std::filesystem::path candidate(const std::filesystem::path& dir, std::string_view file_name, std::uint32_t n) {
    if (n == 0) {
        return dir / std::filesystem::path(file_name);
    }

    std::string_view stem = file_name;
    std::string_view ext;
    if (auto dot = file_name.rfind('.'); dot != std::string_view::npos && dot > 0) {
        stem = file_name.substr(0, dot);
        ext = file_name.substr(dot);
    }
    return dir / std::format("{} ({}){}", stem, n, ext);
}

} // namespace

std::expected<std::filesystem::path, std::error_code>
resolve_download_path(const std::filesystem::path& dir, std::string_view file_name) noexcept {
    if (!safe_name(file_name)) {
        return std::unexpected(make_error_code(LocalErrc::bad_path));
    }

    try {
        for (std::uint32_t n = 0; ; ++n) {
            auto path = candidate(dir, file_name, n);
            if (!path_taken(path)) {
                return path;
            }
        }
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(LocalErrc::bad_path));
    }
}

std::expected<std::filesystem::path, std::error_code>
create_download_file(const std::filesystem::path& dir, std::string_view file_name, FileWriter& file) noexcept {
    if (!safe_name(file_name)) {
        return std::unexpected(make_error_code(LocalErrc::bad_path));
    }
    if (file.is_open()) {
        return std::unexpected(make_error_code(LocalErrc::name_taken));
    }

    try {
        for (std::uint32_t n = 0; ; ++n) {
            auto path = candidate(dir, file_name, n);
            if (path_taken(path)) {
                continue;
            }

            // Another worker may claim the same name between the check and the create
            auto ec = file.open(path, OpenMode::exclusive);
            if (ec == LocalErrc::name_taken) {
                continue;
            }
            if (ec) {
                return std::unexpected(ec);
            }
            return path;
        }
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(LocalErrc::bad_path));
    }
}

std::filesystem::path sidecar_path(const std::filesystem::path& file) {
    return file.parent_path() / ("._" + file.filename().string());
}

std::error_code ensure_directory(const std::filesystem::path& dir) noexcept {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return make_error_code(LocalErrc::download_dir_unavailable);
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        return make_error_code(LocalErrc::download_dir_unavailable);
    }
    return {};
}

} // namespace ferry::disk
