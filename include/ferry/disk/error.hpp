// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace ferry::disk {

// Failures touching the local side of a transfer: the download directory,
// the received file, its sidecar and the file being uploaded
enum class LocalErrc {
    missing = 1,                // Upload source, sidecar or config file absent
    no_permission,
    out_of_space,
    bad_path,                   // Remote name escapes the download directory, or path unusable
    name_taken,                 // Exclusive create lost to an existing entry
    download_dir_unavailable,
    write_failed,
    read_failed,
    seek_failed,
    not_open,
};

[[nodiscard]] const std::error_category& local_category() noexcept;

inline std::error_code make_error_code(LocalErrc e) noexcept {
    return {static_cast<int>(e), local_category()};
}

// errno from a failed open/read/write, or `fallback` when errno has no closer match
[[nodiscard]] std::error_code from_errno(int err, LocalErrc fallback) noexcept;

} // namespace ferry::disk

namespace std {

template<>
struct is_error_code_enum<ferry::disk::LocalErrc> : true_type {};

} // namespace std
