// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/disk/error.hpp>
#include <ferry/disk/local_file.hpp>
#include <expected>
#include <filesystem>
#include <string_view>

namespace ferry::disk {

// dir/name, or dir/"name (n).ext" with the lowest n not already taken
[[nodiscard]] std::expected<std::filesystem::path, std::error_code>
resolve_download_path(const std::filesystem::path& dir, std::string_view file_name) noexcept;

// Claim the name resolve_download_path would pick by creating it exclusively
// through `file`. A name created concurrently by someone else moves on to
// the next " (n)" candidate. Returns the path `file` now has open.
// `file` must not already be open.
[[nodiscard]] std::expected<std::filesystem::path, std::error_code>
create_download_file(const std::filesystem::path& dir, std::string_view file_name, FileWriter& file) noexcept;

// AppleDouble companion: same directory, "._" + file name
[[nodiscard]] std::filesystem::path sidecar_path(const std::filesystem::path& file);

// mkdir -p; download_dir_unavailable when the path cannot be created
[[nodiscard]] std::error_code ensure_directory(const std::filesystem::path& dir) noexcept;

} // namespace ferry::disk
