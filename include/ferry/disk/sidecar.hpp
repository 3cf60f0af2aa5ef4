// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/stream.hpp>
#include <ferry/disk/local_file.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>

namespace ferry::disk {

// Resource fork recovered from an existing sidecar, positioned at its payload
struct SidecarSource {
    FileReader reader;
    std::uint32_t size{0};
};

// Create "._<name>" beside `file` and copy `size` resource fork bytes into it
[[nodiscard]] std::error_code write_sidecar(const std::filesystem::path& file,
                                            core::Reader& resource_fork,
                                            std::uint32_t size) noexcept;

// nullopt when `file` has no sidecar or its resource fork is empty.
// bad_sidecar when one exists but is malformed.
[[nodiscard]] std::expected<std::optional<SidecarSource>, std::error_code>
open_sidecar(const std::filesystem::path& file) noexcept;

} // namespace ferry::disk
