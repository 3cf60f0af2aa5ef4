// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/sidecar.hpp>
#include <ferry/disk/paths.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/flat_file.hpp>

namespace ferry::disk {

std::error_code write_sidecar(const std::filesystem::path& file,
                              core::Reader& resource_fork,
                              std::uint32_t size) noexcept {
    std::filesystem::path path;
    try {
        path = sidecar_path(file);
    } catch (const std::exception&) {
        return make_error_code(LocalErrc::bad_path);
    }

    FileWriter writer;
    if (auto ec = writer.open(path)) {
        return ec;
    }
    if (auto ec = core::encode_sidecar_header(writer, size)) {
        return ec;
    }
    return core::copy_exact(writer, resource_fork, size);
}

std::expected<std::optional<SidecarSource>, std::error_code>
open_sidecar(const std::filesystem::path& file) noexcept {
    std::filesystem::path path;
    try {
        path = sidecar_path(file);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(LocalErrc::bad_path));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::optional<SidecarSource>{};
    }

    SidecarSource source;
    if (auto open_ec = source.reader.open(path)) {
        return std::unexpected(open_ec);
    }

    auto entry = core::decode_sidecar_header(source.reader);
    if (!entry) {
        return std::unexpected(entry.error());
    }

    // Payload must fit inside the file
    if (source.reader.size() < static_cast<std::uint64_t>(entry->offset) + entry->length) {
        return std::unexpected(make_error_code(core::TransferErrc::bad_sidecar));
    }
    if (entry->length == 0) {
        return std::optional<SidecarSource>{};
    }

    if (auto seek_ec = source.reader.seek(entry->offset)) {
        return std::unexpected(seek_ec);
    }
    source.size = entry->length;
    return std::optional<SidecarSource>{std::move(source)};
}

} // namespace ferry::disk
