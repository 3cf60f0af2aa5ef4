// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/stream.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::core {

// Fork tags as they appear on the wire
constexpr std::string_view FORK_TAG_INFO = "INFO";
constexpr std::string_view FORK_TAG_DATA = "DATA";
constexpr std::string_view FORK_TAG_RESOURCE = "MACR";

enum class ForkType : std::uint8_t {
    info,
    data,
    resource,
    unknown     // Skipped by readers
};

struct ForkHeader {
    ForkType type{ForkType::unknown};
    std::array<char, 4> tag{};      // Raw tag, kept for logging unknown forks
    std::uint16_t compression{0};
    std::uint32_t data_size{0};

    [[nodiscard]] std::string_view tag_view() const noexcept { return {tag.data(), tag.size()}; }
};

// Classic Mac OS four-character type and creator codes
struct FileType {
    std::string type_code;
    std::string creator_code;
};

// 8-byte Hotline date: year, milliseconds, seconds since start of year
using HotlineTime = std::array<std::byte, 8>;

// Decoded INFO fork payload
struct InfoFork {
    std::string platform{"AMAC"};
    std::string type_code;
    std::string creator_code;
    std::uint32_t flags{0};
    HotlineTime create_date{};
    HotlineTime modify_date{};
    std::string name;
    std::string comment;

    // Payload bytes, excluding the 16-byte fork header
    [[nodiscard]] std::size_t payload_size() const noexcept {
        return INFO_FORK_FIXED_SIZE + name.size() + comment.size();
    }
};

// Location of the resource fork inside a sidecar file
struct SidecarEntry {
    std::uint32_t offset{0};
    std::uint32_t length{0};
};

//=============================================================================
// File types and dates
//=============================================================================

// Look up type/creator codes by extension, "TEXT"/"TTXT" when unknown
[[nodiscard]] FileType file_type_from_filename(std::string_view file_name);

[[nodiscard]] HotlineTime encode_hotline_time(std::chrono::system_clock::time_point tp) noexcept;

[[nodiscard]] std::chrono::system_clock::time_point
decode_hotline_time(std::span<const std::byte> bytes) noexcept;

//=============================================================================
// Container header and fork headers
//=============================================================================

[[nodiscard]] std::array<std::byte, FLAT_FILE_HEADER_SIZE> encode_header(std::uint16_t fork_count) noexcept;

// Read the 24-byte container header, returns the fork count
[[nodiscard]] std::expected<std::uint16_t, std::error_code> decode_header(Reader& reader) noexcept;

[[nodiscard]] std::array<std::byte, FORK_HEADER_SIZE>
encode_fork_header(ForkType type, std::uint32_t data_size) noexcept;

// Read one 16-byte fork header
[[nodiscard]] std::expected<ForkHeader, std::error_code> decode_fork_header(Reader& reader) noexcept;

[[nodiscard]] ForkType fork_type_from_tag(std::span<const std::byte> tag) noexcept;

//=============================================================================
// INFO fork
//=============================================================================

// Serialize the payload only (no fork header)
[[nodiscard]] std::vector<std::byte> encode_info_payload(const InfoFork& info);

// Complete INFO fork (header + payload) for a local file. Empty codes are
// filled in from the extension table.
[[nodiscard]] std::vector<std::byte> encode_info_fork(std::string_view file_name,
                                                      std::chrono::system_clock::time_point mod_time,
                                                      std::string_view type_code = {},
                                                      std::string_view creator_code = {});

[[nodiscard]] std::expected<InfoFork, std::error_code>
decode_info_fork(std::span<const std::byte> payload) noexcept;

//=============================================================================
// AppleDouble sidecar
//=============================================================================

// Write the fixed 82-byte header describing a single resource fork entry
[[nodiscard]] std::error_code encode_sidecar_header(Writer& writer, std::uint32_t resource_fork_size) noexcept;

// Read and validate an 82-byte sidecar header, returns the resource fork entry
[[nodiscard]] std::expected<SidecarEntry, std::error_code> decode_sidecar_header(Reader& reader) noexcept;

} // namespace ferry::core
