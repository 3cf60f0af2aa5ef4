// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace ferry::core {

// All multi-byte integers on the wire are big-endian

constexpr std::uint16_t load_be16(std::span<const std::byte> b) noexcept {
    return static_cast<std::uint16_t>(
        (std::to_integer<std::uint16_t>(b[0]) << 8) |
         std::to_integer<std::uint16_t>(b[1]));
}

constexpr std::uint32_t load_be32(std::span<const std::byte> b) noexcept {
    return (std::to_integer<std::uint32_t>(b[0]) << 24)
         | (std::to_integer<std::uint32_t>(b[1]) << 16)
         | (std::to_integer<std::uint32_t>(b[2]) << 8)
         |  std::to_integer<std::uint32_t>(b[3]);
}

constexpr void store_be16(std::span<std::byte> b, std::uint16_t v) noexcept {
    b[0] = static_cast<std::byte>(v >> 8);
    b[1] = static_cast<std::byte>(v);
}

constexpr void store_be32(std::span<std::byte> b, std::uint32_t v) noexcept {
    b[0] = static_cast<std::byte>(v >> 24);
    b[1] = static_cast<std::byte>(v >> 16);
    b[2] = static_cast<std::byte>(v >> 8);
    b[3] = static_cast<std::byte>(v);
}

// Copy an ASCII tag such as "HTXF" into the first tag.size() bytes
constexpr void store_tag(std::span<std::byte> b, std::string_view tag) noexcept {
    for (std::size_t i = 0; i < tag.size() && i < b.size(); ++i) {
        b[i] = static_cast<std::byte>(tag[i]);
    }
}

} // namespace ferry::core
