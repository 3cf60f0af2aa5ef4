// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace ferry::core {

// Wire layout
constexpr std::size_t HANDSHAKE_SIZE = 16;
constexpr std::size_t FLAT_FILE_HEADER_SIZE = 24;
constexpr std::size_t FORK_HEADER_SIZE = 16;
constexpr std::size_t INFO_FORK_FIXED_SIZE = 74;        // Without name and comment bytes
constexpr std::size_t SIDECAR_HEADER_SIZE = 82;
constexpr std::uint16_t FLAT_FILE_VERSION = 1;
constexpr std::size_t MAX_FILE_NAME_SIZE = 255;

// Transfer port is the control port + 1
constexpr std::uint16_t TRANSFER_PORT_OFFSET = 1;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 10;
constexpr std::uint32_t IO_TIMEOUT_SEC = 60;

// Progress reporting
constexpr std::size_t COPY_CHUNK_SIZE = 32 * 1024;      // 32 KB
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{100};

// How many finished tasks a listing shows by default
constexpr std::size_t RECENT_TASK_LIMIT = 10;

} // namespace ferry::core
