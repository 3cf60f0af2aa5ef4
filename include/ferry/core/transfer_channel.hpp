// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/stream.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace ferry::core {

// Host and port of a Hotline server
struct Endpoint {
    std::string host;
    std::uint16_t port{0};

    // Parse "host:port" or "[v6addr]:port"
    [[nodiscard]] static std::expected<Endpoint, std::error_code> parse(std::string_view text) noexcept;

    // "host:port", with brackets around IPv6 literals
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Endpoint&) const = default;
};

// Transfer port is the control port + 1. invalid_argument when that
// would overflow the port range.
[[nodiscard]] std::expected<Endpoint, std::error_code> transfer_endpoint(const Endpoint& control);

// Opaque 4-byte reference number issued by the control channel
using RefNum = std::array<std::byte, 4>;

[[nodiscard]] RefNum make_ref_num(std::uint32_t value) noexcept;

// "HTXF" + ref + BE32 total size + 4 zero bytes
[[nodiscard]] std::array<std::byte, HANDSHAKE_SIZE>
encode_handshake(const RefNum& ref, std::uint32_t total_size) noexcept;

// Bidirectional byte stream to a transfer port
class Connection : public Reader, public Writer {
public:
    virtual void close() noexcept = 0;
};

struct ChannelOptions {
    bool tls{false};
    bool verify_peer{false};        // Legacy servers use self-signed certificates
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds io_timeout{IO_TIMEOUT_SEC};    // 0 = wait forever
};

class TransferChannel {
public:
    // Dial the transfer port, negotiating TLS when requested
    [[nodiscard]] static std::expected<std::unique_ptr<Connection>, std::error_code>
    open(const Endpoint& endpoint, const ChannelOptions& options) noexcept;

    // Send the 16-byte preamble. Any write failure is handshake_failed.
    [[nodiscard]] static std::error_code
    handshake(Writer& connection, const RefNum& ref, std::uint32_t total_size) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace ferry::core
