// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <system_error>
#include <string>
#include <string_view>

namespace ferry::core {

enum class TransferErrc {
    success = 0,

    // Container / sidecar format
    truncated_header,
    bad_fork_count,
    truncated_fork,
    bad_sidecar,

    // Transfer-port protocol
    handshake_failed,
    size_mismatch,
    connection_failed,
    tls_error,
    invalid_transition,

    // Mid-stream I/O
    short_read,
    connection_lost,
    timeout,
    send_failed,
    recv_failed,
};

// Coarse classification used when presenting a failure
enum class ErrorKind : std::uint8_t {
    none,
    format,
    protocol,
    transfer,
    filesystem,
    other,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::transfer";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:             return "Success";
            case TransferErrc::truncated_header:    return "Truncated container header";
            case TransferErrc::bad_fork_count:      return "Invalid fork count";
            case TransferErrc::truncated_fork:      return "Truncated fork";
            case TransferErrc::bad_sidecar:         return "Malformed resource fork sidecar";
            case TransferErrc::handshake_failed:    return "Handshake write failed";
            case TransferErrc::size_mismatch:       return "Declared size does not match transferred bytes";
            case TransferErrc::connection_failed:   return "Could not connect to transfer port";
            case TransferErrc::tls_error:           return "TLS negotiation failed";
            case TransferErrc::invalid_transition:  return "Invalid task status transition";
            case TransferErrc::short_read:          return "Stream ended before declared size";
            case TransferErrc::connection_lost:     return "Connection lost";
            case TransferErrc::timeout:             return "Operation timed out";
            case TransferErrc::send_failed:         return "Send failed";
            case TransferErrc::recv_failed:         return "Receive failed";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// Map an error code onto format / protocol / transfer / filesystem
[[nodiscard]] ErrorKind error_kind(const std::error_code& ec) noexcept;

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// An error annotated with the transfer stage that produced it
struct TaskError {
    std::string stage;
    std::error_code code;

    // "<stage>: <code message>"
    [[nodiscard]] std::string message() const;

    [[nodiscard]] ErrorKind kind() const noexcept { return error_kind(code); }
};

} // namespace ferry::core

namespace std {

template<>
struct is_error_code_enum<ferry::core::TransferErrc> : true_type {};

} // namespace std
