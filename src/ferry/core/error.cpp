// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/error.hpp>
#include <ferry/disk/error.hpp>

namespace ferry::core {

ErrorKind error_kind(const std::error_code& ec) noexcept {
    if (!ec) {
        return ErrorKind::none;
    }

    if (ec.category() == disk::local_category()) {
        return ErrorKind::filesystem;
    }

    if (ec.category() != transfer_errc_category()) {
        return ErrorKind::other;
    }

    switch (static_cast<TransferErrc>(ec.value())) {
        case TransferErrc::truncated_header:
        case TransferErrc::bad_fork_count:
        case TransferErrc::truncated_fork:
        case TransferErrc::bad_sidecar:
            return ErrorKind::format;

        case TransferErrc::handshake_failed:
        case TransferErrc::size_mismatch:
        case TransferErrc::connection_failed:
        case TransferErrc::tls_error:
        case TransferErrc::invalid_transition:
            return ErrorKind::protocol;

        case TransferErrc::short_read:
        case TransferErrc::connection_lost:
        case TransferErrc::timeout:
        case TransferErrc::send_failed:
        case TransferErrc::recv_failed:
            return ErrorKind::transfer;

        default:
            return ErrorKind::other;
    }
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::none:        return "none";
        case ErrorKind::format:      return "format";
        case ErrorKind::protocol:    return "protocol";
        case ErrorKind::transfer:    return "transfer";
        case ErrorKind::filesystem:  return "filesystem";
        default:                     return "other";
    }
}

std::string TaskError::message() const {
    if (stage.empty()) {
        return code.message();
    }
    return stage + ": " + code.message();
}

} // namespace ferry::core
