// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/progress.hpp>
#include <ferry/core/transfer_channel.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace ferry::core {

// Runtime settings, loaded from a JSON file. Missing keys keep their defaults.
struct TransferConfig {
    std::string download_dir;                   // $HOME/Downloads/Hotline when unset
    bool verify_tls_peer{false};
    bool tolerate_short_read{false};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t io_timeout_sec{IO_TIMEOUT_SEC};   // 0 = no limit
    std::uint32_t progress_interval_ms{static_cast<std::uint32_t>(PROGRESS_INTERVAL.count())};
    std::string log_level{"info"};
    std::string log_file;                       // Empty = console only

    [[nodiscard]] static TransferConfig defaults();

    [[nodiscard]] static std::expected<TransferConfig, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] static std::expected<TransferConfig, std::error_code>
    parse(std::string_view json) noexcept;

    [[nodiscard]] ChannelOptions channel_options(bool tls) const noexcept;
    [[nodiscard]] CopyOptions copy_options() const noexcept;
};

} // namespace ferry::core
