// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/transfer_config.hpp>
#include <ferry/disk/error.hpp>
#include <ferry/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ferry::core {

namespace {

template<typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j[key].get<T>();
    }
}

} // namespace

TransferConfig TransferConfig::defaults() {
    TransferConfig cfg;
    if (const char* home = std::getenv("HOME"); home && *home) {
        cfg.download_dir = (std::filesystem::path(home) / "Downloads" / "Hotline").string();
    } else {
        cfg.download_dir = (std::filesystem::current_path() / "Downloads").string();
    }
    return cfg;
}

std::expected<TransferConfig, std::error_code> TransferConfig::parse(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        auto cfg = defaults();
        read_key(j, "download_dir", cfg.download_dir);
        read_key(j, "verify_tls_peer", cfg.verify_tls_peer);
        read_key(j, "tolerate_short_read", cfg.tolerate_short_read);
        read_key(j, "connect_timeout_sec", cfg.connect_timeout_sec);
        read_key(j, "io_timeout_sec", cfg.io_timeout_sec);
        read_key(j, "progress_interval_ms", cfg.progress_interval_ms);
        read_key(j, "log_level", cfg.log_level);
        read_key(j, "log_file", cfg.log_file);
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        log::get()->error("Invalid configuration: {}", e.what());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    } catch (const std::exception& e) {
        log::get()->error("Configuration error: {}", e.what());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
}

std::expected<TransferConfig, std::error_code> TransferConfig::load(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(make_error_code(disk::LocalErrc::missing));
    }

    try {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::unexpected(make_error_code(disk::LocalErrc::no_permission));
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        return parse(contents.str());
    } catch (const std::exception& e) {
        log::get()->error("Failed to read {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(disk::LocalErrc::read_failed));
    }
}

ChannelOptions TransferConfig::channel_options(bool tls) const noexcept {
    ChannelOptions options;
    options.tls = tls;
    options.verify_peer = verify_tls_peer;
    options.connect_timeout = std::chrono::seconds(connect_timeout_sec);
    options.io_timeout = std::chrono::seconds(io_timeout_sec);
    return options;
}

CopyOptions TransferConfig::copy_options() const noexcept {
    CopyOptions options;
    options.interval = std::chrono::milliseconds(progress_interval_ms);
    options.tolerate_short_read = tolerate_short_read;
    return options;
}

} // namespace ferry::core
