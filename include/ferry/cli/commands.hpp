// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/transfer_config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ferry::cli {

// Process exit code, or the error that prevented the transfer from starting
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    download,
    upload
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::string server;             // Control endpoint, HOST:PORT
    std::uint32_t ref{0};           // Reference number from the control reply
    std::optional<std::uint32_t> size;  // Declared transfer size (download)
    std::string name;               // Remote file name (download)
    std::string remote_path;        // Remote folder, "a/b"
    std::string file;               // Local file (upload)
    std::string dir;                // Download directory override
    std::string config;             // JSON config file
    bool tls{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;              // Set when parsing failed
};

[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// "a/b/c" -> {"a", "b", "c"}, empty segments dropped
[[nodiscard]] std::vector<std::string> split_remote_path(std::string_view path);

// Merge the config file (if any) with command line overrides
[[nodiscard]] std::expected<core::TransferConfig, std::error_code> load_config(const CliArgs& args) noexcept;

[[nodiscard]] CliResult download(const CliArgs& args) noexcept;
[[nodiscard]] CliResult upload(const CliArgs& args) noexcept;

void print_help(std::string_view program_name) noexcept;
void print_version() noexcept;

} // namespace ferry::cli
