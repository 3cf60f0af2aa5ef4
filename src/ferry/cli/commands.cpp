// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/cli/progress_bar.hpp>
#include <ferry/core/task.hpp>
#include <ferry/core/transfer_engine.hpp>
#include <ferry/log.hpp>
#include <ferry/version.hpp>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>

namespace ferry::cli {

namespace {

// Drives the progress bar from worker callbacks
class CliListener : public core::TransferListener {
public:
    CliListener(std::shared_ptr<core::Task> task, bool quiet)
        : task_(std::move(task))
        , quiet_(quiet)
        , bar_(0, task_->snapshot().file_name) {}

    void on_progress(std::uint32_t /*task_id*/, std::uint64_t bytes) override {
        if (quiet_) return;
        auto info = task_->snapshot();
        std::lock_guard lock(mutex_);
        bar_.total(info.total_bytes);
        bar_.update(bytes, info.speed_bps);
    }

    void on_status(std::uint32_t /*task_id*/,
                   core::TaskStatus status,
                   const std::optional<core::TaskError>& /*error*/) override {
        if (quiet_) return;
        std::lock_guard lock(mutex_);
        if (status == core::TaskStatus::completed) {
            bar_.total(task_->snapshot().total_bytes);
            bar_.finish();
        } else {
            bar_.clear();
        }
    }

private:
    std::shared_ptr<core::Task> task_;
    bool quiet_;
    ProgressBar bar_;
    std::mutex mutex_;
};

bool parse_u32(std::string_view text, std::uint32_t& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// Shared body of download and upload
CliResult run_transfer(const CliArgs& args, core::TransferDirection direction) {
    auto config = load_config(args);
    if (!config) {
        std::cerr << "Error: Cannot load config " << args.config << ": " << config.error().message() << std::endl;
        return std::unexpected(config.error());
    }

    auto level = spdlog::level::from_str(config->log_level);
    if (args.verbose) level = spdlog::level::debug;
    if (args.quiet) level = spdlog::level::warn;
    try {
        log::init(level, config->log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: Cannot open log file: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }

    auto server = core::Endpoint::parse(args.server);
    if (!server) {
        std::cerr << "Error: Invalid server address: " << args.server << std::endl;
        return std::unexpected(server.error());
    }

    core::TaskManager tasks;
    std::shared_ptr<core::Task> task;
    if (direction == core::TransferDirection::download) {
        task = tasks.create(args.name, split_remote_path(args.remote_path), direction);
    } else {
        auto file_name = std::filesystem::path(args.file).filename().string();
        task = tasks.create(file_name, split_remote_path(args.remote_path), direction);
        task->set_local_path(args.file);
    }

    core::TransferChannel::global_init();

    CliListener listener(task, args.quiet);
    {
        core::TransferEngine engine({*server, args.tls}, *config);
        engine.listener(&listener);

        // Uploads compute their own size
        core::TransferRequest request{core::make_ref_num(args.ref), args.size.value_or(0)};
        if (direction == core::TransferDirection::download) {
            engine.start_download(task, request);
        } else {
            engine.start_upload(task, request);
        }
        engine.wait();
    }

    core::TransferChannel::global_cleanup();

    auto info = task->snapshot();
    if (info.status != core::TaskStatus::completed) {
        std::cerr << "Error: " << (info.error ? info.error->message() : "transfer did not finish") << std::endl;
        return 1;
    }

    if (!args.quiet) {
        if (direction == core::TransferDirection::download) {
            std::cout << "Saved " << format_bytes(info.transferred_bytes) << " to " << info.local_path << std::endl;
        } else {
            std::cout << "Uploaded " << format_bytes(info.transferred_bytes) << " from " << info.local_path << std::endl;
        }
    }
    return 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto fail = [&](std::string message) {
        if (args.error.empty()) {
            args.error = std::move(message);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Options that take a value
        auto value = [&]() -> std::string_view {
            if (i + 1 < argc) {
                return argv[++i];
            }
            fail(std::string("Missing value for ") + std::string(arg));
            return {};
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "download" && args.command == Command::none) {
            args.command = Command::download;
        } else if (arg == "upload" && args.command == Command::none) {
            args.command = Command::upload;
        } else if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--tls") {
            args.tls = true;
        } else if (arg == "--server") {
            args.server = value();
        } else if (arg == "--ref") {
            if (!parse_u32(value(), args.ref)) fail("Invalid --ref");
        } else if (arg == "--size") {
            std::uint32_t size = 0;
            if (parse_u32(value(), size)) {
                args.size = size;
            } else {
                fail("Invalid --size");
            }
        } else if (arg == "--name") {
            args.name = value();
        } else if (arg == "--path") {
            args.remote_path = value();
        } else if (arg == "--file") {
            args.file = value();
        } else if (arg == "-d" || arg == "--dir") {
            args.dir = value();
        } else if (arg == "-c" || arg == "--config") {
            args.config = value();
        } else {
            fail(std::string("Unknown argument: ") + std::string(arg));
        }
    }

    if (args.command == Command::none) {
        fail("No command specified");
    }
    if (args.server.empty()) {
        fail("--server is required");
    }
    if (args.command == Command::download && args.name.empty()) {
        fail("--name is required for download");
    }
    if (args.command == Command::download && !args.size) {
        fail("--size is required for download");
    }
    if (args.command == Command::upload && args.file.empty()) {
        fail("--file is required for upload");
    }

    return args;
}

std::vector<std::string> split_remote_path(std::string_view path) {
    std::vector<std::string> segments;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto segment = path.substr(0, slash);
        if (!segment.empty()) {
            segments.emplace_back(segment);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

std::expected<core::TransferConfig, std::error_code> load_config(const CliArgs& args) noexcept {
    try {
        core::TransferConfig config = core::TransferConfig::defaults();
        if (!args.config.empty()) {
            auto loaded = core::TransferConfig::load(args.config);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            config = std::move(*loaded);
        }
        if (!args.dir.empty()) {
            config.download_dir = args.dir;
        }
        return config;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        return run_transfer(args, core::TransferDirection::download);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult upload(const CliArgs& args) noexcept {
    try {
        return run_transfer(args, core::TransferDirection::upload);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "ferry " << version.to_string() << " - " << PROTOCOL_NAME << " file transfer client\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " download --server HOST:PORT --ref N --size BYTES --name FILE [OPTIONS]\n";
    std::cout << "  " << program_name << " upload   --server HOST:PORT --ref N --file PATH [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "      --server HOST:PORT  Control endpoint; transfers use PORT + 1\n";
    std::cout << "      --ref N             Reference number from the server reply\n";
    std::cout << "      --size BYTES        Transfer size from the server reply\n";
    std::cout << "      --name FILE         Remote file name to download\n";
    std::cout << "      --path a/b          Remote folder of the file\n";
    std::cout << "      --file PATH         Local file to upload\n";
    std::cout << "      --tls               Connect with TLS\n";
    std::cout << "  -d, --dir <DIR>         Download directory\n";
    std::cout << "  -c, --config <FILE>     JSON configuration file\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " download --server hl.example.org:5500 --ref 7 --size 1024 --name readme.txt\n";
    std::cout << "  " << program_name << " upload --server hl.example.org:5500 --ref 9 --file ./notes.txt\n";
}

void print_version() noexcept {
    std::cout << "ferry " << version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace ferry::cli
