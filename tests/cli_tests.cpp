// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/cli/commands.hpp>
#include <ferry/cli/progress_bar.hpp>
#include "test_support.hpp"

using namespace ferry::cli;

namespace {

// argv as parse_args expects it
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const noexcept { return static_cast<int>(pointers_.size()); }
    char** argv() noexcept { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

CliArgs parse(std::initializer_list<std::string> args) {
    Argv argv(args);
    return parse_args(argv.argc(), argv.argv());
}

} // namespace

TEST_CASE("Argument parsing", "[cli]") {
    SECTION("Download") {
        auto args = parse({"ferry", "download", "--server", "hl.example.org:5500", "--ref", "7",
                           "--size", "1024", "--name", "readme.txt", "--path", "Docs/Old", "-d", "/tmp/in"});
        CHECK(args.error.empty());
        CHECK(args.command == Command::download);
        CHECK(args.server == "hl.example.org:5500");
        CHECK(args.ref == 7);
        CHECK(args.size == 1024u);
        CHECK(args.name == "readme.txt");
        CHECK(args.remote_path == "Docs/Old");
        CHECK(args.dir == "/tmp/in");
        CHECK(!args.tls);
    }

    SECTION("Upload with flags") {
        auto args = parse({"ferry", "upload", "--server", "[::1]:5600", "--ref", "9",
                           "--file", "./notes.txt", "--tls", "-q", "-V"});
        CHECK(args.error.empty());
        CHECK(args.command == Command::upload);
        CHECK(args.file == "./notes.txt");
        CHECK(args.tls);
        CHECK(args.quiet);
        CHECK(args.verbose);
    }

    SECTION("Download needs the size from the server reply") {
        auto missing = parse({"ferry", "download", "--server", "h:1", "--ref", "3", "--name", "a"});
        CHECK(missing.error == "--size is required for download");
        CHECK(!missing.size.has_value());

        auto empty_file = parse({"ferry", "download", "--server", "h:1", "--name", "a", "--size", "0"});
        CHECK(empty_file.error.empty());
        CHECK(empty_file.size == 0u);
    }

    SECTION("Upload does not take a size") {
        auto args = parse({"ferry", "upload", "--server", "h:1", "--file", "x.bin"});
        CHECK(args.error.empty());
        CHECK(!args.size.has_value());
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"ferry", "--help", "bogus"}).help);
        CHECK(parse({"ferry", "-v"}).version);
    }

    SECTION("Errors") {
        CHECK(!parse({"ferry"}).error.empty());
        CHECK(!parse({"ferry", "download", "--name", "a"}).error.empty());
        CHECK(!parse({"ferry", "download", "--server", "h:1"}).error.empty());
        CHECK(!parse({"ferry", "upload", "--server", "h:1"}).error.empty());
        CHECK(!parse({"ferry", "download", "--server", "h:1", "--name", "a", "--ref", "x"}).error.empty());
        CHECK(!parse({"ferry", "download", "--server", "h:1", "--name", "a", "--size", "-1"}).error.empty());
        CHECK(!parse({"ferry", "download", "--server", "h:1", "--name", "a", "--bogus"}).error.empty());
        CHECK(!parse({"ferry", "download", "--server"}).error.empty());
    }
}

TEST_CASE("Remote path splitting", "[cli]") {
    CHECK(split_remote_path("").empty());
    CHECK(split_remote_path("a/b/c") == std::vector<std::string>{"a", "b", "c"});
    CHECK(split_remote_path("/Music//Old/") == std::vector<std::string>{"Music", "Old"});
}

TEST_CASE("Config with command line overrides", "[cli]") {
    ferry::test::TempDir dir;

    SECTION("Directory option wins over the file") {
        auto path = dir.path() / "ferry.json";
        ferry::test::write_file(path, ferry::test::bytes(R"({"download_dir": "/from/file", "log_level": "warn"})"));

        CliArgs args;
        args.config = path.string();
        args.dir = "/from/cli";
        auto cfg = load_config(args);
        REQUIRE(cfg.has_value());
        CHECK(cfg->download_dir == "/from/cli");
        CHECK(cfg->log_level == "warn");
    }

    SECTION("Missing config file") {
        CliArgs args;
        args.config = (dir.path() / "absent.json").string();
        CHECK(!load_config(args).has_value());
    }
}

TEST_CASE("Formatting", "[cli]") {
    SECTION("Bytes") {
        CHECK(format_bytes(512) == "512 B");
        CHECK(format_bytes(2048) == "2 KB");
        CHECK(format_bytes(1536 * 1024) == "1.5 MB");
        CHECK(format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
    }

    SECTION("Speed") {
        CHECK(format_speed(100) == "100 B/s");
        CHECK(format_speed(1024) == "1.0 KB/s");
        CHECK(format_speed(5 * 1024 * 1024) == "5.0 MB/s");
    }

    SECTION("Time") {
        CHECK(format_time(5) == "5s");
        CHECK(format_time(125) == "2m 5s");
        CHECK(format_time(3723) == "1h 02m 3s");
    }

    SECTION("Progress line") {
        ProgressBar bar(2048, "file.bin");
        auto line = bar.render(1024, 512);
        CHECK(line.starts_with("file.bin: ["));
        CHECK(line.find(" 50% (1 KB/2 KB)") != std::string::npos);
        CHECK(line.find("@ 512 B/s") != std::string::npos);
        CHECK(line.find("ETA: 2s") != std::string::npos);
    }
}
