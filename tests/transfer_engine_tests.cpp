// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/byte_order.hpp>
#include <ferry/core/flat_file.hpp>
#include <ferry/core/transfer_engine.hpp>
#include <ferry/disk/paths.hpp>
#include <ferry/disk/sidecar.hpp>
#include "test_support.hpp"
#include <functional>
#include <mutex>
#include <set>
#include <thread>

using namespace ferry::core;
using namespace ferry::test;

namespace {

struct StatusEvent {
    std::uint32_t id;
    TaskStatus status;
    std::optional<TaskError> error;
};

class RecordingListener : public TransferListener {
public:
    void on_progress(std::uint32_t /*task_id*/, std::uint64_t bytes) override {
        std::lock_guard lock(mutex);
        progress.push_back(bytes);
    }

    void on_status(std::uint32_t task_id, TaskStatus status, const std::optional<TaskError>& error) override {
        std::lock_guard lock(mutex);
        statuses.push_back({task_id, status, error});
    }

    std::mutex mutex;
    std::vector<std::uint64_t> progress;
    std::vector<StatusEvent> statuses;
};

// Server side of a download: container header followed by the given forks
class FlatFileBuilder {
public:
    explicit FlatFileBuilder(std::uint16_t fork_count) {
        append(out_, encode_header(fork_count));
    }

    FlatFileBuilder& info(std::string_view name) {
        auto fork = encode_info_fork(name, std::chrono::system_clock::now());
        append(out_, fork);
        return *this;
    }

    FlatFileBuilder& fork(ForkType type, std::span<const std::byte> payload) {
        return fork(type, payload, static_cast<std::uint32_t>(payload.size()));
    }

    // Declared size may differ from the bytes that follow
    FlatFileBuilder& fork(ForkType type, std::span<const std::byte> payload, std::uint32_t declared) {
        append(out_, encode_fork_header(type, declared));
        append(out_, payload);
        return *this;
    }

    FlatFileBuilder& raw_fork(std::string_view tag, std::span<const std::byte> payload) {
        auto header = bytes(tag);
        header.resize(FORK_HEADER_SIZE);
        store_be32(std::span(header).subspan(12), static_cast<std::uint32_t>(payload.size()));
        append(out_, header);
        append(out_, payload);
        return *this;
    }

    std::vector<std::byte> build() { return std::move(out_); }

private:
    std::vector<std::byte> out_;
};

struct EngineFixture {
    TempDir dir;
    std::shared_ptr<PeerState> peer = std::make_shared<PeerState>();
    RecordingListener listener;
    TaskManager tasks;

    TransferConfig config() const {
        TransferConfig cfg = TransferConfig::defaults();
        cfg.download_dir = (dir.path() / "downloads").string();
        return cfg;
    }

    std::unique_ptr<TransferEngine> engine(TransferConfig cfg) {
        auto e = std::make_unique<TransferEngine>(ControlLink{{"127.0.0.1", 5500}, false}, std::move(cfg));
        e->listener(&listener);
        e->dialer(memory_dialer(peer));
        return e;
    }

    std::unique_ptr<TransferEngine> engine() { return engine(config()); }
};

TransferRequest request(std::uint32_t ref, std::uint32_t size) {
    return {make_ref_num(ref), size};
}

std::uint32_t sent_transfer_size(const PeerState& peer) {
    REQUIRE(peer.output.size() >= HANDSHAKE_SIZE);
    return load_be32(std::span<const std::byte>(peer.output).subspan(8));
}

// Hands every dial a fresh peer that serves `content` as `name`
struct PeerPool {
    std::vector<std::byte> content;
    std::string name;
    std::mutex mutex;
    std::vector<std::shared_ptr<PeerState>> peers;

    Dialer dialer() {
        return [this](const Endpoint& endpoint, const ChannelOptions& options)
                   -> std::expected<std::unique_ptr<Connection>, std::error_code> {
            auto peer = std::make_shared<PeerState>();
            peer->input = FlatFileBuilder(2).info(name).fork(ForkType::data, content).build();
            {
                std::lock_guard lock(mutex);
                peers.push_back(peer);
            }
            return memory_dialer(peer)(endpoint, options);
        };
    }
};

bool wait_until(const std::function<bool()>& done) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

TEST_CASE("Download", "[engine]") {
    EngineFixture fx;

    SECTION("Data fork lands in the download directory") {
        auto content = pattern(50'000);
        fx.peer->input = FlatFileBuilder(2).info("song.mp3").fork(ForkType::data, content).build();

        auto task = fx.tasks.create("song.mp3", {"Music"}, TransferDirection::download);
        fx.engine()->run_download(*task, request(7, 50'200));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(info.local_path == (fx.dir.path() / "downloads" / "song.mp3").string());
        CHECK(read_file(info.local_path) == content);
        CHECK(info.total_bytes == content.size());
        CHECK(info.transferred_bytes == info.total_bytes);

        // Handshake carries the reference and declared size
        auto expected = encode_handshake(make_ref_num(7), 50'200);
        REQUIRE(fx.peer->output.size() == HANDSHAKE_SIZE);
        CHECK(std::equal(expected.begin(), expected.end(), fx.peer->output.begin()));
        CHECK(fx.peer->dialed.port == 5501);
        CHECK(fx.peer->dialed.host == "127.0.0.1");
    }

    SECTION("Zero-length data fork") {
        fx.peer->input = FlatFileBuilder(2).info("empty.txt").fork(ForkType::data, {}).build();

        auto task = fx.tasks.create("empty.txt", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(info.total_bytes == 0);
        CHECK(info.transferred_bytes == 0);
        CHECK(std::filesystem::exists(info.local_path));
        CHECK(std::filesystem::file_size(info.local_path) == 0);
    }

    SECTION("Existing file is not overwritten") {
        std::filesystem::create_directories(fx.dir.path() / "downloads");
        write_file(fx.dir.path() / "downloads" / "a.txt", bytes("old"));
        fx.peer->input = FlatFileBuilder(2).info("a.txt").fork(ForkType::data, bytes("new")).build();

        auto task = fx.tasks.create("a.txt", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(std::filesystem::path(info.local_path).filename() == "a (1).txt");
        CHECK(read_file(fx.dir.path() / "downloads" / "a.txt") == bytes("old"));
    }

    SECTION("Resource fork becomes a sidecar") {
        auto content = pattern(1000);
        auto resource = pattern(321);
        fx.peer->input = FlatFileBuilder(3)
                             .info("app.sit")
                             .fork(ForkType::data, content)
                             .fork(ForkType::resource, resource)
                             .build();

        auto task = fx.tasks.create("app.sit", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(read_file(info.local_path) == content);

        auto sidecar = ferry::disk::open_sidecar(info.local_path);
        REQUIRE(sidecar.has_value());
        REQUIRE(sidecar->has_value());
        CHECK((*sidecar)->size == resource.size());
    }

    SECTION("Unknown forks are skipped") {
        auto content = pattern(64);
        fx.peer->input = FlatFileBuilder(3)
                             .info("x.bin")
                             .raw_fork("XTRA", pattern(40))
                             .fork(ForkType::data, content)
                             .build();

        auto task = fx.tasks.create("x.bin", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(read_file(info.local_path) == content);
    }

    SECTION("Short data fork fails") {
        fx.peer->input = FlatFileBuilder(2).info("cut.bin").fork(ForkType::data, pattern(500), 1000).build();

        auto task = fx.tasks.create("cut.bin", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::failed);
        REQUIRE(info.error.has_value());
        CHECK(info.error->stage == "data transfer failed");
        CHECK(info.error->code == TransferErrc::short_read);
    }

    SECTION("Short data fork tolerated when configured") {
        fx.peer->input = FlatFileBuilder(2).info("cut.bin").fork(ForkType::data, pattern(500), 1000).build();

        auto cfg = fx.config();
        cfg.tolerate_short_read = true;
        auto task = fx.tasks.create("cut.bin", {}, TransferDirection::download);
        fx.engine(cfg)->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(info.transferred_bytes == 500);
        CHECK(std::filesystem::file_size(info.local_path) == 500);
    }

    SECTION("Bad container header") {
        auto header = encode_header(9);
        fx.peer->input.assign(header.begin(), header.end());

        auto task = fx.tasks.create("bad.bin", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::failed);
        CHECK(info.error->stage == "read header failed");
        CHECK(info.error->code == TransferErrc::bad_fork_count);
        CHECK(info.error->kind() == ErrorKind::format);
    }

    SECTION("Stream ends before the data fork") {
        fx.peer->input = FlatFileBuilder(2).info("gone.bin").build();

        auto task = fx.tasks.create("gone.bin", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::failed);
        CHECK(info.error->stage == "read data fork header failed");
    }

    SECTION("Broken resource fork after the data fork is not fatal") {
        auto content = pattern(100);
        fx.peer->input = FlatFileBuilder(3)
                             .info("r.bin")
                             .fork(ForkType::data, content)
                             .fork(ForkType::resource, pattern(10), 200)
                             .build();

        auto task = fx.tasks.create("r.bin", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(read_file(info.local_path) == content);
    }

    SECTION("Exactly one status notification") {
        fx.peer->input = FlatFileBuilder(2).info("a").fork(ForkType::data, pattern(10)).build();

        auto task = fx.tasks.create("a", {}, TransferDirection::download);
        fx.engine()->run_download(*task, request(1, 0));

        REQUIRE(fx.listener.statuses.size() == 1);
        CHECK(fx.listener.statuses[0].id == task->id());
        CHECK(fx.listener.statuses[0].status == TaskStatus::completed);
        REQUIRE(!fx.listener.progress.empty());
        CHECK(fx.listener.progress.back() == 10);
    }

    SECTION("Task that is already running is left alone") {
        auto task = fx.tasks.create("a", {}, TransferDirection::download);
        REQUIRE(!task->activate());
        fx.engine()->run_download(*task, request(1, 0));

        CHECK(task->status() == TaskStatus::active);
        CHECK(fx.listener.statuses.empty());
        CHECK(fx.peer->output.empty());
    }
}

TEST_CASE("Upload", "[engine]") {
    EngineFixture fx;
    auto local = fx.dir.path() / "upload.bin";
    auto content = pattern(5000);
    write_file(local, content);

    auto task = fx.tasks.create("upload.bin", {"Uploads"}, TransferDirection::upload);
    task->set_local_path(local.string());

    SECTION("Data fork only") {
        fx.engine()->run_upload(*task, request(9, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::completed);
        CHECK(info.total_bytes == 5000);
        CHECK(info.transferred_bytes == 5000);

        auto info_fork_size = FORK_HEADER_SIZE + INFO_FORK_FIXED_SIZE + std::string_view("upload.bin").size();
        auto expected_total = FLAT_FILE_HEADER_SIZE + info_fork_size + FORK_HEADER_SIZE + content.size();
        CHECK(sent_transfer_size(*fx.peer) == expected_total);
        CHECK(fx.peer->output.size() == HANDSHAKE_SIZE + expected_total);

        // Container header declares two forks
        MemoryReader stream(std::span<const std::byte>(fx.peer->output).subspan(HANDSHAKE_SIZE));
        auto forks = decode_header(stream);
        REQUIRE(forks.has_value());
        CHECK(*forks == 2);

        auto info_header = decode_fork_header(stream);
        REQUIRE(info_header.has_value());
        CHECK(info_header->type == ForkType::info);
        std::vector<std::byte> payload(info_header->data_size);
        REQUIRE(!read_exact(stream, payload, TransferErrc::truncated_fork));
        auto decoded = decode_info_fork(payload);
        REQUIRE(decoded.has_value());
        CHECK(decoded->name == "upload.bin");

        auto data_header = decode_fork_header(stream);
        REQUIRE(data_header.has_value());
        CHECK(data_header->type == ForkType::data);
        CHECK(data_header->data_size == content.size());
        CHECK(std::equal(content.begin(), content.end(), fx.peer->output.end() - content.size()));
    }

    SECTION("Sidecar adds a resource fork") {
        auto resource = pattern(77);
        MemoryReader source(resource);
        REQUIRE(!ferry::disk::write_sidecar(local, source, static_cast<std::uint32_t>(resource.size())));

        fx.engine()->run_upload(*task, request(9, 0));

        REQUIRE(task->status() == TaskStatus::completed);
        auto info_fork_size = FORK_HEADER_SIZE + INFO_FORK_FIXED_SIZE + std::string_view("upload.bin").size();
        auto expected_total = FLAT_FILE_HEADER_SIZE + info_fork_size + FORK_HEADER_SIZE + content.size() +
                              FORK_HEADER_SIZE + resource.size();
        CHECK(sent_transfer_size(*fx.peer) == expected_total);

        MemoryReader stream(std::span<const std::byte>(fx.peer->output).subspan(HANDSHAKE_SIZE));
        CHECK(decode_header(stream).value_or(0) == 3);
        CHECK(std::equal(resource.begin(), resource.end(), fx.peer->output.end() - resource.size()));
    }

    SECTION("Malformed sidecar is ignored") {
        write_file(ferry::disk::sidecar_path(local), bytes("not an AppleDouble file"));

        fx.engine()->run_upload(*task, request(9, 0));

        REQUIRE(task->status() == TaskStatus::completed);
        MemoryReader stream(std::span<const std::byte>(fx.peer->output).subspan(HANDSHAKE_SIZE));
        CHECK(decode_header(stream).value_or(0) == 2);
    }

    SECTION("Missing local file") {
        std::filesystem::remove(local);
        fx.engine()->run_upload(*task, request(9, 0));

        auto info = task->snapshot();
        REQUIRE(info.status == TaskStatus::failed);
        CHECK(info.error->stage == "open file failed");
        CHECK(info.error->kind() == ErrorKind::filesystem);
        CHECK(fx.peer->output.empty());
    }
}

TEST_CASE("Connection failure", "[engine]") {
    EngineFixture fx;
    auto engine = fx.engine();
    engine->dialer([](const Endpoint&, const ChannelOptions&)
                       -> std::expected<std::unique_ptr<Connection>, std::error_code> {
        return std::unexpected(make_error_code(TransferErrc::connection_failed));
    });

    auto task = fx.tasks.create("a.txt", {}, TransferDirection::download);
    engine->run_download(*task, request(1, 10));

    auto info = task->snapshot();
    REQUIRE(info.status == TaskStatus::failed);
    CHECK(info.error->stage == "connection failed");
    CHECK(info.error->kind() == ErrorKind::protocol);
    REQUIRE(fx.listener.statuses.size() == 1);
    CHECK(fx.listener.statuses[0].status == TaskStatus::failed);
    REQUIRE(fx.listener.statuses[0].error.has_value());
    CHECK(fx.listener.statuses[0].error->stage == "connection failed");
}

TEST_CASE("Concurrent workers", "[engine]") {
    TempDir dir;
    RecordingListener listener;
    TaskManager tasks;
    PeerPool pool{pattern(2048), "f"};

    auto cfg = TransferConfig::defaults();
    cfg.download_dir = dir.path().string();
    TransferEngine engine(ControlLink{{"127.0.0.1", 5500}, false}, cfg);
    engine.listener(&listener);
    engine.dialer(pool.dialer());

    SECTION("Distinct names") {
        std::vector<std::shared_ptr<Task>> started;
        for (int i = 0; i < 4; ++i) {
            auto task = tasks.create("file" + std::to_string(i) + ".bin", {}, TransferDirection::download);
            engine.start_download(task, request(static_cast<std::uint32_t>(i), 0));
            started.push_back(task);
        }
        engine.wait();

        CHECK(engine.running() == 0);
        CHECK(tasks.active().empty());
        CHECK(tasks.completed().size() == 4);
        CHECK(listener.statuses.size() == 4);
        for (const auto& task : started) {
            auto info = task->snapshot();
            CHECK(info.status == TaskStatus::completed);
            CHECK(std::filesystem::file_size(info.local_path) == 2048);
        }
    }

    SECTION("Same name never shares a local file") {
        std::vector<std::shared_ptr<Task>> started;
        for (int i = 0; i < 8; ++i) {
            auto task = tasks.create("same.bin", {}, TransferDirection::download);
            engine.start_download(task, request(static_cast<std::uint32_t>(i), 0));
            started.push_back(task);
        }
        engine.wait();

        std::set<std::string> paths;
        for (const auto& task : started) {
            auto info = task->snapshot();
            REQUIRE(info.status == TaskStatus::completed);
            paths.insert(info.local_path);
            CHECK(read_file(info.local_path) == pool.content);
        }
        CHECK(paths.size() == started.size());
        CHECK(paths.count((dir.path() / "same.bin").string()) == 1);
    }

    SECTION("Finished workers are released without wait()") {
        for (int i = 0; i < 16; ++i) {
            auto task = tasks.create("r" + std::to_string(i), {}, TransferDirection::download);
            engine.start_download(task, request(static_cast<std::uint32_t>(i), 0));

            // Anything left over from earlier transfers was reaped by start_download
            CHECK(engine.running() <= 1);
            REQUIRE(wait_until([&] { return engine.running() == 0; }));
            CHECK(task->status() == TaskStatus::completed);
        }
        CHECK(engine.running() == 0);
        CHECK(tasks.completed(16).size() == 16);
    }
}

TEST_CASE("Control port at the top of the range", "[engine]") {
    EngineFixture fx;
    auto engine = std::make_unique<TransferEngine>(ControlLink{{"127.0.0.1", 65535}, false}, fx.config());
    engine->listener(&fx.listener);
    engine->dialer(memory_dialer(fx.peer));

    auto task = fx.tasks.create("a.txt", {}, TransferDirection::download);
    engine->run_download(*task, request(1, 10));

    auto info = task->snapshot();
    REQUIRE(info.status == TaskStatus::failed);
    CHECK(info.error->stage == "connection failed");
    CHECK(info.error->code == std::errc::invalid_argument);
    CHECK(fx.peer->output.empty());
}
