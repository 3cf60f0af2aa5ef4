// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/transfer_engine.hpp>
#include <ferry/core/flat_file.hpp>
#include <ferry/core/progress.hpp>
#include <ferry/disk/local_file.hpp>
#include <ferry/disk/paths.hpp>
#include <ferry/disk/sidecar.hpp>
#include <ferry/log.hpp>
#include <filesystem>
#include <limits>
#include <new>

namespace ferry::core {

namespace {

// Larger INFO payloads are skipped rather than buffered
constexpr std::size_t MAX_INFO_PAYLOAD = INFO_FORK_FIXED_SIZE + MAX_FILE_NAME_SIZE + 0xFFFF;

std::unexpected<TaskError> stage_error(const char* stage, std::error_code ec) {
    return std::unexpected(TaskError{stage, ec});
}

std::string_view fork_name(ForkType type) noexcept {
    switch (type) {
        case ForkType::info:     return "info";
        case ForkType::data:     return "data";
        case ForkType::resource: return "resource";
        default:                 return "unknown";
    }
}

} // namespace

//=============================================================================
// TransferEngine
//=============================================================================

TransferEngine::TransferEngine(ControlLink link, TransferConfig config)
    : link_(std::move(link))
    , config_(std::move(config))
    , dialer_(&TransferChannel::open) {}

TransferEngine::~TransferEngine() {
    wait();
}

void TransferEngine::start_download(std::shared_ptr<Task> task, TransferRequest request) {
    spawn([this, task = std::move(task), request] {
        run_download(*task, request);
    });
}

void TransferEngine::start_upload(std::shared_ptr<Task> task, TransferRequest request) {
    spawn([this, task = std::move(task), request] {
        run_upload(*task, request);
    });
}

std::size_t TransferEngine::running() {
    std::lock_guard lock(workers_mutex_);
    reap_finished();
    return workers_.size();
}

void TransferEngine::wait() noexcept {
    std::vector<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void TransferEngine::spawn(std::function<void()> body) {
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard lock(workers_mutex_);
    reap_finished();
    workers_.push_back({std::jthread([body = std::move(body), done] {
                            body();
                            done->store(true, std::memory_order_release);
                        }),
                        done});
}

void TransferEngine::reap_finished() noexcept {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferEngine::run_download(Task& task, const TransferRequest& request) noexcept {
    auto id = task.id();
    if (auto ec = task.activate()) {
        log::get()->error("Task {}: cannot start download: {}", id, ec.message());
        return;
    }

    StageResult result;
    try {
        result = download(task, id, request);
    } catch (const std::bad_alloc&) {
        result = stage_error("download failed", std::make_error_code(std::errc::not_enough_memory));
    } catch (const std::filesystem::filesystem_error& e) {
        log::get()->error("Task {}: download aborted: {}", id, e.what());
        result = stage_error("download failed", e.code());
    }
    finish(task, id, std::move(result));
}

void TransferEngine::run_upload(Task& task, const TransferRequest& request) noexcept {
    auto id = task.id();
    if (auto ec = task.activate()) {
        log::get()->error("Task {}: cannot start upload: {}", id, ec.message());
        return;
    }

    StageResult result;
    try {
        result = upload(task, id, request);
    } catch (const std::bad_alloc&) {
        result = stage_error("upload failed", std::make_error_code(std::errc::not_enough_memory));
    } catch (const std::filesystem::filesystem_error& e) {
        log::get()->error("Task {}: upload aborted: {}", id, e.what());
        result = stage_error("upload failed", e.code());
    }
    finish(task, id, std::move(result));
}

std::expected<std::unique_ptr<Connection>, std::error_code> TransferEngine::dial() const {
    auto endpoint = transfer_endpoint(link_.endpoint);
    if (!endpoint) {
        log::get()->error("No transfer port for control endpoint {}", link_.endpoint.to_string());
        return std::unexpected(endpoint.error());
    }
    log::get()->info("Connecting to file transfer server {}{}", endpoint->to_string(), link_.tls ? " (TLS)" : "");
    return dialer_(*endpoint, config_.channel_options(link_.tls));
}

ProgressCallback TransferEngine::progress_sink(Task& task, std::uint32_t id) const {
    return [this, &task, id](std::uint64_t bytes) {
        if (auto ec = task.record_progress(bytes)) {
            log::get()->debug("Task {}: progress {} not recorded: {}", id, bytes, ec.message());
            return;
        }
        if (listener_) {
            listener_->on_progress(id, bytes);
        }
    };
}

void TransferEngine::finish(Task& task, std::uint32_t id, StageResult result) noexcept {
    std::error_code ec;
    if (result) {
        ec = task.complete();
    } else {
        log::get()->error("Task {}: {}", id, result.error().message());
        ec = task.fail(result.error());
    }

    if (ec) {
        log::get()->error("Task {}: {}", id, ec.message());
        return;
    }

    auto info = task.snapshot();
    log::get()->info("Task {} {}: {}", id, to_string(info.status), info.file_name);
    if (listener_) {
        listener_->on_status(id, info.status, info.error);
    }
}

//=============================================================================
// Download
//=============================================================================

TransferEngine::StageResult
TransferEngine::download(Task& task, std::uint32_t id, const TransferRequest& request) {
    auto info = task.snapshot();

    auto conn = dial();
    if (!conn) {
        return stage_error("connection failed", conn.error());
    }
    auto& connection = **conn;

    log::get()->info("Task {}: sending handshake, transfer size {}", id, request.transfer_size);
    if (auto ec = TransferChannel::handshake(connection, request.ref, request.transfer_size)) {
        return stage_error("handshake failed", ec);
    }

    std::filesystem::path dir = config_.download_dir;
    if (auto ec = disk::ensure_directory(dir)) {
        return stage_error("mkdir failed", ec);
    }

    disk::FileWriter file;
    auto local_path = disk::create_download_file(dir, info.file_name, file);
    if (!local_path) {
        return stage_error("create file failed", local_path.error());
    }
    task.set_local_path(local_path->string());
    log::get()->info("Task {}: downloading to {}", id, local_path->string());

    auto fork_count = decode_header(connection);
    if (!fork_count) {
        return stage_error("read header failed", fork_count.error());
    }
    log::get()->info("Task {}: {} forks", id, *fork_count);

    bool data_done = false;

    // Once the data fork is on disk a fork error only ends the transfer early
    auto fork_failure = [&](const char* stage, std::error_code ec) -> StageResult {
        if (data_done) {
            log::get()->warn("Task {}: {} after data fork: {}", id, stage, ec.message());
            return {};
        }
        return stage_error(stage, ec);
    };

    for (std::uint16_t index = 0; index < *fork_count; ++index) {
        auto header = decode_fork_header(connection);
        if (!header) {
            return fork_failure(index == 0 ? "read info fork header failed" : "read data fork header failed",
                                header.error());
        }
        log::get()->info("Task {}: {} fork, {} bytes", id, fork_name(header->type), header->data_size);

        switch (header->type) {
            case ForkType::info: {
                if (header->data_size > MAX_INFO_PAYLOAD) {
                    if (auto ec = discard(connection, header->data_size)) {
                        return fork_failure("read info fork failed", ec);
                    }
                    break;
                }

                std::vector<std::byte> payload(header->data_size);
                if (auto ec = read_exact(connection, payload, TransferErrc::truncated_fork)) {
                    return fork_failure("read info fork failed", ec);
                }

                // Contents are informational only
                if (auto decoded = decode_info_fork(payload)) {
                    log::get()->debug("Task {}: info fork name '{}' type '{}' creator '{}'", id,
                                      decoded->name, decoded->type_code, decoded->creator_code);
                } else {
                    log::get()->warn("Task {}: malformed info fork: {}", id, decoded.error().message());
                }
                break;
            }

            case ForkType::data: {
                if (data_done) {
                    log::get()->warn("Task {}: duplicate data fork ignored", id);
                    if (auto ec = discard(connection, header->data_size)) {
                        return fork_failure("read data fork failed", ec);
                    }
                    break;
                }

                task.set_total_bytes(header->data_size);
                auto copied = copy_with_progress(file, connection, header->data_size,
                                                 progress_sink(task, id), config_.copy_options());
                if (!copied) {
                    return stage_error("data transfer failed", copied.error());
                }
                file.close();
                data_done = true;
                break;
            }

            case ForkType::resource: {
                if (auto ec = disk::write_sidecar(*local_path, connection, header->data_size)) {
                    return fork_failure("resource fork transfer failed", ec);
                }
                log::get()->info("Task {}: resource fork saved to {}", id,
                                 disk::sidecar_path(*local_path).string());
                break;
            }

            default:
                log::get()->warn("Task {}: skipping unknown fork '{}'", id, header->tag_view());
                if (auto ec = discard(connection, header->data_size)) {
                    return fork_failure("read fork failed", ec);
                }
                break;
        }
    }

    if (!data_done) {
        return stage_error("read data fork header failed", make_error_code(TransferErrc::truncated_fork));
    }

    log::get()->info("Task {}: download completed: {}", id, local_path->string());
    return {};
}

//=============================================================================
// Upload
//=============================================================================

TransferEngine::StageResult
TransferEngine::upload(Task& task, std::uint32_t id, const TransferRequest& request) {
    auto info = task.snapshot();
    std::filesystem::path local_path = info.local_path;

    disk::FileReader file;
    if (auto ec = file.open(local_path)) {
        return stage_error("open file failed", ec);
    }

    constexpr std::uint64_t max_size = std::numeric_limits<std::uint32_t>::max();
    if (file.size() > max_size) {
        return stage_error("stat file failed", make_error_code(TransferErrc::size_mismatch));
    }
    auto data_size = static_cast<std::uint32_t>(file.size());

    auto info_fork = encode_info_fork(info.file_name, file.modification_time());

    // A broken sidecar only costs the resource fork
    std::optional<disk::SidecarSource> resource;
    if (auto sidecar = disk::open_sidecar(local_path)) {
        resource = std::move(*sidecar);
    } else {
        log::get()->warn("Task {}: ignoring sidecar {}: {}", id,
                         disk::sidecar_path(local_path).string(), sidecar.error().message());
    }

    std::uint64_t total = FLAT_FILE_HEADER_SIZE + info_fork.size() + FORK_HEADER_SIZE + data_size;
    if (resource) {
        total += FORK_HEADER_SIZE + resource->size;
    }
    if (total > max_size) {
        return stage_error("stat file failed", make_error_code(TransferErrc::size_mismatch));
    }

    task.set_total_bytes(data_size);

    auto conn = dial();
    if (!conn) {
        return stage_error("connection failed", conn.error());
    }
    auto& connection = **conn;

    log::get()->info("Task {}: sending handshake, transfer size {}", id, total);
    if (auto ec = TransferChannel::handshake(connection, request.ref, static_cast<std::uint32_t>(total))) {
        return stage_error("handshake failed", ec);
    }

    auto header = encode_header(resource ? 3 : 2);
    if (auto ec = connection.write(header)) {
        return stage_error("write header failed", ec);
    }

    if (auto ec = connection.write(info_fork)) {
        return stage_error("write info fork failed", ec);
    }

    auto data_header = encode_fork_header(ForkType::data, data_size);
    if (auto ec = connection.write(data_header)) {
        return stage_error("write data fork header failed", ec);
    }

    log::get()->info("Task {}: uploading {} ({} bytes)", id, local_path.string(), data_size);
    auto copied = copy_with_progress(connection, file, data_size, progress_sink(task, id), config_.copy_options());
    if (!copied) {
        return stage_error("data transfer failed", copied.error());
    }
    if (*copied != data_size) {
        // Local file shrank while uploading
        return stage_error("data transfer failed", make_error_code(TransferErrc::size_mismatch));
    }

    if (resource) {
        auto resource_header = encode_fork_header(ForkType::resource, resource->size);
        if (auto ec = connection.write(resource_header)) {
            return stage_error("write resource fork header failed", ec);
        }
        if (auto ec = copy_exact(connection, resource->reader, resource->size)) {
            return stage_error("resource fork transfer failed", ec);
        }
        log::get()->info("Task {}: resource fork uploaded, {} bytes", id, resource->size);
    }

    log::get()->info("Task {}: upload completed: {}", id, local_path.string());
    return {};
}

} // namespace ferry::core
