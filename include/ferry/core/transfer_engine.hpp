// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <ferry/core/task.hpp>
#include <ferry/core/transfer_channel.hpp>
#include <ferry/core/transfer_config.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace ferry::core {

// The control connection a transfer belongs to
struct ControlLink {
    Endpoint endpoint;      // Control port; transfers go to port + 1
    bool tls{false};
};

// Control channel reply authorizing one transfer
struct TransferRequest {
    RefNum ref{};
    std::uint32_t transfer_size{0};     // Declared by the server; uploads compute their own
};

// Progress and terminal status notifications. Called from worker threads.
class TransferListener {
public:
    virtual ~TransferListener() = default;

    virtual void on_progress(std::uint32_t /*task_id*/, std::uint64_t /*bytes*/) {}

    // Exactly once per task, on completion or failure
    virtual void on_status(std::uint32_t /*task_id*/,
                           TaskStatus /*status*/,
                           const std::optional<TaskError>& /*error*/) {}
};

// Opens the transfer connection. Replaceable so tests can use an in-memory peer.
using Dialer = std::function<std::expected<std::unique_ptr<Connection>, std::error_code>(
    const Endpoint&, const ChannelOptions&)>;

// Runs downloads and uploads over the transfer port, one worker per task
class TransferEngine {
public:
    TransferEngine(ControlLink link, TransferConfig config);
    ~TransferEngine();

    // Non-copyable, non-movable (owns worker threads)
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Set before starting transfers
    void listener(TransferListener* listener) noexcept { listener_ = listener; }
    void dialer(Dialer dialer) { dialer_ = std::move(dialer); }

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

    // Spawn a worker and return immediately
    void start_download(std::shared_ptr<Task> task, TransferRequest request);
    void start_upload(std::shared_ptr<Task> task, TransferRequest request);

    // Worker bodies, callable synchronously. Leave the task completed or failed.
    void run_download(Task& task, const TransferRequest& request) noexcept;
    void run_upload(Task& task, const TransferRequest& request) noexcept;

    // Workers still running. Finished ones are joined and dropped here and
    // whenever a new transfer starts.
    [[nodiscard]] std::size_t running();

    // Join every worker started so far
    void wait() noexcept;

private:
    using StageResult = std::expected<void, TaskError>;

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;    // Set as the body returns
    };

    void spawn(std::function<void()> body);

    // Requires workers_mutex_
    void reap_finished() noexcept;

    [[nodiscard]] StageResult download(Task& task, std::uint32_t id, const TransferRequest& request);
    [[nodiscard]] StageResult upload(Task& task, std::uint32_t id, const TransferRequest& request);

    [[nodiscard]] std::expected<std::unique_ptr<Connection>, std::error_code> dial() const;

    // Record progress on the task and forward it to the listener
    [[nodiscard]] ProgressCallback progress_sink(Task& task, std::uint32_t id) const;

    // Apply the terminal transition and notify the listener once
    void finish(Task& task, std::uint32_t id, StageResult result) noexcept;

    ControlLink link_;
    TransferConfig config_;
    TransferListener* listener_{nullptr};
    Dialer dialer_;

    std::vector<Worker> workers_;
    std::mutex workers_mutex_;
};

} // namespace ferry::core
