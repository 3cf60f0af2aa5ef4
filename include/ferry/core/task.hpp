// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::core {

// Task lifecycle: pending -> active -> completed | failed
enum class TaskStatus : std::uint8_t {
    pending,     // Waiting for the control channel reply
    active,      // Worker running
    completed,   // All forks transferred
    failed       // Error attached
};

enum class TransferDirection : std::uint8_t {
    download,
    upload
};

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::string_view to_string(TransferDirection direction) noexcept;

// Consistent copy of a task's fields
struct TaskInfo {
    std::uint32_t id{0};
    std::string file_name;
    std::vector<std::string> file_path;     // Remote folder segments
    TransferDirection direction{TransferDirection::download};
    TaskStatus status{TaskStatus::pending};

    std::uint64_t total_bytes{0};
    std::uint64_t transferred_bytes{0};
    std::uint64_t speed_bps{0};
    std::uint64_t last_bytes{0};

    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::steady_clock::time_point last_update;

    std::optional<TaskError> error;         // Present iff failed
    std::string local_path;

    [[nodiscard]] bool finished() const noexcept {
        return status == TaskStatus::completed || status == TaskStatus::failed;
    }

    [[nodiscard]] double percent() const noexcept {
        return total_bytes > 0 ? static_cast<double>(transferred_bytes) * 100.0 / static_cast<double>(total_bytes) : 0.0;
    }

    // Remaining bytes / speed, 0 when speed is unknown
    [[nodiscard]] std::uint64_t eta_seconds() const noexcept;
};

// One transfer attempt. The worker running it is the only writer; any thread
// may take snapshots.
class Task {
public:
    Task(std::string file_name, std::vector<std::string> file_path, TransferDirection direction);

    // Non-copyable, non-movable (owns a mutex)
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] std::uint32_t id() const noexcept;
    [[nodiscard]] TaskStatus status() const noexcept;
    [[nodiscard]] TaskInfo snapshot() const;

    // Status transitions. Out-of-order calls return invalid_transition and
    // leave the task unchanged.
    [[nodiscard]] std::error_code activate(
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) noexcept;
    [[nodiscard]] std::error_code complete() noexcept;
    [[nodiscard]] std::error_code fail(TaskError error) noexcept;

    // Cumulative byte count from the progress reporter; recomputes speed
    [[nodiscard]] std::error_code record_progress(
        std::uint64_t bytes,
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) noexcept;

    void set_total_bytes(std::uint64_t total) noexcept;
    void set_local_path(std::string path);

private:
    friend class TaskManager;

    mutable std::mutex mutex_;
    TaskInfo info_;
};

// Registry of every task created during the session. Tasks are never removed.
class TaskManager {
public:
    TaskManager() = default;

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Register under a fresh ID, returns that ID
    std::uint32_t add(std::shared_ptr<Task> task);

    // Convenience: construct and register
    [[nodiscard]] std::shared_ptr<Task> create(std::string file_name,
                                               std::vector<std::string> file_path,
                                               TransferDirection direction);

    // nullptr when no task has this ID
    [[nodiscard]] std::shared_ptr<Task> get(std::uint32_t id) const;

    // Pending and active tasks, oldest first
    [[nodiscard]] std::vector<TaskInfo> active() const;

    // Completed and failed tasks, newest first, at most `limit`
    [[nodiscard]] std::vector<TaskInfo> completed(std::size_t limit = RECENT_TASK_LIMIT) const;

    [[nodiscard]] std::size_t size() const;

private:
    std::map<std::uint32_t, std::shared_ptr<Task>> tasks_;
    std::vector<std::uint32_t> order_;
    std::uint32_t next_id_{1};
    mutable std::mutex mutex_;
};

} // namespace ferry::core
