// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/task.hpp>
#include <utility>

namespace ferry::core {

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::pending:   return "Pending";
        case TaskStatus::active:    return "Active";
        case TaskStatus::completed: return "Completed";
        case TaskStatus::failed:    return "Failed";
        default:                    return "Unknown";
    }
}

std::string_view to_string(TransferDirection direction) noexcept {
    return direction == TransferDirection::download ? "download" : "upload";
}

std::uint64_t TaskInfo::eta_seconds() const noexcept {
    if (speed_bps == 0 || transferred_bytes >= total_bytes) {
        return 0;
    }
    return (total_bytes - transferred_bytes) / speed_bps;
}

//=============================================================================
// Task
//=============================================================================

Task::Task(std::string file_name, std::vector<std::string> file_path, TransferDirection direction) {
    info_.file_name = std::move(file_name);
    info_.file_path = std::move(file_path);
    info_.direction = direction;
}

std::uint32_t Task::id() const noexcept {
    std::lock_guard lock(mutex_);
    return info_.id;
}

TaskStatus Task::status() const noexcept {
    std::lock_guard lock(mutex_);
    return info_.status;
}

TaskInfo Task::snapshot() const {
    std::lock_guard lock(mutex_);
    return info_;
}

std::error_code Task::activate(std::chrono::steady_clock::time_point now) noexcept {
    std::lock_guard lock(mutex_);
    if (info_.status != TaskStatus::pending) {
        return make_error_code(TransferErrc::invalid_transition);
    }
    info_.status = TaskStatus::active;
    info_.start_time = std::chrono::system_clock::now();
    info_.last_update = now;
    info_.last_bytes = info_.transferred_bytes;
    return {};
}

std::error_code Task::complete() noexcept {
    std::lock_guard lock(mutex_);
    if (info_.status != TaskStatus::active) {
        return make_error_code(TransferErrc::invalid_transition);
    }
    info_.status = TaskStatus::completed;
    info_.end_time = std::chrono::system_clock::now();
    info_.speed_bps = 0;
    return {};
}

std::error_code Task::fail(TaskError error) noexcept {
    std::lock_guard lock(mutex_);
    if (info_.status != TaskStatus::active) {
        return make_error_code(TransferErrc::invalid_transition);
    }
    info_.status = TaskStatus::failed;
    info_.end_time = std::chrono::system_clock::now();
    info_.speed_bps = 0;
    info_.error = std::move(error);
    return {};
}

std::error_code Task::record_progress(std::uint64_t bytes, std::chrono::steady_clock::time_point now) noexcept {
    std::lock_guard lock(mutex_);
    if (info_.status != TaskStatus::active) {
        return make_error_code(TransferErrc::invalid_transition);
    }
    if (info_.total_bytes > 0 && bytes > info_.total_bytes) {
        return make_error_code(TransferErrc::size_mismatch);
    }
    // Progress never goes backwards
    if (bytes < info_.transferred_bytes) {
        return {};
    }

    info_.transferred_bytes = bytes;

    auto elapsed = std::chrono::duration<double>(now - info_.last_update).count();
    if (elapsed > 0.0) {
        auto delta = bytes - info_.last_bytes;
        info_.speed_bps = static_cast<std::uint64_t>(static_cast<double>(delta) / elapsed);
        info_.last_bytes = bytes;
        info_.last_update = now;
    }
    return {};
}

void Task::set_total_bytes(std::uint64_t total) noexcept {
    std::lock_guard lock(mutex_);
    info_.total_bytes = total;
}

void Task::set_local_path(std::string path) {
    std::lock_guard lock(mutex_);
    info_.local_path = std::move(path);
}

//=============================================================================
// TaskManager
//=============================================================================

std::uint32_t TaskManager::add(std::shared_ptr<Task> task) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    {
        std::lock_guard task_lock(task->mutex_);
        task->info_.id = id;
    }
    tasks_.emplace(id, std::move(task));
    order_.push_back(id);
    return id;
}

std::shared_ptr<Task> TaskManager::create(std::string file_name,
                                          std::vector<std::string> file_path,
                                          TransferDirection direction) {
    auto task = std::make_shared<Task>(std::move(file_name), std::move(file_path), direction);
    add(task);
    return task;
}

std::shared_ptr<Task> TaskManager::get(std::uint32_t id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<TaskInfo> TaskManager::active() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskInfo> result;
    for (auto id : order_) {
        auto info = tasks_.at(id)->snapshot();
        if (!info.finished()) {
            result.push_back(std::move(info));
        }
    }
    return result;
}

std::vector<TaskInfo> TaskManager::completed(std::size_t limit) const {
    std::lock_guard lock(mutex_);
    std::vector<TaskInfo> result;
    for (auto it = order_.rbegin(); it != order_.rend() && result.size() < limit; ++it) {
        auto info = tasks_.at(*it)->snapshot();
        if (info.finished()) {
            result.push_back(std::move(info));
        }
    }
    return result;
}

std::size_t TaskManager::size() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

} // namespace ferry::core
