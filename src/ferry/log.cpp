// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/log.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace ferry::log {

namespace {

constexpr std::size_t LOG_FILE_MAX_SIZE = 5 * 1024 * 1024;     // 5 MB
constexpr std::size_t LOG_FILE_COUNT = 3;

std::mutex g_logger_mutex;

} // namespace

void init(spdlog::level::level_enum level, const std::string& file_path) {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout belongs to the progress bar
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    if (!file_path.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path, LOG_FILE_MAX_SIZE, LOG_FILE_COUNT);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    std::lock_guard lock(g_logger_mutex);
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard lock(g_logger_mutex);
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        return logger;
    }

    auto logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace ferry::log
