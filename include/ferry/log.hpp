// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace ferry::log {

constexpr const char* LOGGER_NAME = "ferry";

// Create the "ferry" logger: colour sink on stderr plus an optional
// rotating file sink when `file_path` is not empty. Replaces any
// previously registered logger of the same name.
void init(spdlog::level::level_enum level, const std::string& file_path = {});

// Logger used by library code. Silent (null sink) until init() runs.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

} // namespace ferry::log
