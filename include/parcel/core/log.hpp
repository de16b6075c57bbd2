// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace parcel::core {

constexpr const char* LOGGER_NAME = "parcel";

struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string file;  // empty = stderr only
    std::size_t max_file_size{5 * 1024 * 1024};
    std::size_t max_files{3};
};

// Creates (or replaces) the "parcel" logger
void init_logging(const LogConfig& config);

// The "parcel" logger; a stderr logger is created on first use if
// init_logging() was never called
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace parcel::core
