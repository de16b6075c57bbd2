// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace parcel::core {

namespace {

std::mutex init_mutex;

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    if (!config.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.max_file_size, config.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }

    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    log->set_level(config.level);
    log->flush_on(spdlog::level::warn);
    return log;
}

} // namespace

void init_logging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(init_mutex);
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(make_logger(config));
}

std::shared_ptr<spdlog::logger> logger() {
    if (auto log = spdlog::get(LOGGER_NAME)) {
        return log;
    }
    std::lock_guard<std::mutex> lock(init_mutex);
    if (auto log = spdlog::get(LOGGER_NAME)) {
        return log;
    }
    auto log = make_logger(LogConfig{.level = spdlog::level::warn});
    spdlog::register_logger(log);
    return log;
}

} // namespace parcel::core
