// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/error.hpp>
#include <parcel/core/log.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace parcel::core {

constexpr std::uint32_t DEFAULT_MAX_RETRY_ATTEMPTS = 5;
constexpr std::string_view DEFAULT_DATABASE_PATH = "parcel.db";
constexpr std::string_view DEFAULT_ORDER_COLUMN = "last_modified";
constexpr std::string_view DEFAULT_ORDER_DIRECTION = "desc";

struct Config {
    std::string database{DEFAULT_DATABASE_PATH};
    LogConfig log;
    std::uint32_t max_retry_attempts{DEFAULT_MAX_RETRY_ATTEMPTS};

    // Defaults for list queries
    std::string order_column{DEFAULT_ORDER_COLUMN};
    std::string order_direction{DEFAULT_ORDER_DIRECTION};
    bool only_visible{false};

    // JSON text; unknown keys are ignored, wrong types are Errc::invalid_config
    [[nodiscard]] static std::expected<Config, std::error_code> parse(std::string_view json) noexcept;

    // Errc::not_found if the file cannot be read
    [[nodiscard]] static std::expected<Config, std::error_code> load(const std::string& path) noexcept;
};

} // namespace parcel::core
