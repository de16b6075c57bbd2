// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <format>
#include <string_view>

namespace parcel {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 3;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }
} version;

// Bumped whenever the database layout changes (PRAGMA user_version)
constexpr int SCHEMA_VERSION = 1;

// Bumped whenever a persisted stage or file status code changes meaning
constexpr int STAGE_CODES_VERSION = 1;

} // namespace parcel
