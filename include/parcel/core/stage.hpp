// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace parcel::core {

// Public status categories. Values are bit flags so callers can OR them
// together when filtering.
enum class Status : std::uint32_t {
    pending    = 1u << 0,
    running    = 1u << 1,
    paused     = 1u << 2,
    successful = 1u << 3,
    failed     = 1u << 4,
};

using StatusMask = std::uint32_t;

constexpr StatusMask STATUS_ALL = 0x1f;

[[nodiscard]] constexpr StatusMask mask_of(Status s) noexcept {
    return static_cast<StatusMask>(s);
}

[[nodiscard]] constexpr StatusMask operator|(Status a, Status b) noexcept {
    return mask_of(a) | mask_of(b);
}

[[nodiscard]] constexpr StatusMask operator|(StatusMask a, Status b) noexcept {
    return a | mask_of(b);
}

[[nodiscard]] std::string_view to_string(Status status) noexcept;
[[nodiscard]] std::expected<Status, std::error_code> parse_status(std::string_view name) noexcept;

// Persisted stage codes. These numbers are stored in the database and must
// never be renumbered; bump STAGE_CODES_VERSION if a meaning changes.
enum class StageCode : int {
    queued              = 189,
    pending             = 190,
    running             = 192,
    paused_by_app       = 193,
    waiting_to_retry    = 194,
    waiting_for_network = 195,
    queued_for_wifi     = 196,
    success             = 200,

    bad_request         = 400,
    not_acceptable      = 406,
    length_required     = 411,
    precondition_failed = 412,
    file_already_exists = 488,
    cannot_resume       = 489,
    canceled            = 490,
    unknown_error       = 491,
    file_error          = 492,
    unhandled_redirect  = 493,
    unhandled_http_code = 494,
    http_data_error     = 495,
    http_exception      = 496,
    too_many_redirects  = 497,
    insufficient_space  = 498,
    device_not_found    = 499,
};

constexpr int MIN_FAILURE_CODE = 400;
constexpr int MAX_FAILURE_CODE = 600;  // exclusive

[[nodiscard]] constexpr bool is_failure_code(int code) noexcept {
    return code >= MIN_FAILURE_CODE && code < MAX_FAILURE_CODE;
}

// Maps a raw persisted stage code to its public category.
// Codes outside the stage table and the failure range are Errc::unknown_stage.
[[nodiscard]] std::expected<Status, std::error_code> category_of(int code) noexcept;

// A validated stage value
class Stage {
public:
    constexpr Stage() noexcept = default;
    // Enumerators only; raw codes go through from_code()
    constexpr explicit Stage(StageCode code) noexcept : code_(static_cast<int>(code)) {}

    [[nodiscard]] static std::expected<Stage, std::error_code> from_code(int code) noexcept;

    // Accepts either the symbolic name ("WAITING_FOR_NETWORK") or the number
    [[nodiscard]] static std::expected<Stage, std::error_code> parse(std::string_view text) noexcept;

    [[nodiscard]] constexpr int code() const noexcept { return code_; }
    [[nodiscard]] std::string name() const;

    [[nodiscard]] Status category() const noexcept;

    [[nodiscard]] constexpr bool is_failure() const noexcept { return is_failure_code(code_); }
    [[nodiscard]] constexpr bool is_success() const noexcept {
        return code_ == static_cast<int>(StageCode::success);
    }
    [[nodiscard]] constexpr bool is_terminal() const noexcept { return is_success() || is_failure(); }
    [[nodiscard]] bool is_paused() const noexcept { return category() == Status::paused; }

    constexpr bool operator==(const Stage&) const noexcept = default;

private:
    int code_{static_cast<int>(StageCode::queued)};
};

// Per-file status
enum class FileStatus : std::uint8_t {
    incomplete,
    paused,
    success,
    failed,
};

[[nodiscard]] constexpr bool is_terminal(FileStatus status) noexcept {
    return status == FileStatus::success || status == FileStatus::failed;
}

// Stable persisted codes ("INCOMPLETE", "PAUSED", ...)
[[nodiscard]] std::string_view to_code(FileStatus status) noexcept;
[[nodiscard]] std::expected<FileStatus, std::error_code> file_status_from_code(std::string_view code) noexcept;

} // namespace parcel::core
