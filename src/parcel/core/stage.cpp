// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/stage.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <utility>

namespace parcel::core {

namespace {

struct StageEntry {
    StageCode code;
    std::string_view name;
};

constexpr std::array STAGE_TABLE{
    StageEntry{StageCode::queued,              "QUEUED"},
    StageEntry{StageCode::pending,             "PENDING"},
    StageEntry{StageCode::running,             "RUNNING"},
    StageEntry{StageCode::paused_by_app,       "PAUSED_BY_APP"},
    StageEntry{StageCode::waiting_to_retry,    "WAITING_TO_RETRY"},
    StageEntry{StageCode::waiting_for_network, "WAITING_FOR_NETWORK"},
    StageEntry{StageCode::queued_for_wifi,     "QUEUED_FOR_WIFI"},
    StageEntry{StageCode::success,             "SUCCESS"},
    StageEntry{StageCode::bad_request,         "BAD_REQUEST"},
    StageEntry{StageCode::not_acceptable,      "NOT_ACCEPTABLE"},
    StageEntry{StageCode::length_required,     "LENGTH_REQUIRED"},
    StageEntry{StageCode::precondition_failed, "PRECONDITION_FAILED"},
    StageEntry{StageCode::file_already_exists, "FILE_ALREADY_EXISTS"},
    StageEntry{StageCode::cannot_resume,       "CANNOT_RESUME"},
    StageEntry{StageCode::canceled,            "CANCELED"},
    StageEntry{StageCode::unknown_error,       "UNKNOWN_ERROR"},
    StageEntry{StageCode::file_error,          "FILE_ERROR"},
    StageEntry{StageCode::unhandled_redirect,  "UNHANDLED_REDIRECT"},
    StageEntry{StageCode::unhandled_http_code, "UNHANDLED_HTTP_CODE"},
    StageEntry{StageCode::http_data_error,     "HTTP_DATA_ERROR"},
    StageEntry{StageCode::http_exception,      "HTTP_EXCEPTION"},
    StageEntry{StageCode::too_many_redirects,  "TOO_MANY_REDIRECTS"},
    StageEntry{StageCode::insufficient_space,  "INSUFFICIENT_SPACE"},
    StageEntry{StageCode::device_not_found,    "DEVICE_NOT_FOUND"},
};

constexpr std::array<std::pair<FileStatus, std::string_view>, 4> FILE_STATUS_TABLE{{
    {FileStatus::incomplete, "INCOMPLETE"},
    {FileStatus::paused,     "PAUSED"},
    {FileStatus::success,    "SUCCESS"},
    {FileStatus::failed,     "FAILED"},
}};

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::toupper(static_cast<unsigned char>(x)) == std::toupper(static_cast<unsigned char>(y));
    });
}

} // namespace

std::string_view to_string(Status status) noexcept {
    switch (status) {
        case Status::pending:    return "pending";
        case Status::running:    return "running";
        case Status::paused:     return "paused";
        case Status::successful: return "successful";
        case Status::failed:     return "failed";
    }
    return "unknown";
}

std::expected<Status, std::error_code> parse_status(std::string_view name) noexcept {
    for (auto s : {Status::pending, Status::running, Status::paused, Status::successful, Status::failed}) {
        if (to_string(s) == name) {
            return s;
        }
    }
    return std::unexpected(make_error_code(Errc::invalid_query_argument));
}

std::expected<Status, std::error_code> category_of(int code) noexcept {
    switch (static_cast<StageCode>(code)) {
        case StageCode::success:
            return Status::successful;
        case StageCode::paused_by_app:
        case StageCode::waiting_to_retry:
        case StageCode::waiting_for_network:
        case StageCode::queued_for_wifi:
            return Status::paused;
        // A queued download has not been picked up yet; it reports as pending
        case StageCode::queued:
        case StageCode::pending:
            return Status::pending;
        case StageCode::running:
            return Status::running;
        default:
            break;
    }
    if (is_failure_code(code)) {
        return Status::failed;
    }
    return std::unexpected(make_error_code(Errc::unknown_stage));
}

std::expected<Stage, std::error_code> Stage::from_code(int code) noexcept {
    if (!category_of(code)) {
        return std::unexpected(make_error_code(Errc::unknown_stage));
    }
    Stage stage;
    stage.code_ = code;
    return stage;
}

std::expected<Stage, std::error_code> Stage::parse(std::string_view text) noexcept {
    int code = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), code);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
        return from_code(code);
    }

    auto it = std::ranges::find_if(STAGE_TABLE, [&](const StageEntry& entry) {
        return equals_ignore_case(entry.name, text);
    });
    if (it != STAGE_TABLE.end()) {
        return Stage(it->code);
    }
    return std::unexpected(make_error_code(Errc::unknown_stage));
}

std::string Stage::name() const {
    auto it = std::ranges::find(STAGE_TABLE, static_cast<StageCode>(code_), &StageEntry::code);
    if (it != STAGE_TABLE.end()) {
        return std::string(it->name);
    }
    return std::format("FAILED_{}", code_);
}

Status Stage::category() const noexcept {
    // Construction validated the code, so the lookup cannot fail
    return category_of(code_).value_or(Status::failed);
}

std::string_view to_code(FileStatus status) noexcept {
    for (const auto& [value, code] : FILE_STATUS_TABLE) {
        if (value == status) {
            return code;
        }
    }
    return "INCOMPLETE";
}

std::expected<FileStatus, std::error_code> file_status_from_code(std::string_view code) noexcept {
    for (const auto& [value, name] : FILE_STATUS_TABLE) {
        if (name == code) {
            return value;
        }
    }
    return std::unexpected(make_error_code(Errc::malformed_record));
}

} // namespace parcel::core
