// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace parcel::core {

enum class Errc {
    success = 0,
    unknown_stage,
    invalid_query_argument,
    malformed_record,
    orphan_download,
    progress_regression,
    invalid_transition,
    size_conflict,
    invalid_request,
    not_found,
    invalid_config,
};

namespace detail {

struct ErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "parcel::core";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<Errc>(ev)) {
            case Errc::success:                return "Success";
            case Errc::unknown_stage:          return "Unknown download stage";
            case Errc::invalid_query_argument: return "Invalid query argument";
            case Errc::malformed_record:       return "Malformed record";
            case Errc::orphan_download:        return "Download has no files";
            case Errc::progress_regression:    return "Progress went backwards";
            case Errc::invalid_transition:     return "Invalid stage transition";
            case Errc::size_conflict:          return "Size conflicts with recorded progress";
            case Errc::invalid_request:        return "Invalid download request";
            case Errc::not_found:              return "Download or file not found";
            case Errc::invalid_config:         return "Invalid configuration";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ErrcCategory& errc_category() noexcept {
    static detail::ErrcCategory category;
    return category;
}

inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), errc_category()};
}

} // namespace parcel::core

namespace std {

template<>
struct is_error_code_enum<parcel::core::Errc> : true_type {};

} // namespace std
