// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace parcel::store {

enum class StoreErrc {
    success = 0,
    persistence_error,
    open_failed,
    schema_mismatch,
    constraint_violation,
    busy,
};

namespace detail {

struct StoreErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "parcel::store";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::success:              return "Success";
            case StoreErrc::persistence_error:    return "Persistence error";
            case StoreErrc::open_failed:          return "Could not open database";
            case StoreErrc::schema_mismatch:      return "Database schema version mismatch";
            case StoreErrc::constraint_violation: return "Constraint violation";
            case StoreErrc::busy:                 return "Database busy";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StoreErrcCategory& store_errc_category() noexcept {
    static detail::StoreErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_errc_category()};
}

// True for every failure raised by the storage layer
[[nodiscard]] inline bool is_persistence_failure(const std::error_code& ec) noexcept {
    return ec && ec.category() == store_errc_category();
}

} // namespace parcel::store

namespace std {

template<>
struct is_error_code_enum<parcel::store::StoreErrc> : true_type {};

} // namespace std
