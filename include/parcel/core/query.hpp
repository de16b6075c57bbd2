// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/download.hpp>
#include <parcel/core/error.hpp>
#include <parcel/core/stage.hpp>
#include <parcel/store/gateway.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parcel::core {

enum class OrderColumn : std::uint8_t {
    last_modified,
    total_size,
};

enum class OrderDirection : std::uint8_t {
    ascending = 1,
    descending = 2,
};

// Selection and ordering ready to hand to store::Gateway::query
struct CompiledQuery {
    store::Selection selection;
    std::string order_by;
};

// Filter over downloads. Every axis is optional; an unset axis does not
// constrain the result. Axes are ANDed, values within one axis are ORed.
// An axis given an empty value set (no ids, no recognized status bits)
// matches no download at all.
class Query {
public:
    Query& filter_by_id(std::vector<DownloadId> ids);
    Query& filter_by_batch_id(std::vector<BatchId> batch_ids);

    // Matches a download whose extra equals any of the given tags
    Query& filter_by_extras(std::vector<std::string> extras);

    // Any combination of Status flags
    Query& filter_by_status(StatusMask flags);

    // Only downloads marked visible in the UI
    Query& only_include_visible(bool value = true);

    // Rejects values outside the enumerations with Errc::invalid_query_argument
    // and leaves the current ordering untouched
    [[nodiscard]] std::error_code order_by(OrderColumn column, OrderDirection direction) noexcept;

    // column: "last_modified" | "total_size", direction: "asc" | "desc"
    [[nodiscard]] std::error_code order_by(std::string_view column, std::string_view direction) noexcept;

    [[nodiscard]] std::expected<CompiledQuery, std::error_code> build() const;

    [[nodiscard]] OrderColumn order_column() const noexcept { return order_column_; }
    [[nodiscard]] OrderDirection order_direction() const noexcept { return order_direction_; }

private:
    std::optional<std::vector<DownloadId>> ids_;
    std::optional<std::vector<BatchId>> batch_ids_;
    std::optional<std::vector<std::string>> extras_;
    std::optional<StatusMask> status_flags_;
    bool only_visible_{false};
    OrderColumn order_column_{OrderColumn::last_modified};
    OrderDirection order_direction_{OrderDirection::descending};
};

} // namespace parcel::core
