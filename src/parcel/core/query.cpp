// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/query.hpp>
#include <parcel/core/log.hpp>
#include <parcel/store/schema.hpp>
#include <format>
#include <utility>

namespace parcel::core {

namespace col = store::columns;

namespace {

// Fragment for an axis that was given nothing to match
constexpr std::string_view MATCH_NOTHING = "0";

bool valid(OrderColumn column) noexcept {
    return column == OrderColumn::last_modified || column == OrderColumn::total_size;
}

bool valid(OrderDirection direction) noexcept {
    return direction == OrderDirection::ascending || direction == OrderDirection::descending;
}

std::string_view column_name(OrderColumn column) noexcept {
    return column == OrderColumn::total_size ? col::TOTAL_SIZE : col::LAST_MODIFIED;
}

// "<column> IN (?, ?, ...)" with one bound value per element
template<typename T, typename Bind>
void in_clause(std::string_view column, const std::vector<T>& values, Bind bind,
               std::vector<std::string>& parts, std::vector<store::Value>& params) {
    if (values.empty()) {
        parts.emplace_back(MATCH_NOTHING);
        return;
    }
    std::string clause = std::format("{} IN (", column);
    for (std::size_t i = 0; i < values.size(); ++i) {
        clause += i == 0 ? "?" : ", ?";
        params.push_back(bind(values[i]));
    }
    clause += ')';
    parts.push_back(std::move(clause));
}

std::string join(std::string_view joiner, const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out += joiner;
        }
        out += '(';
        out += part;
        out += ')';
    }
    return out;
}

void stage_equals(StageCode code, std::vector<std::string>& parts, std::vector<store::Value>& params) {
    parts.push_back(std::format("{} = ?", col::STAGE));
    params.emplace_back(static_cast<std::int64_t>(code));
}

void status_clause(StatusMask flags, std::vector<std::string>& parts, std::vector<store::Value>& params) {
    std::vector<std::string> any;

    if (flags & mask_of(Status::pending)) {
        stage_equals(StageCode::queued, any, params);
        stage_equals(StageCode::pending, any, params);
    }
    if (flags & mask_of(Status::running)) {
        stage_equals(StageCode::running, any, params);
    }
    if (flags & mask_of(Status::paused)) {
        stage_equals(StageCode::paused_by_app, any, params);
        stage_equals(StageCode::waiting_to_retry, any, params);
        stage_equals(StageCode::waiting_for_network, any, params);
        stage_equals(StageCode::queued_for_wifi, any, params);
    }
    if (flags & mask_of(Status::successful)) {
        stage_equals(StageCode::success, any, params);
    }
    if (flags & mask_of(Status::failed)) {
        any.push_back(std::format("{0} >= ? AND {0} < ?", col::STAGE));
        params.emplace_back(static_cast<std::int64_t>(MIN_FAILURE_CODE));
        params.emplace_back(static_cast<std::int64_t>(MAX_FAILURE_CODE));
    }

    if (any.empty()) {
        parts.emplace_back(MATCH_NOTHING);
        return;
    }
    parts.push_back(join(" OR ", any));
}

} // namespace

Query& Query::filter_by_id(std::vector<DownloadId> ids) {
    ids_ = std::move(ids);
    return *this;
}

Query& Query::filter_by_batch_id(std::vector<BatchId> batch_ids) {
    batch_ids_ = std::move(batch_ids);
    return *this;
}

Query& Query::filter_by_extras(std::vector<std::string> extras) {
    extras_ = std::move(extras);
    return *this;
}

Query& Query::filter_by_status(StatusMask flags) {
    status_flags_ = flags;
    return *this;
}

Query& Query::only_include_visible(bool value) {
    only_visible_ = value;
    return *this;
}

std::error_code Query::order_by(OrderColumn column, OrderDirection direction) noexcept {
    if (!valid(column) || !valid(direction)) {
        return make_error_code(Errc::invalid_query_argument);
    }
    order_column_ = column;
    order_direction_ = direction;
    return {};
}

std::error_code Query::order_by(std::string_view column, std::string_view direction) noexcept {
    OrderColumn parsed_column;
    if (column == "last_modified") {
        parsed_column = OrderColumn::last_modified;
    } else if (column == "total_size") {
        parsed_column = OrderColumn::total_size;
    } else {
        return make_error_code(Errc::invalid_query_argument);
    }

    OrderDirection parsed_direction;
    if (direction == "asc") {
        parsed_direction = OrderDirection::ascending;
    } else if (direction == "desc") {
        parsed_direction = OrderDirection::descending;
    } else {
        return make_error_code(Errc::invalid_query_argument);
    }

    return order_by(parsed_column, parsed_direction);
}

std::expected<CompiledQuery, std::error_code> Query::build() const {
    if (!valid(order_column_) || !valid(order_direction_)) {
        return std::unexpected(make_error_code(Errc::invalid_query_argument));
    }

    std::vector<std::string> parts;
    CompiledQuery compiled;
    auto& params = compiled.selection.params;

    if (ids_) {
        in_clause(col::ID, *ids_, [](DownloadId id) { return store::Value{id.value()}; }, parts, params);
    }
    if (batch_ids_) {
        in_clause(col::BATCH_ID, *batch_ids_, [](BatchId id) { return store::Value{id}; }, parts, params);
    }
    if (extras_) {
        std::vector<std::string> any;
        for (const auto& extra : *extras_) {
            any.push_back(std::format("{} = ?", col::EXTRAS));
            params.emplace_back(extra);
        }
        parts.push_back(any.empty() ? std::string(MATCH_NOTHING) : join(" OR ", any));
    }
    if (status_flags_) {
        status_clause(*status_flags_, parts, params);
    }
    if (only_visible_) {
        parts.push_back(std::format("{} != 0", col::VISIBLE));
    }

    // Soft-deleted rows never leave the store
    parts.push_back(std::format("{} != 1", col::DELETED));

    compiled.selection.clause = join(" AND ", parts);

    const std::string_view dir = order_direction_ == OrderDirection::ascending ? "ASC" : "DESC";
    compiled.order_by = std::format("{0} {1}, {2} {1}", column_name(order_column_), dir, col::ID);

    logger()->trace("Query: WHERE {} ORDER BY {} ({} params)",
                    compiled.selection.clause, compiled.order_by, params.size());
    return compiled;
}

} // namespace parcel::core
