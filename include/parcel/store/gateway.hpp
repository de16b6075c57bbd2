// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/store/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace parcel::store {

enum class RecordKind : std::uint8_t {
    request,
    download,
    download_with_size,  // read-only view with aggregated sizes
    file,
};

[[nodiscard]] std::string_view table_name(RecordKind kind) noexcept;

// Single cell value (NULL, integer, real, text)
using Value = std::variant<std::monostate, std::int64_t, double, std::string>;

// Column name -> value, in insertion order
using Fields = std::vector<std::pair<std::string, Value>>;

// WHERE clause with '?' placeholders and the values bound to them, in order.
// Values never appear inside the clause text.
struct Selection {
    std::string clause;
    std::vector<Value> params;

    [[nodiscard]] bool empty() const noexcept { return clause.empty(); }
};

class Row {
public:
    Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values)
        : columns_(std::move(columns))
        , values_(std::move(values)) {}

    // nullptr if the row has no such column
    [[nodiscard]] const Value* get(std::string_view column) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
    std::shared_ptr<const std::vector<std::string>> columns_;
    std::vector<Value> values_;
};

// Scoped read handle over a query result. Rows are produced lazily, once;
// the underlying statement is released when the cursor is destroyed.
class RowCursor {
public:
    virtual ~RowCursor() = default;

    // std::nullopt once the result is exhausted
    [[nodiscard]] virtual std::expected<std::optional<Row>, std::error_code> next() = 0;
};

using CursorPtr = std::unique_ptr<RowCursor>;

// Record store contract consumed by the download core
class Gateway {
public:
    virtual ~Gateway() = default;

    // Returns the generated row id
    [[nodiscard]] virtual std::expected<std::int64_t, std::error_code>
    insert(RecordKind kind, const Fields& fields) = 0;

    // All rows or none
    [[nodiscard]] virtual std::error_code
    bulk_insert(RecordKind kind, const std::vector<Fields>& rows) = 0;

    [[nodiscard]] virtual std::expected<CursorPtr, std::error_code>
    query(RecordKind kind, const Selection& selection, std::string_view order_by = {}) = 0;

    // Returns the number of affected rows
    [[nodiscard]] virtual std::expected<std::int64_t, std::error_code>
    update(RecordKind kind, const Fields& fields, const Selection& selection) = 0;

    // Runs body atomically; any error returned by body rolls everything back.
    // Nested calls join the enclosing transaction.
    [[nodiscard]] virtual std::error_code
    transaction(const std::function<std::error_code()>& body) = 0;
};

} // namespace parcel::store
