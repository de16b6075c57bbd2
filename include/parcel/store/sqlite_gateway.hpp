// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/store/gateway.hpp>
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace parcel::store {

namespace detail {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept;
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

class SqliteCursor;

} // namespace detail

// Gateway backed by a single SQLite connection. Every call, and every open
// cursor, holds the connection lock, so readers always observe a row either
// before or after a write.
class SqliteGateway final : public Gateway {
    // Only open() can name this, so only open() can construct
    struct Token {
        explicit Token() = default;
    };

public:
    // ":memory:" opens a private in-memory database
    [[nodiscard]] static std::expected<std::unique_ptr<SqliteGateway>, std::error_code>
    open(const std::string& path) noexcept;

    SqliteGateway(Token, sqlite3* db) noexcept : db_(db) {}

    ~SqliteGateway() override;

    SqliteGateway(const SqliteGateway&) = delete;
    SqliteGateway& operator=(const SqliteGateway&) = delete;
    SqliteGateway(SqliteGateway&&) = delete;
    SqliteGateway& operator=(SqliteGateway&&) = delete;

    [[nodiscard]] std::expected<std::int64_t, std::error_code>
    insert(RecordKind kind, const Fields& fields) override;

    [[nodiscard]] std::error_code
    bulk_insert(RecordKind kind, const std::vector<Fields>& rows) override;

    [[nodiscard]] std::expected<CursorPtr, std::error_code>
    query(RecordKind kind, const Selection& selection, std::string_view order_by = {}) override;

    [[nodiscard]] std::expected<std::int64_t, std::error_code>
    update(RecordKind kind, const Fields& fields, const Selection& selection) override;

    [[nodiscard]] std::error_code
    transaction(const std::function<std::error_code()>& body) override;

    // SQLite message of the most recent failure (the wrapped cause)
    [[nodiscard]] std::string last_error() const;

private:
    friend class detail::SqliteCursor;

    [[nodiscard]] std::error_code migrate();
    [[nodiscard]] std::error_code exec(const std::string& sql);
    [[nodiscard]] std::expected<detail::Statement, std::error_code>
    prepare(const std::string& sql, const std::vector<Value>& params);
    [[nodiscard]] std::expected<int, std::error_code> user_version();
    [[nodiscard]] std::error_code fail(int rc, std::string_view what);

    sqlite3* db_{nullptr};
    mutable std::recursive_mutex mutex_;
    int savepoint_depth_{0};
    std::string last_error_;
};

} // namespace parcel::store
