// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/store/sqlite_gateway.hpp>
#include <parcel/store/schema.hpp>
#include <parcel/core/log.hpp>
#include <parcel/version.hpp>
#include <sqlite3.h>
#include <format>
#include <new>

namespace parcel::store {

namespace {

constexpr const char* SCHEMA_SQL = R"(
CREATE TABLE requests (
    _id               INTEGER PRIMARY KEY AUTOINCREMENT,
    request_timestamp TEXT NOT NULL UNIQUE
);

CREATE TABLE downloads (
    _id           INTEGER PRIMARY KEY,
    batch_id      INTEGER,
    stage         INTEGER NOT NULL,
    extras        TEXT,
    visible       INTEGER NOT NULL DEFAULT 1,
    deleted       INTEGER NOT NULL DEFAULT 0,
    last_modified INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE files (
    _id          INTEGER PRIMARY KEY AUTOINCREMENT,
    download_id  INTEGER NOT NULL REFERENCES downloads(_id),
    identifier   TEXT,
    uri          TEXT NOT NULL,
    local_uri    TEXT NOT NULL,
    current_size INTEGER NOT NULL DEFAULT 0,
    total_size   INTEGER NOT NULL DEFAULT 0,
    status       TEXT NOT NULL,
    UNIQUE (download_id, uri)
);

CREATE INDEX idx_downloads_batch ON downloads(batch_id);
CREATE INDEX idx_files_download ON files(download_id);

CREATE VIEW downloads_with_size AS
    SELECT d._id, d.batch_id, d.stage, d.extras, d.visible, d.deleted, d.last_modified,
           COALESCE(SUM(f.current_size), 0) AS current_size,
           COALESCE(SUM(f.total_size), 0)   AS total_size,
           COUNT(f._id)                     AS file_count
    FROM downloads d LEFT JOIN files f ON f.download_id = d._id
    GROUP BY d._id;

CREATE TABLE meta (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

constexpr const char* STAGE_CODES_KEY = "stage_codes_version";

StoreErrc classify(int rc) noexcept {
    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT: return StoreErrc::constraint_violation;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:     return StoreErrc::busy;
        case SQLITE_CANTOPEN:   return StoreErrc::open_failed;
        default:                return StoreErrc::persistence_error;
    }
}

int bind(sqlite3_stmt* stmt, int index, const Value& value) noexcept {
    if (std::holds_alternative<std::int64_t>(value)) {
        return sqlite3_bind_int64(stmt, index, std::get<std::int64_t>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return sqlite3_bind_double(stmt, index, std::get<double>(value));
    }
    if (std::holds_alternative<std::string>(value)) {
        const auto& text = std::get<std::string>(value);
        return sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
    return sqlite3_bind_null(stmt, index);
}

Value column_value(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, index));
            const int size = sqlite3_column_bytes(stmt, index);
            return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
        }
        default:
            return std::monostate{};
    }
}

} // namespace

std::string_view table_name(RecordKind kind) noexcept {
    switch (kind) {
        case RecordKind::request:            return "requests";
        case RecordKind::download:           return "downloads";
        case RecordKind::download_with_size: return "downloads_with_size";
        case RecordKind::file:               return "files";
    }
    return "downloads";
}

const Value* Row::get(std::string_view column) const noexcept {
    for (std::size_t i = 0; i < columns_->size() && i < values_.size(); ++i) {
        if ((*columns_)[i] == column) {
            return &values_[i];
        }
    }
    return nullptr;
}

namespace detail {

void StatementDeleter::operator()(sqlite3_stmt* stmt) const noexcept {
    sqlite3_finalize(stmt);
}

class SqliteCursor final : public RowCursor {
public:
    SqliteCursor(SqliteGateway& owner, std::unique_lock<std::recursive_mutex> lock, Statement stmt)
        : owner_(owner)
        , lock_(std::move(lock))
        , stmt_(std::move(stmt)) {
        auto names = std::make_shared<std::vector<std::string>>();
        const int count = sqlite3_column_count(stmt_.get());
        names->reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            const char* name = sqlite3_column_name(stmt_.get(), i);
            names->emplace_back(name ? name : "");
        }
        columns_ = std::move(names);
    }

    std::expected<std::optional<Row>, std::error_code> next() override {
        if (done_) {
            return std::nullopt;
        }

        const int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_DONE) {
            done_ = true;
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            done_ = true;
            return std::unexpected(owner_.fail(rc, "step"));
        }

        std::vector<Value> values;
        values.reserve(columns_->size());
        for (int i = 0; i < static_cast<int>(columns_->size()); ++i) {
            values.push_back(column_value(stmt_.get(), i));
        }
        return Row(columns_, std::move(values));
    }

private:
    SqliteGateway& owner_;
    std::unique_lock<std::recursive_mutex> lock_;
    Statement stmt_;
    std::shared_ptr<const std::vector<std::string>> columns_;
    bool done_{false};
};

} // namespace detail

//=============================================================================
// Open / schema
//=============================================================================

std::expected<std::unique_ptr<SqliteGateway>, std::error_code>
SqliteGateway::open(const std::string& path) noexcept {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        core::logger()->error("Cannot open database '{}': {}", path, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        sqlite3_close_v2(db);
        return std::unexpected(make_error_code(StoreErrc::open_failed));
    }

    std::unique_ptr<SqliteGateway> gateway;
    try {
        gateway = std::make_unique<SqliteGateway>(Token{}, db);
    } catch (const std::bad_alloc&) {
        sqlite3_close_v2(db);
        return std::unexpected(make_error_code(StoreErrc::open_failed));
    }

    sqlite3_busy_timeout(db, 5000);

    try {
        if (auto ec = gateway->exec("PRAGMA foreign_keys=ON;")) {
            return std::unexpected(ec);
        }
        if (path != ":memory:") {
            if (auto ec = gateway->exec("PRAGMA journal_mode=WAL;")) {
                return std::unexpected(ec);
            }
        }
        if (auto ec = gateway->migrate()) {
            return std::unexpected(ec);
        }
    } catch (const std::exception& e) {
        core::logger()->error("Opening database '{}' failed: {}", path, e.what());
        return std::unexpected(make_error_code(StoreErrc::open_failed));
    }

    core::logger()->debug("Opened database '{}'", path);
    return gateway;
}

SqliteGateway::~SqliteGateway() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

std::error_code SqliteGateway::migrate() {
    auto version = user_version();
    if (!version) {
        return version.error();
    }

    if (*version == 0) {
        return transaction([this]() -> std::error_code {
            if (auto ec = exec(SCHEMA_SQL)) {
                return ec;
            }
            auto stmt = prepare("INSERT INTO meta(key, value) VALUES (?, ?)",
                                {std::string(STAGE_CODES_KEY), std::to_string(STAGE_CODES_VERSION)});
            if (!stmt) {
                return stmt.error();
            }
            if (int rc = sqlite3_step(stmt->get()); rc != SQLITE_DONE) {
                return fail(rc, "record stage code version");
            }
            return exec(std::format("PRAGMA user_version = {};", SCHEMA_VERSION));
        });
    }

    if (*version != SCHEMA_VERSION) {
        core::logger()->error("Database schema version {} does not match expected {}", *version, SCHEMA_VERSION);
        return make_error_code(StoreErrc::schema_mismatch);
    }

    auto stmt = prepare("SELECT value FROM meta WHERE key = ?", {std::string(STAGE_CODES_KEY)});
    if (!stmt) {
        return stmt.error();
    }
    const int rc = sqlite3_step(stmt->get());
    if (rc != SQLITE_ROW) {
        core::logger()->error("Database has no stage code version");
        return make_error_code(StoreErrc::schema_mismatch);
    }
    auto stored = column_value(stmt->get(), 0);
    if (!std::holds_alternative<std::string>(stored)
        || std::get<std::string>(stored) != std::to_string(STAGE_CODES_VERSION)) {
        core::logger()->error("Database stage codes do not match version {}", STAGE_CODES_VERSION);
        return make_error_code(StoreErrc::schema_mismatch);
    }
    return {};
}

std::expected<int, std::error_code> SqliteGateway::user_version() {
    auto stmt = prepare("PRAGMA user_version;", {});
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    const int rc = sqlite3_step(stmt->get());
    if (rc != SQLITE_ROW) {
        return std::unexpected(fail(rc, "read user_version"));
    }
    return sqlite3_column_int(stmt->get(), 0);
}

//=============================================================================
// Helpers
//=============================================================================

std::error_code SqliteGateway::fail(int rc, std::string_view what) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    last_error_ = std::format("{}: {} ({})", what, sqlite3_errmsg(db_), rc);
    core::logger()->error("SQLite {}", last_error_);
    return make_error_code(classify(rc));
}

std::string SqliteGateway::last_error() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return last_error_;
}

std::error_code SqliteGateway::exec(const std::string& sql) {
    char* message = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message);
    if (message) {
        sqlite3_free(message);
    }
    if (rc != SQLITE_OK) {
        return fail(rc, "exec");
    }
    return {};
}

std::expected<detail::Statement, std::error_code>
SqliteGateway::prepare(const std::string& sql, const std::vector<Value>& params) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
    detail::Statement stmt(raw);
    if (rc != SQLITE_OK) {
        return std::unexpected(fail(rc, "prepare"));
    }

    for (std::size_t i = 0; i < params.size(); ++i) {
        rc = bind(stmt.get(), static_cast<int>(i + 1), params[i]);
        if (rc != SQLITE_OK) {
            return std::unexpected(fail(rc, "bind"));
        }
    }
    return stmt;
}

//=============================================================================
// Gateway operations
//=============================================================================

std::expected<std::int64_t, std::error_code>
SqliteGateway::insert(RecordKind kind, const Fields& fields) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::string names;
    std::string placeholders;
    std::vector<Value> params;
    params.reserve(fields.size());
    for (const auto& [column, value] : fields) {
        if (!names.empty()) {
            names += ", ";
            placeholders += ", ";
        }
        names += column;
        placeholders += '?';
        params.push_back(value);
    }

    const std::string sql = fields.empty()
        ? std::format("INSERT INTO {} DEFAULT VALUES", table_name(kind))
        : std::format("INSERT INTO {} ({}) VALUES ({})", table_name(kind), names, placeholders);

    auto stmt = prepare(sql, params);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (int rc = sqlite3_step(stmt->get()); rc != SQLITE_DONE) {
        return std::unexpected(fail(rc, std::format("insert into {}", table_name(kind))));
    }
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

std::error_code SqliteGateway::bulk_insert(RecordKind kind, const std::vector<Fields>& rows) {
    return transaction([&]() -> std::error_code {
        for (const auto& fields : rows) {
            auto id = insert(kind, fields);
            if (!id) {
                return id.error();
            }
        }
        return {};
    });
}

std::expected<CursorPtr, std::error_code>
SqliteGateway::query(RecordKind kind, const Selection& selection, std::string_view order_by) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    std::string sql = std::format("SELECT * FROM {}", table_name(kind));
    if (!selection.empty()) {
        sql += " WHERE ";
        sql += selection.clause;
    }
    if (!order_by.empty()) {
        sql += " ORDER BY ";
        sql += order_by;
    }

    auto stmt = prepare(sql, selection.params);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    return std::make_unique<detail::SqliteCursor>(*this, std::move(lock), std::move(*stmt));
}

std::expected<std::int64_t, std::error_code>
SqliteGateway::update(RecordKind kind, const Fields& fields, const Selection& selection) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (fields.empty()) {
        return 0;
    }

    std::string assignments;
    std::vector<Value> params;
    params.reserve(fields.size() + selection.params.size());
    for (const auto& [column, value] : fields) {
        if (!assignments.empty()) {
            assignments += ", ";
        }
        assignments += column;
        assignments += " = ?";
        params.push_back(value);
    }

    std::string sql = std::format("UPDATE {} SET {}", table_name(kind), assignments);
    if (!selection.empty()) {
        sql += " WHERE ";
        sql += selection.clause;
        params.insert(params.end(), selection.params.begin(), selection.params.end());
    }

    auto stmt = prepare(sql, params);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (int rc = sqlite3_step(stmt->get()); rc != SQLITE_DONE) {
        return std::unexpected(fail(rc, std::format("update {}", table_name(kind))));
    }
    return static_cast<std::int64_t>(sqlite3_changes(db_));
}

std::error_code SqliteGateway::transaction(const std::function<std::error_code()>& body) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const std::string name = std::format("parcel_sp{}", savepoint_depth_);
    if (auto ec = exec(std::format("SAVEPOINT {};", name))) {
        return ec;
    }
    ++savepoint_depth_;

    auto roll_back = [&] {
        // The body's error is what the caller sees; a rollback fault is only logged
        if (auto ec = exec(std::format("ROLLBACK TO {}; RELEASE {};", name, name))) {
            core::logger()->error("Rollback of {} failed: {}", name, ec.message());
        }
    };

    std::error_code result;
    try {
        result = body();
    } catch (...) {
        --savepoint_depth_;
        roll_back();
        throw;
    }
    --savepoint_depth_;

    if (result) {
        roll_back();
        return result;
    }
    if (auto ec = exec(std::format("RELEASE {};", name))) {
        roll_back();
        return ec;
    }
    return {};
}

} // namespace parcel::store
